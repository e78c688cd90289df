#pragma once

#include <string>

#include <boost/asio/io_context.hpp>

#include "api_router.hpp"
#include "device_monitor.hpp"
#include "device_store.hpp"
#include "subscriber_hub.hpp"
#include "util/config_loader.hpp"
#include "ws_server.hpp"
#include "ykman_probe.hpp"

namespace ykmon::server {

class MonitorServerApp {
public:
    MonitorServerApp(boost::asio::io_context& io_context, MonitorServerConfig config);
    ~MonitorServerApp();

    void start();
    void stop();

private:
    boost::asio::io_context& io_context_;
    MonitorServerConfig config_;
    YkmanProbe probe_;
    DeviceStore store_;
    DeviceMonitor monitor_;
    WsServer ws_server_;
    SubscriberHub hub_;
    ApiRouter api_router_;
    bool started_{false};
};

// Loads the configuration, serves until SIGINT/SIGTERM and returns the exit code.
// A non-empty log_level overrides the configured one.
int run(const std::string& config_path, const std::string& log_level);

}  // namespace ykmon::server
