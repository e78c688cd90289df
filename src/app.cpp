#include "app.hpp"

#include <algorithm>
#include <csignal>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/signal_set.hpp>

#include "util/logging.hpp"

namespace ykmon::server {

MonitorServerApp::MonitorServerApp(boost::asio::io_context& io_context, MonitorServerConfig config)
    : io_context_(io_context),
      config_(std::move(config)),
      probe_(config_.ykman.executable, config_.ykman.timeout),
      store_(config_.database.path),
      monitor_(probe_, store_, config_.monitor.poll_interval),
      ws_server_(io_context_),
      hub_([this](SubscriberHub::SessionId session_id,
                  const std::string& text) { return ws_server_.send(session_id, text); },
           config_.monitor.stop_when_idle),
      api_router_(probe_, store_, config_.api) {}

MonitorServerApp::~MonitorServerApp() {
    stop();
    // The loop may call into hub_, which is destroyed before monitor_.
    monitor_.stop();
}

void MonitorServerApp::start() {
    hub_.set_loop_control([this]() { return monitor_.start(); }, [this]() { monitor_.request_stop(); });
    monitor_.set_update_callback(
        [this](const std::vector<DeviceAttributes>& devices) { hub_.publish_devices(devices); });

    ws_server_.set_open_handler([this](WsServer::SessionId session_id) { hub_.on_connect(session_id); });
    ws_server_.set_close_handler([this](WsServer::SessionId session_id) { hub_.on_disconnect(session_id); });
    ws_server_.set_http_handler([this](const WsServer::HttpRequest& request) {
        const auto response = api_router_.handle(request.method, request.target);
        return WsServer::HttpReply{
            response.status,
            response.body.is_null() ? std::string{}
                                    : response.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
    });

    ws_server_.start(config_.http.host, config_.http.port, config_.http.ws_path);
    started_ = true;
    util::log::info("YubiKey monitor server started; polling begins with the first subscriber");
}

void MonitorServerApp::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    hub_.clear_loop_control();
    monitor_.stop();
    ws_server_.stop();
    util::log::info("YubiKey monitor server stopped");
}

int run(const std::string& config_path, const std::string& log_level) {
    try {
        auto config = config_path.empty() ? MonitorServerConfig{} : load_config(config_path);
        if (!log_level.empty()) {
            config.logging.level = log_level;
        }
        util::log::configure(config.logging.level, config.logging.file);
        if (!config_path.empty()) {
            util::log::info("Loaded configuration from " + config_path);
        }

        boost::asio::io_context io_context;
        MonitorServerApp app(io_context, config);
        app.start();

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            util::log::info("Signal " + std::to_string(signal_number) + " received, shutting down...");
            app.stop();
            io_context.stop();
        });

        const auto extra_workers = static_cast<std::size_t>(std::max(config.http.worker_threads, 1) - 1);
        std::vector<std::thread> workers;
        workers.reserve(extra_workers);
        for (std::size_t i = 0; i < extra_workers; ++i) {
            workers.emplace_back([&io_context]() { io_context.run(); });
        }
        io_context.run();
        for (auto& worker : workers) {
            worker.join();
        }
    } catch (const std::exception& ex) {
        util::log::error(std::string("Fatal error: ") + ex.what());
        return 1;
    }
    return 0;
}

}  // namespace ykmon::server
