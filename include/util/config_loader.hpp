#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ykmon::server {

struct HttpConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{5000};
    std::string ws_path{"/ws"};
    int worker_threads{4};
};

struct YkmanConfig {
    std::string executable{"ykman"};
    std::chrono::seconds timeout{10};
};

struct MonitorConfig {
    std::chrono::milliseconds poll_interval{2000};
    bool stop_when_idle{false};
};

struct DatabaseConfig {
    std::string path{"yubikey_monitor.db"};
};

struct ApiConfig {
    std::size_t detection_history_limit{100};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file;
};

struct MonitorServerConfig {
    HttpConfig http;
    YkmanConfig ykman;
    MonitorConfig monitor;
    DatabaseConfig database;
    ApiConfig api;
    LoggingConfig logging;
};

MonitorServerConfig load_config(const std::string& path);
MonitorServerConfig parse_config(const std::string& yaml_text);

}  // namespace ykmon::server
