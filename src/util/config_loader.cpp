#include "util/config_loader.hpp"

#include <limits>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace ykmon::server {

namespace {

template <typename T>
T scalar_or_default(const YAML::Node& parent, const char* key, const std::string& field, T fallback) {
    auto node = parent[key];
    if (!node) {
        return fallback;
    }
    if (!node.IsScalar()) {
        throw std::runtime_error("Field '" + field + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error("Field '" + field + "' has an invalid value: " + node.Scalar());
    }
}

YAML::Node section(const YAML::Node& root, const char* key) {
    auto node = root[key];
    if (node && !node.IsMap()) {
        throw std::runtime_error(std::string("Section '") + key + "' must be a mapping");
    }
    return node;
}

void load_http(const YAML::Node& node, HttpConfig& http) {
    if (!node) {
        return;
    }
    http.host = scalar_or_default<std::string>(node, "host", "http.host", http.host);
    const auto port = scalar_or_default<int>(node, "port", "http.port", http.port);
    if (port <= 0 || port > std::numeric_limits<std::uint16_t>::max()) {
        throw std::runtime_error("Field 'http.port' must be in 1..65535");
    }
    http.port = static_cast<std::uint16_t>(port);
    http.ws_path = scalar_or_default<std::string>(node, "ws_path", "http.ws_path", http.ws_path);
    if (http.ws_path.empty() || http.ws_path.front() != '/') {
        throw std::runtime_error("Field 'http.ws_path' must start with '/'");
    }
    http.worker_threads = scalar_or_default<int>(node, "worker_threads", "http.worker_threads", http.worker_threads);
    if (http.worker_threads <= 0) {
        throw std::runtime_error("Field 'http.worker_threads' must be positive");
    }
}

void load_ykman(const YAML::Node& node, YkmanConfig& ykman) {
    if (!node) {
        return;
    }
    ykman.executable = scalar_or_default<std::string>(node, "executable", "ykman.executable", ykman.executable);
    if (ykman.executable.empty()) {
        throw std::runtime_error("Field 'ykman.executable' must not be empty");
    }
    const auto timeout = scalar_or_default<long>(node, "timeout_seconds", "ykman.timeout_seconds",
                                                 static_cast<long>(ykman.timeout.count()));
    if (timeout <= 0) {
        throw std::runtime_error("Field 'ykman.timeout_seconds' must be positive");
    }
    ykman.timeout = std::chrono::seconds(timeout);
}

void load_monitor(const YAML::Node& node, MonitorConfig& monitor) {
    if (!node) {
        return;
    }
    const auto interval = scalar_or_default<long>(node, "poll_interval_ms", "monitor.poll_interval_ms",
                                                  static_cast<long>(monitor.poll_interval.count()));
    if (interval <= 0) {
        throw std::runtime_error("Field 'monitor.poll_interval_ms' must be positive");
    }
    monitor.poll_interval = std::chrono::milliseconds(interval);
    monitor.stop_when_idle =
        scalar_or_default<bool>(node, "stop_when_idle", "monitor.stop_when_idle", monitor.stop_when_idle);
}

void load_database(const YAML::Node& node, DatabaseConfig& database) {
    if (!node) {
        return;
    }
    database.path = scalar_or_default<std::string>(node, "path", "database.path", database.path);
    if (database.path.empty()) {
        throw std::runtime_error("Field 'database.path' must not be empty");
    }
}

void load_api(const YAML::Node& node, ApiConfig& api) {
    if (!node) {
        return;
    }
    const auto limit = scalar_or_default<long>(node, "detection_history_limit", "api.detection_history_limit",
                                               static_cast<long>(api.detection_history_limit));
    if (limit <= 0) {
        throw std::runtime_error("Field 'api.detection_history_limit' must be positive");
    }
    api.detection_history_limit = static_cast<std::size_t>(limit);
}

void load_logging(const YAML::Node& node, LoggingConfig& logging) {
    if (!node) {
        return;
    }
    logging.level = scalar_or_default<std::string>(node, "level", "logging.level", logging.level);
    logging.file = scalar_or_default<std::string>(node, "file", "logging.file", logging.file);
}

MonitorServerConfig from_root(const YAML::Node& root) {
    MonitorServerConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Configuration root must be a mapping");
    }
    load_http(section(root, "http"), config.http);
    load_ykman(section(root, "ykman"), config.ykman);
    load_monitor(section(root, "monitor"), config.monitor);
    load_database(section(root, "database"), config.database);
    load_api(section(root, "api"), config.api);
    load_logging(section(root, "logging"), config.logging);
    return config;
}

}  // namespace

MonitorServerConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Failed to load config '" + path + "': " + ex.what());
    }
    return from_root(root);
}

MonitorServerConfig parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error(std::string("Failed to parse config: ") + ex.what());
    }
    return from_root(root);
}

}  // namespace ykmon::server
