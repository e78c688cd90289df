#include "util/config_loader.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>

using ykmon::server::parse_config;

TEST_CASE("an empty document yields defaults", "[config]") {
    const auto config = parse_config("");

    CHECK(config.http.host == "0.0.0.0");
    CHECK(config.http.port == 5000);
    CHECK(config.http.ws_path == "/ws");
    CHECK(config.http.worker_threads == 4);
    CHECK(config.ykman.executable == "ykman");
    CHECK(config.ykman.timeout == std::chrono::seconds(10));
    CHECK(config.monitor.poll_interval == std::chrono::milliseconds(2000));
    CHECK_FALSE(config.monitor.stop_when_idle);
    CHECK(config.api.detection_history_limit == 100);
    CHECK(config.logging.level == "info");
    CHECK(config.logging.file.empty());
}

TEST_CASE("every section can be overridden", "[config]") {
    const auto config = parse_config(R"(
http:
  host: 127.0.0.1
  port: 8080
  ws_path: /live
  worker_threads: 2
ykman:
  executable: /opt/ykman/bin/ykman
  timeout_seconds: 3
monitor:
  poll_interval_ms: 500
  stop_when_idle: true
database:
  path: /var/lib/ykmon/monitor.db
api:
  detection_history_limit: 25
logging:
  level: debug
  file: /var/log/ykmon.log
)");

    CHECK(config.http.host == "127.0.0.1");
    CHECK(config.http.port == 8080);
    CHECK(config.http.ws_path == "/live");
    CHECK(config.http.worker_threads == 2);
    CHECK(config.ykman.executable == "/opt/ykman/bin/ykman");
    CHECK(config.ykman.timeout == std::chrono::seconds(3));
    CHECK(config.monitor.poll_interval == std::chrono::milliseconds(500));
    CHECK(config.monitor.stop_when_idle);
    CHECK(config.database.path == "/var/lib/ykmon/monitor.db");
    CHECK(config.api.detection_history_limit == 25);
    CHECK(config.logging.level == "debug");
    CHECK(config.logging.file == "/var/log/ykmon.log");
}

TEST_CASE("invalid values name the offending field", "[config]") {
    auto message_for = [](const std::string& yaml) {
        try {
            parse_config(yaml);
        } catch (const std::runtime_error& ex) {
            return std::string(ex.what());
        }
        return std::string();
    };

    CHECK(message_for("http:\n  port: 0\n").find("http.port") != std::string::npos);
    CHECK(message_for("http:\n  port: 70000\n").find("http.port") != std::string::npos);
    CHECK(message_for("http:\n  port: abc\n").find("http.port") != std::string::npos);
    CHECK(message_for("http:\n  worker_threads: 0\n").find("http.worker_threads") != std::string::npos);
    CHECK(message_for("ykman:\n  timeout_seconds: -1\n").find("ykman.timeout_seconds") != std::string::npos);
    CHECK(message_for("monitor:\n  poll_interval_ms: 0\n").find("monitor.poll_interval_ms") != std::string::npos);
    CHECK(message_for("http: [1, 2]\n").find("http") != std::string::npos);
}

TEST_CASE("malformed YAML is reported", "[config]") {
    CHECK_THROWS_AS(parse_config("http: {port: 5000"), std::runtime_error);
}

TEST_CASE("a missing file is reported", "[config]") {
    CHECK_THROWS_AS(ykmon::server::load_config("/nonexistent/ykmon.yaml"), std::runtime_error);
}
