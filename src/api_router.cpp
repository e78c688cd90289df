#include "api_router.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <utility>
#include <vector>

#include "util/logging.hpp"

namespace ykmon::server {

namespace {

constexpr unsigned kOk = 200;
constexpr unsigned kNoContent = 204;
constexpr unsigned kNotFound = 404;
constexpr unsigned kMethodNotAllowed = 405;
constexpr unsigned kInternalError = 500;

ApiRouter::Response failure(unsigned status, const std::string& message) {
    return ApiRouter::Response{status, nlohmann::json{{"success", false}, {"error", message}}};
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t begin = 0;
    while (begin <= path.size()) {
        const auto end = std::min(path.find('/', begin), path.size());
        if (end > begin) {
            segments.push_back(path.substr(begin, end - begin));
        }
        begin = end + 1;
    }
    return segments;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    std::size_t begin = 0;
    while (begin < query.size()) {
        const auto end = std::min(query.find('&', begin), query.size());
        const auto pair = query.substr(begin, end - begin);
        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            params.emplace(pair, "");
        } else {
            params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
        }
        begin = end + 1;
    }
    return params;
}

std::optional<Serial> parse_serial_segment(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    Serial value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

bool flag_enabled(const std::map<std::string, std::string>& query, const std::string& name) {
    auto it = query.find(name);
    if (it == query.end()) {
        return false;
    }
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true";
}

}  // namespace

ApiRouter::ApiRouter(DeviceProbe& probe, DeviceStore& store, ApiConfig config)
    : probe_(probe), store_(store), config_(config) {}

ApiRouter::Response ApiRouter::handle(const std::string& method, const std::string& target) {
    const auto query_pos = target.find('?');
    const auto path = target.substr(0, query_pos);
    const auto query = query_pos == std::string::npos ? Query{} : parse_query(target.substr(query_pos + 1));
    const auto segments = split_path(path);

    if (method == "OPTIONS") {
        return Response{kNoContent, nullptr};
    }
    if (segments.size() < 2 || segments[0] != "api") {
        return failure(kNotFound, "Not found");
    }

    const bool is_get = method == "GET";
    const bool is_post = method == "POST";

    if (segments.size() == 2 && segments[1] == "yubikeys") {
        return is_get ? list_connected(query) : failure(kMethodNotAllowed, "Method not allowed");
    }

    if (segments[1] == "yubikey") {
        if (segments.size() == 3 && segments[2] == "test") {
            return is_get ? test_ykman() : failure(kMethodNotAllowed, "Method not allowed");
        }
        if (segments.size() == 4) {
            const auto serial = parse_serial_segment(segments[2]);
            if (!serial) {
                return failure(kNotFound, "Not found");
            }
            if (segments[3] == "info") {
                return is_get ? device_info(*serial, query) : failure(kMethodNotAllowed, "Method not allowed");
            }
            if (segments[3] == "save") {
                return is_post ? save_device(*serial) : failure(kMethodNotAllowed, "Method not allowed");
            }
        }
        return failure(kNotFound, "Not found");
    }

    if (segments[1] == "database" && segments.size() == 3) {
        const auto& action = segments[2];
        if (action == "init") {
            return is_post ? init_database() : failure(kMethodNotAllowed, "Method not allowed");
        }
        if (action == "yubikeys" || action == "detections" || action == "stats" || action == "test") {
            if (!is_get) {
                return failure(kMethodNotAllowed, "Method not allowed");
            }
            if (action == "yubikeys") {
                return stored_devices();
            }
            if (action == "detections") {
                return detections();
            }
            if (action == "stats") {
                return stats();
            }
            return test_database();
        }
    }

    return failure(kNotFound, "Not found");
}

ApiRouter::Response ApiRouter::list_connected(const Query& query) {
    try {
        const bool auto_save = flag_enabled(query, "auto_save");
        const auto serials = probe_.list_serials();

        auto devices = nlohmann::json::array();
        for (const auto serial : serials) {
            const auto reading = read_device_or_fallback(probe_, serial);
            devices.push_back(attributes_to_json(reading.attributes));
            if (!auto_save) {
                continue;
            }
            if (reading.probe_ok) {
                store_.upsert_and_log(reading.attributes, reading.raw_info);
                continue;
            }
            try {
                store_.upsert_and_log(reading.attributes, reading.raw_info);
            } catch (const PersistenceError& ex) {
                util::log::warn("Could not save fallback record for " + std::to_string(serial) + ": " + ex.what());
            }
        }

        const auto count = devices.size();
        return Response{kOk, nlohmann::json{{"success", true}, {"yubikeys", std::move(devices)}, {"count", count}}};
    } catch (const std::exception& ex) {
        util::log::error(std::string("Listing connected YubiKeys failed: ") + ex.what());
        return failure(kInternalError, ex.what());
    }
}

ApiRouter::Response ApiRouter::device_info(Serial serial, const Query& query) {
    try {
        const auto reading = inspect_device(probe_, serial);
        if (flag_enabled(query, "auto_save")) {
            store_.upsert_and_log(reading.attributes, reading.raw_info);
        }
        return Response{kOk, nlohmann::json{{"success", true}, {"info", attributes_to_json(reading.attributes)}}};
    } catch (const std::exception& ex) {
        util::log::warn("Info lookup for " + std::to_string(serial) + " failed: " + ex.what());
        return failure(kNotFound, ex.what());
    }
}

ApiRouter::Response ApiRouter::save_device(Serial serial) {
    try {
        const auto reading = inspect_device(probe_, serial);
        const auto record = store_.upsert_and_log(reading.attributes, reading.raw_info);
        return Response{kOk, nlohmann::json{{"success", true},
                                            {"message", "YubiKey " + std::to_string(serial) + " saved to database"},
                                            {"info", record_to_json(record)}}};
    } catch (const std::exception& ex) {
        util::log::error("Saving " + std::to_string(serial) + " failed: " + ex.what());
        return failure(kInternalError, ex.what());
    }
}

ApiRouter::Response ApiRouter::stored_devices() {
    try {
        auto records = nlohmann::json::array();
        for (const auto& record : store_.list_devices()) {
            records.push_back(record_to_json(record));
        }
        const auto count = records.size();
        return Response{kOk, nlohmann::json{{"success", true}, {"yubikeys", std::move(records)}, {"count", count}}};
    } catch (const std::exception& ex) {
        util::log::error(std::string("Reading stored YubiKeys failed: ") + ex.what());
        return failure(kInternalError, ex.what());
    }
}

ApiRouter::Response ApiRouter::detections() {
    try {
        auto events = nlohmann::json::array();
        for (const auto& event : store_.recent_detections(config_.detection_history_limit)) {
            events.push_back(detection_to_json(event));
        }
        const auto count = events.size();
        return Response{kOk, nlohmann::json{{"success", true}, {"detections", std::move(events)}, {"count", count}}};
    } catch (const std::exception& ex) {
        util::log::error(std::string("Reading detection history failed: ") + ex.what());
        return failure(kInternalError, ex.what());
    }
}

ApiRouter::Response ApiRouter::stats() {
    try {
        const auto totals = store_.stats();
        return Response{kOk, nlohmann::json{{"success", true},
                                            {"stats",
                                             {{"total_yubikeys", totals.total_yubikeys},
                                              {"total_detections", totals.total_detections},
                                              {"recent_detections_24h", totals.recent_detections_24h}}}}};
    } catch (const std::exception& ex) {
        util::log::error(std::string("Reading statistics failed: ") + ex.what());
        return failure(kInternalError, ex.what());
    }
}

ApiRouter::Response ApiRouter::test_ykman() {
    try {
        const auto version = probe_.tool_version();
        return Response{kOk, nlohmann::json{{"success", true}, {"ykman_version", version}, {"message", "ykman is working"}}};
    } catch (const std::exception& ex) {
        return failure(kInternalError, ex.what());
    }
}

ApiRouter::Response ApiRouter::test_database() {
    try {
        const auto version = store_.engine_version();
        return Response{kOk, nlohmann::json{{"success", true},
                                            {"message", "Database connection successful"},
                                            {"sqlite_version", version}}};
    } catch (const std::exception& ex) {
        return failure(kInternalError, ex.what());
    }
}

ApiRouter::Response ApiRouter::init_database() {
    try {
        store_.initialize_schema();
        return Response{kOk, nlohmann::json{{"success", true}, {"message", "Database tables created successfully"}}};
    } catch (const std::exception& ex) {
        util::log::error(std::string("Schema initialization failed: ") + ex.what());
        return failure(kInternalError, ex.what());
    }
}

}  // namespace ykmon::server
