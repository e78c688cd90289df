#include "util/logging.hpp"

#include <map>
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ykmon::util::log {

namespace {

constexpr std::size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

spdlog::level::level_enum parse_level(const std::string& name) {
    static const std::map<std::string, spdlog::level::level_enum> kLevels = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},   {"critical", spdlog::level::critical}};
    auto it = kLevels.find(name);
    if (it == kLevels.end()) {
        spdlog::warn("Unknown log level '{}', fallback to 'info'", name);
        return spdlog::level::info;
    }
    return it->second;
}

}  // namespace

void configure(const std::string& level, const std::string& file_path) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!file_path.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_path, kMaxLogFileBytes, kMaxLogFiles));
    }

    auto logger = std::make_shared<spdlog::logger>("ykmon", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    spdlog::set_level(parse_level(level));
}

void debug(const std::string& message) {
    spdlog::debug(message);
}

void info(const std::string& message) {
    spdlog::info(message);
}

void warn(const std::string& message) {
    spdlog::warn(message);
}

void error(const std::string& message) {
    spdlog::error(message);
}

}  // namespace ykmon::util::log
