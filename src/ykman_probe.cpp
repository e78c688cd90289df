#include "ykman_probe.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <utility>

#include "info_parser.hpp"
#include "util/command_runner.hpp"
#include "util/logging.hpp"

namespace ykmon::server {

namespace {

std::string trim_copy(const std::string& value) {
    auto first = value.begin();
    while (first != value.end() && std::isspace(static_cast<unsigned char>(*first))) {
        ++first;
    }
    if (first == value.end()) {
        return {};
    }
    auto last = value.end();
    do {
        --last;
    } while (last != first && std::isspace(static_cast<unsigned char>(*last)));
    return std::string(first, last + 1);
}

}  // namespace

YkmanProbe::YkmanProbe(std::string executable, std::chrono::milliseconds timeout)
    : executable_(std::move(executable)), timeout_(timeout) {}

std::set<Serial> YkmanProbe::list_serials() {
    return parse_serial_list(run({"list", "--serials"}));
}

std::string YkmanProbe::fetch_info(Serial serial) {
    return run({"--device", std::to_string(serial), "info"});
}

std::string YkmanProbe::tool_version() {
    return run({"--version"});
}

std::string YkmanProbe::run(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(executable_);
    argv.insert(argv.end(), args.begin(), args.end());

    const auto result = util::run_command(argv, timeout_);
    switch (result.status) {
    case util::CommandResult::Status::NotFound:
        throw ProbeError(ProbeError::Reason::BinaryNotFound,
                         executable_ + " command not found. Please install yubikey-manager.");
    case util::CommandResult::Status::TimedOut:
        throw ProbeError(ProbeError::Reason::Timeout, executable_ + " command timed out");
    case util::CommandResult::Status::Exited:
        break;
    }

    if (result.exit_code != 0) {
        auto detail = trim_copy(result.stderr_text);
        if (detail.empty()) {
            detail = "exit code " + std::to_string(result.exit_code);
        }
        throw ProbeError(ProbeError::Reason::NonZeroExit, executable_ + " error: " + detail);
    }
    return trim_copy(result.stdout_text);
}

std::set<Serial> parse_serial_list(const std::string& output) {
    std::set<Serial> serials;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        const auto token = trim_copy(line);
        if (token.empty()) {
            continue;
        }
        Serial serial = 0;
        const auto* begin = token.data();
        const auto* end = token.data() + token.size();
        const auto [ptr, ec] = std::from_chars(begin, end, serial);
        if (ec != std::errc() || ptr != end) {
            util::log::warn("Ignoring malformed serial line: '" + token + "'");
            continue;
        }
        serials.insert(serial);
    }
    return serials;
}

DeviceReading inspect_device(DeviceProbe& probe, Serial serial) {
    DeviceReading reading;
    reading.raw_info = probe.fetch_info(serial);
    reading.attributes = parse_device_info(serial, reading.raw_info);
    return reading;
}

DeviceReading read_device_or_fallback(DeviceProbe& probe, Serial serial) {
    try {
        return inspect_device(probe, serial);
    } catch (const std::exception& ex) {
        util::log::warn("Could not get info for " + std::to_string(serial) + ": " + ex.what());
        DeviceReading reading;
        reading.attributes = fallback_attributes(serial);
        reading.raw_info = ex.what();
        reading.probe_ok = false;
        return reading;
    }
}

}  // namespace ykmon::server
