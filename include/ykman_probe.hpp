#pragma once

#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "device_attributes.hpp"

namespace ykmon::server {

class ProbeError : public std::runtime_error {
public:
    enum class Reason {
        BinaryNotFound,
        Timeout,
        NonZeroExit,
    };

    ProbeError(Reason reason, const std::string& message) : std::runtime_error(message), reason_(reason) {}

    Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

// Source of device enumeration and per-device info text. All calls block until
// the underlying tool answers or its timeout elapses.
class DeviceProbe {
public:
    virtual ~DeviceProbe() = default;

    virtual std::set<Serial> list_serials() = 0;
    virtual std::string fetch_info(Serial serial) = 0;
    virtual std::string tool_version() = 0;
};

class YkmanProbe : public DeviceProbe {
public:
    YkmanProbe(std::string executable, std::chrono::milliseconds timeout);

    std::set<Serial> list_serials() override;
    std::string fetch_info(Serial serial) override;
    std::string tool_version() override;

private:
    std::string run(const std::vector<std::string>& args) const;

    std::string executable_;
    std::chrono::milliseconds timeout_;
};

struct DeviceReading {
    DeviceAttributes attributes;
    std::string raw_info;
    bool probe_ok{true};
};

// Fetches and parses one device. Throws ProbeError.
DeviceReading inspect_device(DeviceProbe& probe, Serial serial);

// Like inspect_device, but a failed probe yields fallback attributes with the
// error text as raw_info.
DeviceReading read_device_or_fallback(DeviceProbe& probe, Serial serial);

std::set<Serial> parse_serial_list(const std::string& output);

}  // namespace ykmon::server
