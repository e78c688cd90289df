#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ykmon::server {

using Serial = std::uint64_t;

// Either a value reported by the device or the "not reported" marker. A device
// that literally reports "Unknown" stays distinguishable from a missing field.
class AttributeValue {
public:
    AttributeValue() = default;

    static AttributeValue known(std::string value);
    static AttributeValue unknown();

    bool is_known() const { return value_.has_value(); }
    const std::string& value() const;

    bool operator==(const AttributeValue& other) const { return value_ == other.value_; }
    bool operator!=(const AttributeValue& other) const { return !(*this == other); }

private:
    explicit AttributeValue(std::optional<std::string> value) : value_(std::move(value)) {}

    std::optional<std::string> value_;
};

struct DeviceAttributes {
    static constexpr const char* kDefaultDeviceType = "YubiKey";

    Serial serial{0};
    AttributeValue firmware_version;
    AttributeValue form_factor;
    std::string device_type{kDefaultDeviceType};
    bool is_fips{false};
    bool is_sky{false};

    bool operator==(const DeviceAttributes& other) const {
        return serial == other.serial && firmware_version == other.firmware_version &&
               form_factor == other.form_factor && device_type == other.device_type && is_fips == other.is_fips &&
               is_sky == other.is_sky;
    }

    bool operator!=(const DeviceAttributes& other) const {
        return !(*this == other);
    }
};

DeviceAttributes fallback_attributes(Serial serial);

nlohmann::json attribute_to_json(const AttributeValue& value);
nlohmann::json attributes_to_json(const DeviceAttributes& attributes);

}  // namespace ykmon::server
