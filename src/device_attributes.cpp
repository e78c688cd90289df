#include "device_attributes.hpp"

#include <stdexcept>
#include <utility>

namespace ykmon::server {

AttributeValue AttributeValue::known(std::string value) {
    return AttributeValue(std::optional<std::string>(std::move(value)));
}

AttributeValue AttributeValue::unknown() {
    return AttributeValue(std::nullopt);
}

const std::string& AttributeValue::value() const {
    if (!value_) {
        throw std::logic_error("AttributeValue is unknown");
    }
    return *value_;
}

DeviceAttributes fallback_attributes(Serial serial) {
    DeviceAttributes attributes;
    attributes.serial = serial;
    return attributes;
}

nlohmann::json attribute_to_json(const AttributeValue& value) {
    if (!value.is_known()) {
        return nullptr;
    }
    return value.value();
}

nlohmann::json attributes_to_json(const DeviceAttributes& attributes) {
    return nlohmann::json{
        {"serial", attributes.serial},
        {"version", attribute_to_json(attributes.firmware_version)},
        {"form_factor", attribute_to_json(attributes.form_factor)},
        {"device_type", attributes.device_type},
        {"is_fips", attributes.is_fips},
        {"is_sky", attributes.is_sky},
    };
}

}  // namespace ykmon::server
