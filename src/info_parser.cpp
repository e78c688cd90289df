#include "info_parser.hpp"

#include <cctype>
#include <optional>
#include <string>

namespace ykmon::server {

namespace {

constexpr std::string_view kFirmwareLabel = "Firmware version:";
constexpr std::string_view kFormFactorLabel = "Form factor:";
constexpr std::string_view kDeviceTypeLabel = "Device type:";
constexpr std::string_view kFipsMarker = "FIPS";
constexpr std::string_view kSkyMarker = "SKY";

std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<std::string> labeled_value(std::string_view line, std::string_view label) {
    if (line.substr(0, label.size()) != label) {
        return std::nullopt;
    }
    const auto value = trim(line.substr(label.size()));
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

DeviceAttributes parse_device_info(Serial serial, std::string_view raw_text) {
    DeviceAttributes attributes = fallback_attributes(serial);
    bool has_device_type = false;

    std::size_t start = 0;
    while (start <= raw_text.size()) {
        auto end = raw_text.find('\n', start);
        if (end == std::string_view::npos) {
            end = raw_text.size();
        }
        const auto line = trim(raw_text.substr(start, end - start));
        start = end + 1;

        if (!attributes.firmware_version.is_known()) {
            if (auto value = labeled_value(line, kFirmwareLabel)) {
                attributes.firmware_version = AttributeValue::known(std::move(*value));
                continue;
            }
        }
        if (!attributes.form_factor.is_known()) {
            if (auto value = labeled_value(line, kFormFactorLabel)) {
                attributes.form_factor = AttributeValue::known(std::move(*value));
                continue;
            }
        }
        if (!has_device_type) {
            if (auto value = labeled_value(line, kDeviceTypeLabel)) {
                attributes.device_type = std::move(*value);
                has_device_type = true;
            }
        }
    }

    attributes.is_fips = raw_text.find(kFipsMarker) != std::string_view::npos;
    attributes.is_sky = raw_text.find(kSkyMarker) != std::string_view::npos;
    return attributes;
}

}  // namespace ykmon::server
