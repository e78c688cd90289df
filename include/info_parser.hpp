#pragma once

#include <string_view>

#include "device_attributes.hpp"

namespace ykmon::server {

// Turns `ykman --device <serial> info` output into attributes. Never throws:
// labels that are absent leave the corresponding field unknown, and the FIPS/SKY
// flags are plain case-sensitive substring checks over the whole text.
DeviceAttributes parse_device_info(Serial serial, std::string_view raw_text);

}  // namespace ykmon::server
