#pragma once

#include <string>

namespace ykmon::util::log {

// Level names: trace, debug, info, warn, error, critical. Empty file path keeps console only.
void configure(const std::string& level, const std::string& file_path = {});

void debug(const std::string& message);
void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

}  // namespace ykmon::util::log
