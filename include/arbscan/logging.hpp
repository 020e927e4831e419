// arbscan - Logging setup

#pragma once

#include <string_view>

namespace arbscan {

// Configure the default spdlog logger: level name as in [general] log_level
// ("trace", "debug", "info", "warn", "error", "critical", "off").
// Unknown names fall back to "info" with a warning.
void init_logging(std::string_view level);

}  // namespace arbscan
