// arbscan - Logging setup

#include <arbscan/logging.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace arbscan {

void init_logging(std::string_view level) {
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");

    std::string name(level);
    auto parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off && name != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown log level '{}', using info", name);
        return;
    }
    spdlog::set_level(parsed);
}

}  // namespace arbscan
