#include "logging.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace tr {

void initLogging(const std::string& level) {
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off.
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("unknown log level: " + level);
    }
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(parsed);
}

} // namespace tr
