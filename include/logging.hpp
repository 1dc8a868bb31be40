#pragma once

#include <string>

namespace tr {

// Configures the spdlog default logger. Accepts trace, debug, info, warn,
// error or off; throws std::invalid_argument otherwise.
void initLogging(const std::string& level);

} // namespace tr
