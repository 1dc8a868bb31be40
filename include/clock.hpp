#pragma once

#include <chrono>
#include <cstdint>

namespace tr {

// Wall-clock milliseconds since the Unix epoch.
inline std::int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace tr
