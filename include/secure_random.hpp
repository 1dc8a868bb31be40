#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tr {

// Throws std::runtime_error if libsodium cannot be initialized.
void ensureSodiumReady();

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);
std::string secureRandomHex(std::size_t numBytes);
std::uint32_t secureRandomBelow(std::uint32_t upperBound);

} // namespace tr
