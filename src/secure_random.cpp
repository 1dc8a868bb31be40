#include "secure_random.hpp"

#include "secure_memory.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

namespace tr {

void ensureSodiumReady() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
}

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<std::uint8_t> buffer(numBytes);
    if (numBytes == 0) {
        return buffer;
    }

    ensureSodiumReady();
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

std::string secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    secureZero(bytes.data(), bytes.size());
    return oss.str();
}

std::uint32_t secureRandomBelow(std::uint32_t upperBound) {
    if (upperBound == 0) {
        throw std::invalid_argument("secureRandomBelow requires a positive bound");
    }
    ensureSodiumReady();
    return randombytes_uniform(upperBound);
}

} // namespace tr
