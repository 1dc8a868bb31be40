#include "random_source.hpp"

#include "secure_random.hpp"

#include <stdexcept>

#include <sodium.h>

namespace tr {

double SodiumRandomSource::uniform01() {
    ensureSodiumReady();
    std::uint64_t val = 0;
    randombytes_buf(&val, sizeof(val));

    const std::uint64_t mask = (1ULL << 53) - 1;
    val &= mask;
    return static_cast<double>(val) / static_cast<double>(1ULL << 53);
}

std::uint32_t SodiumRandomSource::below(std::uint32_t upperBound) {
    return secureRandomBelow(upperBound);
}

InsecureTestRng::InsecureTestRng(std::uint64_t seed)
    : engine_(seed)
    , dist_(0.0, 1.0) {}

double InsecureTestRng::uniform01() {
    return dist_(engine_);
}

std::uint32_t InsecureTestRng::below(std::uint32_t upperBound) {
    if (upperBound == 0) {
        throw std::invalid_argument("below requires a positive bound");
    }
    std::uniform_int_distribution<std::uint32_t> pick(0, upperBound - 1);
    return pick(engine_);
}

} // namespace tr
