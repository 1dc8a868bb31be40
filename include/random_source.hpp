#pragma once

#include <cstdint>
#include <random>

namespace tr {

// Source of randomness for room codes and life-event scheduling.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double uniform01() = 0;
    // Uniform integer in [0, upperBound). upperBound must be positive.
    virtual std::uint32_t below(std::uint32_t upperBound) = 0;
};

// libsodium CSPRNG. Used in production.
class SodiumRandomSource : public RandomSource {
public:
    double uniform01() override;
    std::uint32_t below(std::uint32_t upperBound) override;
};

// Reproducible sequence for tests and tools. Not for production use.
class InsecureTestRng : public RandomSource {
public:
    explicit InsecureTestRng(std::uint64_t seed);
    double uniform01() override;
    std::uint32_t below(std::uint32_t upperBound) override;

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_;
};

} // namespace tr
