#pragma once

#include <cmath>
#include <cstdint>
#include <limits>

namespace tr {

// Fixed-point currency amount in microunits. Sums are exact and therefore
// independent of the order in which categories are accumulated.
class Money {
public:
    static constexpr std::int64_t kScale = 1'000'000;

    Money() : raw_(0) {}
    static Money fromRaw(std::int64_t raw) { return Money(raw); }
    static Money fromDouble(double value) {
        if (!std::isfinite(value)) {
            return Money(0);
        }
        double scaled = std::round(value * static_cast<double>(kScale));
        if (scaled >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return Money(std::numeric_limits<std::int64_t>::max());
        }
        if (scaled <= static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
            return Money(std::numeric_limits<std::int64_t>::min());
        }
        return Money(static_cast<std::int64_t>(scaled));
    }

    double toDouble() const { return static_cast<double>(raw_) / static_cast<double>(kScale); }
    std::int64_t raw() const { return raw_; }

    Money operator+(Money other) const {
        __int128 wide = static_cast<__int128>(raw_) + static_cast<__int128>(other.raw_);
        return Money(clampToInt64(wide));
    }
    Money operator-(Money other) const {
        __int128 wide = static_cast<__int128>(raw_) - static_cast<__int128>(other.raw_);
        return Money(clampToInt64(wide));
    }
    Money& operator+=(Money other) {
        *this = *this + other;
        return *this;
    }

    bool operator<(Money other) const { return raw_ < other.raw_; }
    bool operator>(Money other) const { return raw_ > other.raw_; }
    bool operator==(Money other) const { return raw_ == other.raw_; }
    bool operator!=(Money other) const { return raw_ != other.raw_; }

private:
    explicit Money(std::int64_t raw) : raw_(raw) {}
    static std::int64_t clampToInt64(__int128 value) {
        if (value > static_cast<__int128>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        if (value < static_cast<__int128>(std::numeric_limits<std::int64_t>::min())) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(value);
    }

    std::int64_t raw_;
};

} // namespace tr
