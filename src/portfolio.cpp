#include "portfolio.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace tr {

namespace {

double numberOrZero(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

} // namespace

std::int64_t readBoundedInteger(const nlohmann::json& value,
                                const char* field,
                                std::int64_t minValue,
                                std::int64_t maxValue) {
    const auto outOfRange = [&]() {
        return std::invalid_argument(std::string(field) + " must be a whole number in [" + std::to_string(minValue) +
                                     ", " + std::to_string(maxValue) + "]");
    };
    if (value.is_number_unsigned()) {
        const std::uint64_t raw = value.get<std::uint64_t>();
        if (maxValue < 0 || raw > static_cast<std::uint64_t>(maxValue)) {
            throw outOfRange();
        }
        const auto result = static_cast<std::int64_t>(raw);
        if (result < minValue) {
            throw outOfRange();
        }
        return result;
    }
    if (value.is_number_integer()) {
        const std::int64_t raw = value.get<std::int64_t>();
        if (raw < minValue || raw > maxValue) {
            throw outOfRange();
        }
        return raw;
    }
    if (value.is_number_float()) {
        const double raw = value.get<double>();
        if (!std::isfinite(raw) || raw != std::floor(raw) || raw < static_cast<double>(minValue) ||
            raw > static_cast<double>(maxValue)) {
            throw outOfRange();
        }
        return static_cast<std::int64_t>(raw);
    }
    throw std::invalid_argument(std::string(field) + " must be a number");
}

void to_json(nlohmann::json& j, const PortfolioBreakdown& breakdown) {
    j = nlohmann::json{ { "cash", breakdown.cash },
                        { "savings", breakdown.savings },
                        { "gold", breakdown.gold },
                        { "funds", breakdown.funds },
                        { "stocks", breakdown.stocks },
                        { "crypto", breakdown.crypto },
                        { "commodities", breakdown.commodities },
                        { "reits", breakdown.reits } };
}

void from_json(const nlohmann::json& j, PortfolioBreakdown& breakdown) {
    breakdown = PortfolioBreakdown{};
    if (!j.is_object()) {
        return;
    }
    breakdown.cash = numberOrZero(j, "cash");
    breakdown.savings = numberOrZero(j, "savings");
    breakdown.gold = numberOrZero(j, "gold");
    breakdown.funds = numberOrZero(j, "funds");
    breakdown.stocks = numberOrZero(j, "stocks");
    breakdown.crypto = numberOrZero(j, "crypto");
    breakdown.commodities = numberOrZero(j, "commodities");
    breakdown.reits = numberOrZero(j, "reits");
}

} // namespace tr
