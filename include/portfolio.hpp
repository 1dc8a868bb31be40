#pragma once

#include <cstdint>

#include <nlohmann/json.hpp>

namespace tr {

// Player-reported portfolio buckets. Display cache only.
struct PortfolioBreakdown {
    double cash = 0.0;
    double savings = 0.0;
    double gold = 0.0;
    double funds = 0.0;
    double stocks = 0.0;
    double crypto = 0.0;
    double commodities = 0.0;
    double reits = 0.0;
};

// Reads a whole number within [minValue, maxValue] from client JSON. Throws
// std::invalid_argument naming the field for non-numeric, fractional or
// out-of-range values.
std::int64_t readBoundedInteger(const nlohmann::json& value,
                                const char* field,
                                std::int64_t minValue,
                                std::int64_t maxValue);

void to_json(nlohmann::json& j, const PortfolioBreakdown& breakdown);
// Missing or non-numeric buckets read as zero.
void from_json(const nlohmann::json& j, PortfolioBreakdown& breakdown);

} // namespace tr
