#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tr {

struct CoordinatorConfig {
    std::string bindAddress = "0.0.0.0";
    std::uint16_t port = 3001;
    std::int64_t monthDurationMs = 5000;
    int totalYears = 20;
    double startingCash = 100000.0;
    int defaultEventsCount = 3;
    std::int64_t leaderboardWindowMs = 2000;
    std::int64_t roomMaxAgeMs = 24LL * 60 * 60 * 1000;
    std::int64_t roomSweepIntervalMs = 60LL * 60 * 1000;
    std::int64_t payloadMaxAgeMs = 30000;
    std::size_t priceCacheSize = 300;
    std::string priceFile = "data/prices.csv";
    std::string sessionLogFile = "data/sessions.jsonl";
    std::string cipher = "auto";
    std::string logLevel = "info";
};

constexpr int kMinEventsCount = 1;
constexpr int kMaxEventsCount = 20;

// Upper bound for every configured or client-supplied duration.
constexpr std::int64_t kMaxDurationMs = 7LL * 24 * 60 * 60 * 1000;
constexpr int kMaxCalendarYear = 9999;

// Defaults overridden by TR_* environment variables. Throws
// std::invalid_argument naming the variable when a value does not parse or is
// out of range.
CoordinatorConfig loadConfigFromEnv();

int clampEventsCount(int requested);

std::string trim(const std::string& value);

} // namespace tr
