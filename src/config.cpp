#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace tr {

namespace {

bool readEnv(const char* name, std::string& out) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return false;
    }
    out = trim(env);
    return !out.empty();
}

std::int64_t parseInteger(const char* name, const std::string& text, std::int64_t minValue,
                          std::int64_t maxValue) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be an integer, got \"" + text + "\"");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(std::string(name) + " must be an integer, got \"" + text + "\"");
    }
    if (value < minValue || value > maxValue) {
        throw std::invalid_argument(std::string(name) + " is out of range: " + text);
    }
    return value;
}

double parsePositiveDouble(const char* name, const std::string& text) {
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be a number, got \"" + text + "\"");
    }
    if (consumed != text.size() || !(value > 0.0)) {
        throw std::invalid_argument(std::string(name) + " must be a positive number, got \"" + text + "\"");
    }
    return value;
}

void overrideInt(const char* name, std::int64_t& field, std::int64_t minValue, std::int64_t maxValue) {
    std::string text;
    if (readEnv(name, text)) {
        field = parseInteger(name, text, minValue, maxValue);
    }
}

void overrideString(const char* name, std::string& field) {
    std::string text;
    if (readEnv(name, text)) {
        field = text;
    }
}

} // namespace

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

int clampEventsCount(int requested) {
    return std::clamp(requested, kMinEventsCount, kMaxEventsCount);
}

CoordinatorConfig loadConfigFromEnv() {
    CoordinatorConfig cfg;

    overrideString("TR_BIND_ADDRESS", cfg.bindAddress);

    std::int64_t port = cfg.port;
    overrideInt("TR_PORT", port, 1, 65535);
    cfg.port = static_cast<std::uint16_t>(port);

    overrideInt("TR_MONTH_DURATION_MS", cfg.monthDurationMs, 1, kMaxDurationMs);

    std::int64_t years = cfg.totalYears;
    overrideInt("TR_TOTAL_YEARS", years, 1, 100);
    cfg.totalYears = static_cast<int>(years);

    std::string cash;
    if (readEnv("TR_STARTING_CASH", cash)) {
        cfg.startingCash = parsePositiveDouble("TR_STARTING_CASH", cash);
    }

    std::int64_t events = cfg.defaultEventsCount;
    overrideInt("TR_EVENTS_COUNT", events, 0, 1000);
    cfg.defaultEventsCount = clampEventsCount(static_cast<int>(events));

    overrideInt("TR_LEADERBOARD_WINDOW_MS", cfg.leaderboardWindowMs, 0, kMaxDurationMs);
    overrideInt("TR_ROOM_MAX_AGE_MS", cfg.roomMaxAgeMs, 1, 30 * kMaxDurationMs);
    overrideInt("TR_ROOM_SWEEP_INTERVAL_MS", cfg.roomSweepIntervalMs, 1000, kMaxDurationMs);
    overrideInt("TR_PAYLOAD_MAX_AGE_MS", cfg.payloadMaxAgeMs, 1, kMaxDurationMs);

    std::int64_t cacheSize = static_cast<std::int64_t>(cfg.priceCacheSize);
    overrideInt("TR_PRICE_CACHE_SIZE", cacheSize, 1, 100000);
    cfg.priceCacheSize = static_cast<std::size_t>(cacheSize);

    overrideString("TR_PRICE_FILE", cfg.priceFile);
    overrideString("TR_SESSION_LOG", cfg.sessionLogFile);
    overrideString("TR_CIPHER", cfg.cipher);
    overrideString("TR_LOG_LEVEL", cfg.logLevel);

    return cfg;
}

} // namespace tr
