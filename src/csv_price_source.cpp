#include "csv_price_source.hpp"

#include "config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>

#include <spdlog/spdlog.h>

namespace tr {

namespace {

bool parseDate(const std::string& text, long& dayOut) {
    int y = 0;
    int m = 0;
    int d = 0;
    char tail = '\0';
    if (std::sscanf(text.c_str(), "%d-%d-%d%c", &y, &m, &d, &tail) != 3) {
        return false;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return false;
    }
    dayOut = daysFromCivil(y, m, d);
    return true;
}

bool parseRow(const std::string& line, std::string& symbol, long& day, double& close) {
    std::vector<std::string> parts;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, ',')) {
        parts.push_back(trim(item));
    }
    if (parts.size() != 3 || parts[0].empty()) {
        return false;
    }
    if (!parseDate(parts[1], day)) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        close = std::stod(parts[2], &consumed);
        if (consumed != parts[2].size() || !std::isfinite(close) || close < 0.0) {
            return false;
        }
    } catch (const std::logic_error&) {
        return false;
    }
    symbol = parts[0];
    return true;
}

} // namespace

long daysFromCivil(int year, int month, int day) {
    const long y = static_cast<long>(year) - (month <= 2 ? 1 : 0);
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;
    const long mp = (month + 9) % 12;
    const long doy = (153 * mp + 2) / 5 + day - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CsvPriceSource::CsvPriceSource(std::string path, std::size_t cacheSize)
    : path_(std::move(path))
    , cache_(cacheSize) {}

void CsvPriceSource::ensureLoaded() {
    if (loaded_) {
        return;
    }
    std::ifstream in(path_);
    if (!in) {
        throw DependencyError("price file is not readable: " + path_);
    }

    std::size_t rows = 0;
    std::size_t skipped = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed.rfind("symbol,", 0) == 0) {
            continue;
        }
        std::string symbol;
        long day = 0;
        double close = 0.0;
        if (!parseRow(trimmed, symbol, day, close)) {
            ++skipped;
            continue;
        }
        series_[symbol].emplace_back(day, close);
        ++rows;
    }
    for (auto& entry : series_) {
        std::sort(entry.second.begin(), entry.second.end());
    }
    if (skipped != 0) {
        spdlog::warn("Price file {}: skipped {} malformed row(s)", path_, skipped);
    }
    spdlog::info("Loaded {} price rows for {} symbols from {}", rows, series_.size(), path_);
    loaded_ = true;
}

bool CsvPriceSource::lookup(const std::string& symbol, long targetDay, double& out) const {
    auto it = series_.find(symbol);
    if (it == series_.end() || it->second.empty()) {
        return false;
    }
    const Series& s = it->second;

    // First row strictly after the target day.
    auto after = std::upper_bound(s.begin(), s.end(), targetDay, [](long day, const std::pair<long, double>& row) {
        return day < row.first;
    });
    if (after != s.begin()) {
        auto onOrBefore = std::prev(after);
        if (targetDay - onOrBefore->first <= kLookbackDays) {
            out = onOrBefore->second;
            return true;
        }
    }
    if (after != s.end() && after->first - targetDay <= kLookaheadDays) {
        out = after->second;
        return true;
    }
    return false;
}

PriceSnapshot CsvPriceSource::getPricesForDate(const std::vector<std::string>& symbols, int year, int month) {
    ensureLoaded();

    auto cached = cache_.get(year, month);
    PriceSnapshot snapshot = cached ? *cached : PriceSnapshot{};
    const bool complete = cached && std::all_of(symbols.begin(), symbols.end(), [&](const std::string& s) {
        return snapshot.count(s) != 0;
    });

    if (!complete) {
        const long target = daysFromCivil(year, month, 1);
        for (const auto& symbol : symbols) {
            double close = 0.0;
            if (lookup(symbol, target, close)) {
                snapshot[symbol] = close;
            }
        }
        cache_.put(year, month, snapshot);
    }

    PriceSnapshot filtered;
    for (const auto& symbol : symbols) {
        auto it = snapshot.find(symbol);
        if (it != snapshot.end()) {
            filtered.emplace(symbol, it->second);
        }
    }
    return filtered;
}

void CsvPriceSource::preloadPricesForGame(const std::vector<std::string>& symbols, int startYear, int totalYears) {
    ensureLoaded();
    std::size_t months = 0;
    for (int year = startYear; year <= startYear + totalYears; ++year) {
        for (int month = 1; month <= 12; ++month) {
            getPricesForDate(symbols, year, month);
            ++months;
        }
    }
    spdlog::debug("Preloaded {} monthly snapshots for {} symbols from {}", months, symbols.size(), startYear);
}

} // namespace tr
