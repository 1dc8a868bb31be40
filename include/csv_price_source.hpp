#pragma once

#include "price_cache.hpp"
#include "price_source.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tr {

constexpr int kLookbackDays = 60;
constexpr int kLookaheadDays = 30;

// Reads "symbol,YYYY-MM-DD,close" rows on first use. A month's price is the
// latest close on or before the 1st within kLookbackDays, else the earliest
// close after it within kLookaheadDays.
class CsvPriceSource : public PriceSource {
public:
    CsvPriceSource(std::string path, std::size_t cacheSize);

    PriceSnapshot getPricesForDate(const std::vector<std::string>& symbols, int year, int month) override;
    void preloadPricesForGame(const std::vector<std::string>& symbols, int startYear, int totalYears) override;

    const PriceCache& cache() const { return cache_; }

private:
    using Series = std::vector<std::pair<long, double>>; // (day number, close), ascending

    void ensureLoaded();
    bool lookup(const std::string& symbol, long targetDay, double& out) const;

    std::string path_;
    bool loaded_ = false;
    std::map<std::string, Series> series_;
    PriceCache cache_;
};

// Days since 1970-01-01 in the proleptic Gregorian calendar.
long daysFromCivil(int year, int month, int day);

} // namespace tr
