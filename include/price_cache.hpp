#pragma once

#include "price_source.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>

namespace tr {

// Month snapshots keyed "YYYY-MM". When full, inserting a new month evicts
// the month that was inserted first; overwriting a month keeps its place.
class PriceCache {
public:
    explicit PriceCache(std::size_t maxEntries);

    static std::string keyFor(int year, int month);

    std::optional<PriceSnapshot> get(int year, int month) const;
    void put(int year, int month, PriceSnapshot snapshot);
    void clear();

    std::size_t size() const { return entries_.size(); }
    std::size_t maxEntries() const { return maxEntries_; }

private:
    std::size_t maxEntries_;
    std::deque<std::string> order_;
    std::unordered_map<std::string, PriceSnapshot> entries_;
};

} // namespace tr
