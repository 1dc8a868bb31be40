#include "price_cache.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tr {

PriceCache::PriceCache(std::size_t maxEntries) : maxEntries_(maxEntries) {
    if (maxEntries_ == 0) {
        throw std::invalid_argument("price cache needs room for at least one month");
    }
}

std::string PriceCache::keyFor(int year, int month) {
    std::ostringstream oss;
    oss << year << '-' << std::setw(2) << std::setfill('0') << month;
    return oss.str();
}

std::optional<PriceSnapshot> PriceCache::get(int year, int month) const {
    auto it = entries_.find(keyFor(year, month));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PriceCache::put(int year, int month, PriceSnapshot snapshot) {
    std::string key = keyFor(year, month);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second = std::move(snapshot);
        return;
    }
    if (entries_.size() >= maxEntries_) {
        entries_.erase(order_.front());
        order_.pop_front();
    }
    order_.push_back(key);
    entries_.emplace(std::move(key), std::move(snapshot));
}

void PriceCache::clear() {
    order_.clear();
    entries_.clear();
}

} // namespace tr
