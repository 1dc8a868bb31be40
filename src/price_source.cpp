#include "price_source.hpp"

#include "errors.hpp"

#include <algorithm>
#include <utility>

namespace tr {

namespace {

void addUnique(std::vector<std::string>& out, const std::string& symbol) {
    if (!symbol.empty() && std::find(out.begin(), out.end(), symbol) == out.end()) {
        out.push_back(symbol);
    }
}

std::string stringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

std::vector<std::string> gameSymbols(const nlohmann::json& selectedAssets) {
    std::vector<std::string> symbols;
    addUnique(symbols, "Physical_Gold");
    addUnique(symbols, "Digital_Gold");
    addUnique(symbols, stringField(selectedAssets, "fundName"));

    auto stocks = selectedAssets.find("stocks");
    if (stocks != selectedAssets.end() && stocks->is_array()) {
        for (const auto& s : *stocks) {
            if (s.is_string()) {
                addUnique(symbols, s.get<std::string>());
            }
        }
    }

    addUnique(symbols, "BTC");
    addUnique(symbols, "ETH");
    addUnique(symbols, stringField(selectedAssets, "commodity"));
    addUnique(symbols, "EMBASSY");
    addUnique(symbols, "MINDSPACE");
    return symbols;
}

void InMemoryPriceSource::setSnapshot(int year, int month, PriceSnapshot snapshot) {
    table_[{ year, month }] = std::move(snapshot);
}

PriceSnapshot InMemoryPriceSource::getPricesForDate(const std::vector<std::string>& symbols, int year, int month) {
    ++queries_;
    if (!available_) {
        throw DependencyError("price repository unavailable");
    }
    PriceSnapshot out;
    auto it = table_.find({ year, month });
    if (it == table_.end()) {
        return out;
    }
    for (const auto& symbol : symbols) {
        auto price = it->second.find(symbol);
        if (price != it->second.end()) {
            out.emplace(symbol, price->second);
        }
    }
    return out;
}

void InMemoryPriceSource::preloadPricesForGame(const std::vector<std::string>&, int, int) {
    if (!available_) {
        throw DependencyError("price repository unavailable");
    }
}

} // namespace tr
