#include "csv_price_source.hpp"
#include "errors.hpp"
#include "price_cache.hpp"
#include "price_source.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "market_data_test failure: " << msg << std::endl;
    std::exit(1);
}

std::string writeFixture() {
    const std::string path = "market_data_test_prices.csv";
    std::ofstream out(path);
    out << "symbol,date,close\n";
    out << "BTC,2009-12-20,100.0\n";
    out << "BTC,2009-12-31,110.0\n";
    out << "BTC,2010-02-01,150.0\n";
    out << "TCS,2010-01-15,900.0\n";
    out << "TCS,2010-03-20,950.0\n";
    out << "GOLD,2009-09-01,1000.0\n";
    out << "broken row without commas\n";
    out << "GOLD,2010-13-45,1.0\n";
    out << "GOLD,2010-01-05,notanumber\n";
    out << "BTC,2010-01-01,inf\n";
    out << "TCS,2009-12-30,nan\n";
    out << "ETH,2010-01-01,-5.0\n";
    return path;
}

} // namespace

int main() {
    using namespace tr;

    // Cache keys and FIFO eviction.
    if (PriceCache::keyFor(2005, 3) != "2005-03" || PriceCache::keyFor(1999, 12) != "1999-12") {
        fail("cache keys must be zero-padded YYYY-MM");
    }
    PriceCache cache(2);
    cache.put(2005, 1, { { "BTC", 1.0 } });
    cache.put(2005, 2, { { "BTC", 2.0 } });
    cache.put(2005, 1, { { "BTC", 1.5 } });
    cache.put(2005, 3, { { "BTC", 3.0 } });
    if (cache.size() != 2 || cache.get(2005, 1) || !cache.get(2005, 2) || !cache.get(2005, 3)) {
        fail("cache did not evict the oldest inserted month");
    }
    cache.clear();
    if (cache.size() != 0 || cache.get(2005, 2)) {
        fail("cache clear left entries behind");
    }

    // Symbol selection.
    nlohmann::json selected{ { "fundName", "NIFTYBEES" },
                             { "stocks", { "TCS", "BTC", "INFY" } },
                             { "commodity", "CRUDEOIL" } };
    std::vector<std::string> symbols = gameSymbols(selected);
    const std::vector<std::string> expected{ "Physical_Gold", "Digital_Gold", "NIFTYBEES", "TCS", "BTC",
                                             "INFY",          "ETH",          "CRUDEOIL",  "EMBASSY", "MINDSPACE" };
    if (symbols != expected) {
        fail("gameSymbols did not produce the deduplicated symbol list");
    }
    if (gameSymbols(nlohmann::json()).size() != 6) {
        fail("always-on symbols missing for an empty selection");
    }

    // In-memory repository.
    InMemoryPriceSource memory;
    memory.setSnapshot(2010, 1, { { "BTC", 1.0 }, { "TCS", 2.0 } });
    PriceSnapshot partial = memory.getPricesForDate({ "BTC", "ETH" }, 2010, 1);
    if (partial.size() != 1 || partial.at("BTC") != 1.0) {
        fail("in-memory source returned symbols that were not asked for");
    }
    memory.setAvailable(false);
    try {
        memory.getPricesForDate({ "BTC" }, 2010, 1);
        fail("an unavailable repository answered");
    } catch (const DependencyError&) {
    }

    // CSV repository lookups.
    const std::string path = writeFixture();
    CsvPriceSource csv(path, 4);
    PriceSnapshot jan = csv.getPricesForDate({ "BTC", "TCS", "GOLD", "ETH" }, 2010, 1);
    if (jan.at("BTC") != 110.0) {
        fail("expected the latest close on or before the 1st");
    }
    if (jan.at("TCS") != 900.0) {
        fail("expected the earliest close after the 1st when nothing precedes it");
    }
    if (jan.count("GOLD") != 0) {
        fail("a close older than the lookback window was used");
    }
    if (jan.count("ETH") != 0) {
        fail("an unknown symbol received a price");
    }
    for (const auto& entry : jan) {
        if (!std::isfinite(entry.second) || entry.second < 0.0) {
            fail("a non-finite or negative close reached a snapshot for " + entry.first);
        }
    }
    PriceSnapshot feb = csv.getPricesForDate({ "BTC" }, 2010, 2);
    if (feb.at("BTC") != 150.0) {
        fail("a close on the 1st itself must be used");
    }
    PriceSnapshot jun = csv.getPricesForDate({ "TCS" }, 2010, 6);
    if (jun.count("TCS") != 0) {
        fail("a close outside both windows was used");
    }
    if (csv.cache().size() != 3) {
        fail("lookups were not cached per month");
    }

    csv.preloadPricesForGame({ "BTC" }, 2009, 1);
    if (csv.cache().size() != csv.cache().maxEntries()) {
        fail("preload should fill the bounded cache");
    }

    CsvPriceSource missing("does/not/exist.csv", 4);
    try {
        missing.getPricesForDate({ "BTC" }, 2010, 1);
        fail("a missing price file answered");
    } catch (const DependencyError&) {
    }

    std::remove(path.c_str());
    std::cout << "market_data_test passed" << std::endl;
    return 0;
}
