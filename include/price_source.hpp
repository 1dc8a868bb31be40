#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace tr {

// symbol -> close price for one simulated month.
using PriceSnapshot = std::map<std::string, double>;

// Historical price repository. Implementations throw DependencyError when
// the backing store cannot answer.
class PriceSource {
public:
    virtual ~PriceSource() = default;

    // Symbols without a price for the month are absent from the result.
    virtual PriceSnapshot getPricesForDate(const std::vector<std::string>& symbols, int year, int month) = 0;

    // Best-effort warm-up; correctness never depends on it.
    virtual void preloadPricesForGame(const std::vector<std::string>& symbols, int startYear, int totalYears) = 0;
};

// Always-on symbols plus those named by the room's selected-asset
// configuration, deduplicated in first-seen order.
std::vector<std::string> gameSymbols(const nlohmann::json& selectedAssets);

// Fixed table of monthly snapshots. Can be switched offline to simulate an
// unavailable repository.
class InMemoryPriceSource : public PriceSource {
public:
    void setSnapshot(int year, int month, PriceSnapshot snapshot);
    void setAvailable(bool available) { available_ = available; }
    bool available() const { return available_; }
    int queryCount() const { return queries_; }

    PriceSnapshot getPricesForDate(const std::vector<std::string>& symbols, int year, int month) override;
    void preloadPricesForGame(const std::vector<std::string>& symbols, int startYear, int totalYears) override;

private:
    std::map<std::pair<int, int>, PriceSnapshot> table_;
    bool available_ = true;
    int queries_ = 0;
};

} // namespace tr
