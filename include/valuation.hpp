#pragma once

#include "portfolio.hpp"

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tr {

// Relative deviation, in percent, tolerated between a client's net worth
// claim and the server's figure.
constexpr double kTolerancePercent = 0.5;

struct AssetHolding {
    double quantity = 0.0;
    double avgPrice = 0.0;
    double totalInvested = 0.0;
};

struct Holdings {
    AssetHolding physicalGold;
    AssetHolding digitalGold;
    AssetHolding indexFund;
    AssetHolding mutualFund;
    AssetHolding commodity;
    std::map<std::string, AssetHolding> stocks;
    std::map<std::string, AssetHolding> crypto;
    std::map<std::string, AssetHolding> reits;
};

struct FixedDeposit {
    std::string id;
    double amount = 0.0;
    int durationMonths = 0;
    double interestRate = 0.0; // annual, percent
    int startYear = 1;
    int startMonth = 1;
    bool isMatured = false;
};

// The parts of a room's selected-asset configuration that price holdings.
struct SelectedAssets {
    std::string fundName;
    std::vector<std::string> stocks;
    std::string commodity;
};

struct NetworthResult {
    double total = 0.0;
    // cash, savings, fixedDeposits, gold, funds, stocks, crypto, commodities, reits
    std::map<std::string, double> breakdown;
};

struct ValidationResult {
    bool valid = false;
    double serverNetworth = 0.0;
    double clientNetworth = 0.0;
    double deviation = 0.0; // percent
    std::map<std::string, double> breakdown;
    // Categories whose client-reported value is outside tolerance of the
    // server figure. Filled by fullValidation only.
    std::vector<std::string> mismatchedCategories;
};

// Value of one deposit at (currentYear, currentMonth). A deposit with a
// non-positive duration is worth its principal.
double fixedDepositValue(const FixedDeposit& fd, int currentYear, int currentMonth);

// Deterministic and side-effect free. Absent prices value a holding at zero.
NetworthResult calculateServerNetworth(double pocketCash,
                                       double savingsBalance,
                                       const std::vector<FixedDeposit>& fixedDeposits,
                                       const Holdings& holdings,
                                       const std::map<std::string, double>& prices,
                                       const SelectedAssets& selectedAssets,
                                       int currentYear,
                                       int currentMonth);

ValidationResult validateNetworth(double clientNetworth, double serverNetworth);

ValidationResult fullValidation(double clientNetworth,
                                const PortfolioBreakdown& clientBreakdown,
                                double pocketCash,
                                double savingsBalance,
                                const std::vector<FixedDeposit>& fixedDeposits,
                                const Holdings& holdings,
                                const std::map<std::string, double>& prices,
                                const SelectedAssets& selectedAssets,
                                int currentYear,
                                int currentMonth);

// Lenient readers for client-supplied JSON: missing fields read as zero or
// empty, wrong types throw nlohmann::json::type_error.
void from_json(const nlohmann::json& j, AssetHolding& holding);
void from_json(const nlohmann::json& j, Holdings& holdings);
void from_json(const nlohmann::json& j, FixedDeposit& fd);
void from_json(const nlohmann::json& j, SelectedAssets& assets);

void to_json(nlohmann::json& j, const ValidationResult& result);

} // namespace tr
