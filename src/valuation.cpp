#include "valuation.hpp"

#include "config.hpp"
#include "money.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace tr {

namespace {

constexpr std::int64_t kMaxDepositMonths = 1200;

double priceOf(const std::map<std::string, double>& prices, const std::string& symbol) {
    if (symbol.empty()) {
        return 0.0;
    }
    auto it = prices.find(symbol);
    return it == prices.end() ? 0.0 : it->second;
}

Money valueOf(const std::map<std::string, AssetHolding>& positions,
              const std::map<std::string, double>& prices) {
    Money sum;
    for (const auto& entry : positions) {
        if (entry.second.quantity > 0.0) {
            sum += Money::fromDouble(entry.second.quantity * priceOf(prices, entry.first));
        }
    }
    return sum;
}

// Only the game's fixed symbols count; positions filed under other keys are ignored.
Money valueOfListed(const std::map<std::string, AssetHolding>& positions,
                    const std::map<std::string, double>& prices,
                    std::initializer_list<const char*> symbols) {
    Money sum;
    for (const char* symbol : symbols) {
        auto it = positions.find(symbol);
        if (it != positions.end()) {
            sum += Money::fromDouble(it->second.quantity * priceOf(prices, symbol));
        }
    }
    return sum;
}

double numberOr(const nlohmann::json& j, const char* key, double fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return it->get<double>();
}

std::int64_t integerOr(const nlohmann::json& j,
                       const char* key,
                       std::int64_t fallback,
                       std::int64_t minValue,
                       std::int64_t maxValue) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return readBoundedInteger(*it, key, minValue, maxValue);
}

std::string stringOr(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

void readPositions(const nlohmann::json& j, const char* key, std::map<std::string, AssetHolding>& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return;
    }
    for (auto entry = it->begin(); entry != it->end(); ++entry) {
        if (entry.value().is_object()) {
            out[entry.key()] = entry.value().get<AssetHolding>();
        }
    }
}

void readHolding(const nlohmann::json& j, const char* key, AssetHolding& out) {
    auto it = j.find(key);
    if (it != j.end() && it->is_object()) {
        out = it->get<AssetHolding>();
    }
}

} // namespace

double fixedDepositValue(const FixedDeposit& fd, int currentYear, int currentMonth) {
    if (fd.durationMonths <= 0) {
        return fd.amount;
    }
    const double totalReturn = (fd.interestRate / 100.0) * (fd.durationMonths / 12.0);
    if (fd.isMatured) {
        return fd.amount * (1.0 + totalReturn);
    }

    int elapsed = (currentYear - fd.startYear) * 12 + (currentMonth - fd.startMonth);
    elapsed = std::clamp(elapsed, 0, fd.durationMonths);
    const double progress = static_cast<double>(elapsed) / static_cast<double>(fd.durationMonths);
    return fd.amount + fd.amount * totalReturn * progress;
}

NetworthResult calculateServerNetworth(double pocketCash,
                                       double savingsBalance,
                                       const std::vector<FixedDeposit>& fixedDeposits,
                                       const Holdings& holdings,
                                       const std::map<std::string, double>& prices,
                                       const SelectedAssets& selectedAssets,
                                       int currentYear,
                                       int currentMonth) {
    Money cash = Money::fromDouble(pocketCash);
    Money savings = Money::fromDouble(savingsBalance);

    Money deposits;
    for (const auto& fd : fixedDeposits) {
        deposits += Money::fromDouble(fixedDepositValue(fd, currentYear, currentMonth));
    }

    Money gold = Money::fromDouble(holdings.physicalGold.quantity * priceOf(prices, "Physical_Gold")) +
                 Money::fromDouble(holdings.digitalGold.quantity * priceOf(prices, "Digital_Gold"));

    const double fundPrice = priceOf(prices, selectedAssets.fundName);
    Money funds = Money::fromDouble(holdings.indexFund.quantity * fundPrice) +
                  Money::fromDouble(holdings.mutualFund.quantity * fundPrice);

    Money stocks = valueOf(holdings.stocks, prices);
    Money crypto = valueOfListed(holdings.crypto, prices, { "BTC", "ETH" });
    Money commodities =
        Money::fromDouble(holdings.commodity.quantity * priceOf(prices, selectedAssets.commodity));
    Money reits = valueOfListed(holdings.reits, prices, { "EMBASSY", "MINDSPACE" });

    NetworthResult result;
    result.breakdown = {
        { "cash", cash.toDouble() },
        { "savings", savings.toDouble() },
        { "fixedDeposits", deposits.toDouble() },
        { "gold", gold.toDouble() },
        { "funds", funds.toDouble() },
        { "stocks", stocks.toDouble() },
        { "crypto", crypto.toDouble() },
        { "commodities", commodities.toDouble() },
        { "reits", reits.toDouble() },
    };
    Money total = cash + savings + deposits + gold + funds + stocks + crypto + commodities + reits;
    result.total = total.toDouble();
    return result;
}

ValidationResult validateNetworth(double clientNetworth, double serverNetworth) {
    ValidationResult result;
    result.serverNetworth = serverNetworth;
    result.clientNetworth = clientNetworth;

    if (serverNetworth != 0.0) {
        result.deviation = std::abs(clientNetworth - serverNetworth) / std::abs(serverNetworth) * 100.0;
    } else {
        // No base to scale against: any nonzero claim is a full deviation.
        result.deviation = clientNetworth != 0.0 ? 100.0 : 0.0;
    }
    result.valid = result.deviation <= kTolerancePercent;
    return result;
}

ValidationResult fullValidation(double clientNetworth,
                                const PortfolioBreakdown& clientBreakdown,
                                double pocketCash,
                                double savingsBalance,
                                const std::vector<FixedDeposit>& fixedDeposits,
                                const Holdings& holdings,
                                const std::map<std::string, double>& prices,
                                const SelectedAssets& selectedAssets,
                                int currentYear,
                                int currentMonth) {
    NetworthResult server = calculateServerNetworth(
        pocketCash, savingsBalance, fixedDeposits, holdings, prices, selectedAssets, currentYear, currentMonth);

    ValidationResult result = validateNetworth(clientNetworth, server.total);
    result.breakdown = server.breakdown;

    const std::pair<const char*, double> claimed[] = {
        { "cash", clientBreakdown.cash },
        { "savings", clientBreakdown.savings },
        { "gold", clientBreakdown.gold },
        { "funds", clientBreakdown.funds },
        { "stocks", clientBreakdown.stocks },
        { "crypto", clientBreakdown.crypto },
        { "commodities", clientBreakdown.commodities },
        { "reits", clientBreakdown.reits },
    };
    for (const auto& entry : claimed) {
        if (!validateNetworth(entry.second, server.breakdown.at(entry.first)).valid) {
            result.mismatchedCategories.emplace_back(entry.first);
        }
    }
    return result;
}

void from_json(const nlohmann::json& j, AssetHolding& holding) {
    holding.quantity = numberOr(j, "quantity", 0.0);
    holding.avgPrice = numberOr(j, "avgPrice", 0.0);
    holding.totalInvested = numberOr(j, "totalInvested", 0.0);
}

void from_json(const nlohmann::json& j, Holdings& holdings) {
    holdings = Holdings{};
    if (!j.is_object()) {
        return;
    }
    readHolding(j, "physicalGold", holdings.physicalGold);
    readHolding(j, "digitalGold", holdings.digitalGold);
    readHolding(j, "indexFund", holdings.indexFund);
    readHolding(j, "mutualFund", holdings.mutualFund);
    readHolding(j, "commodity", holdings.commodity);
    readPositions(j, "stocks", holdings.stocks);
    readPositions(j, "crypto", holdings.crypto);
    readPositions(j, "reits", holdings.reits);
}

void from_json(const nlohmann::json& j, FixedDeposit& fd) {
    fd.id = stringOr(j, "id");
    fd.amount = numberOr(j, "amount", 0.0);
    fd.durationMonths = static_cast<int>(integerOr(j, "duration", 0, 0, kMaxDepositMonths));
    fd.interestRate = numberOr(j, "interestRate", 0.0);
    fd.startYear = static_cast<int>(integerOr(j, "startYear", 1, 1, kMaxCalendarYear));
    fd.startMonth = static_cast<int>(integerOr(j, "startMonth", 1, 1, 12));
    auto matured = j.find("isMatured");
    fd.isMatured = matured != j.end() && matured->is_boolean() && matured->get<bool>();
}

void from_json(const nlohmann::json& j, SelectedAssets& assets) {
    assets = SelectedAssets{};
    if (!j.is_object()) {
        return;
    }
    assets.fundName = stringOr(j, "fundName");
    assets.commodity = stringOr(j, "commodity");
    auto stocks = j.find("stocks");
    if (stocks != j.end() && stocks->is_array()) {
        for (const auto& s : *stocks) {
            if (s.is_string()) {
                assets.stocks.push_back(s.get<std::string>());
            }
        }
    }
}

void to_json(nlohmann::json& j, const ValidationResult& result) {
    j = nlohmann::json{ { "valid", result.valid },
                        { "serverNetworth", result.serverNetworth },
                        { "clientNetworth", result.clientNetworth },
                        { "deviation", result.deviation },
                        { "breakdown", result.breakdown } };
    if (!result.mismatchedCategories.empty()) {
        j["mismatchedCategories"] = result.mismatchedCategories;
    }
}

} // namespace tr
