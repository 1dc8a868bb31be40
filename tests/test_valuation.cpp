#include "money.hpp"
#include "valuation.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "valuation_test failure: " << msg << std::endl;
    std::exit(1);
}

bool near(double a, double b) {
    return std::abs(a - b) < 0.005;
}

} // namespace

int main() {
    using namespace tr;

    FixedDeposit fd;
    fd.amount = 100000.0;
    fd.interestRate = 7.0;
    fd.durationMonths = 12;
    fd.startYear = 1;
    fd.startMonth = 1;

    if (!near(fixedDepositValue(fd, 1, 7), 103500.00)) {
        fail("six months of accrual should be worth 103500.00");
    }
    if (!near(fixedDepositValue(fd, 2, 1), 107000.00)) {
        fail("twelve months of accrual should be worth 107000.00");
    }
    if (!near(fixedDepositValue(fd, 5, 1), 107000.00)) {
        fail("accrual must stop at the deposit's duration");
    }
    if (!near(fixedDepositValue(fd, 1, 1), 100000.00)) {
        fail("a fresh deposit is worth its principal");
    }
    FixedDeposit matured = fd;
    matured.isMatured = true;
    if (!near(fixedDepositValue(matured, 1, 2), 107000.00)) {
        fail("a matured deposit is worth principal plus full return");
    }
    FixedDeposit zeroDuration = fd;
    zeroDuration.durationMonths = 0;
    if (!near(fixedDepositValue(zeroDuration, 3, 4), 100000.00)) {
        fail("a zero-duration deposit is worth its principal");
    }

    ValidationResult zero = validateNetworth(0.0, 0.0);
    if (!zero.valid || zero.deviation != 0.0) {
        fail("validateNetworth(0, 0) should be valid with zero deviation");
    }
    ValidationResult fromNothing = validateNetworth(100.0, 0.0);
    if (fromNothing.valid || fromNothing.deviation != 100.0) {
        fail("validateNetworth(100, 0) should be invalid with deviation 100");
    }
    if (!validateNetworth(100400.0, 100000.0).valid) {
        fail("0.4% deviation is within tolerance");
    }
    if (validateNetworth(100600.0, 100000.0).valid) {
        fail("0.6% deviation is outside tolerance");
    }
    if (!near(validateNetworth(-101000.0, -100000.0).deviation, 1.0)) {
        fail("deviation against a negative figure must use its magnitude");
    }

    Holdings holdings;
    holdings.physicalGold.quantity = 2.0;
    holdings.indexFund.quantity = 10.0;
    holdings.stocks["TCS"].quantity = 3.0;
    holdings.stocks["INFY"].quantity = 0.0;
    holdings.crypto["BTC"].quantity = 0.5;
    holdings.commodity.quantity = 4.0;
    holdings.reits["EMBASSY"].quantity = 5.0;

    SelectedAssets selected;
    selected.fundName = "NIFTYBEES";
    selected.stocks = { "TCS", "INFY" };
    selected.commodity = "CRUDEOIL";

    const std::map<std::string, double> prices{
        { "Physical_Gold", 5000.0 }, { "NIFTYBEES", 200.0 }, { "TCS", 3000.0 },  { "INFY", 1500.0 },
        { "BTC", 40000.0 },          { "CRUDEOIL", 80.0 },   { "EMBASSY", 350.0 },
    };

    NetworthResult server = calculateServerNetworth(1000.0, 2000.0, { fd }, holdings, prices, selected, 1, 7);
    const double expected = 1000.0 + 2000.0 + 103500.0 + 10000.0 + 2000.0 + 9000.0 + 20000.0 + 320.0 + 1750.0;
    if (!near(server.total, expected)) {
        fail("server net worth total is wrong: " + std::to_string(server.total));
    }
    if (!near(server.breakdown.at("gold"), 10000.0) || !near(server.breakdown.at("funds"), 2000.0) ||
        !near(server.breakdown.at("stocks"), 9000.0) || !near(server.breakdown.at("fixedDeposits"), 103500.0)) {
        fail("server net worth breakdown is wrong");
    }

    // Crypto and REIT buckets only value the game's own symbols.
    Holdings misfiled = holdings;
    misfiled.crypto["TCS"].quantity = 100.0;
    misfiled.reits["INFY"].quantity = 100.0;
    NetworthResult sameTotal = calculateServerNetworth(1000.0, 2000.0, { fd }, misfiled, prices, selected, 1, 7);
    if (!near(sameTotal.total, expected) || !near(sameTotal.breakdown.at("crypto"), 20000.0) ||
        !near(sameTotal.breakdown.at("reits"), 1750.0)) {
        fail("a stock filed under crypto or reits was valued");
    }

    const std::map<std::string, double> noPrices;
    NetworthResult unpriced = calculateServerNetworth(1000.0, 0.0, {}, holdings, noPrices, selected, 1, 7);
    if (!near(unpriced.total, 1000.0)) {
        fail("holdings without a price must be valued at zero");
    }

    PortfolioBreakdown claimed;
    claimed.cash = 3000.0;
    claimed.savings = 2000.0;
    claimed.gold = 10000.0;
    claimed.funds = 2000.0;
    claimed.stocks = 9000.0;
    claimed.crypto = 20000.0;
    claimed.commodities = 320.0;
    claimed.reits = 1750.0;
    ValidationResult full =
        fullValidation(expected, claimed, 1000.0, 2000.0, { fd }, holdings, prices, selected, 1, 7);
    if (!full.valid || full.mismatchedCategories.size() != 1 || full.mismatchedCategories[0] != "cash") {
        fail("fullValidation should accept the total and flag only the cash bucket");
    }

    ValidationResult inflated =
        fullValidation(expected * 2.0, claimed, 1000.0, 2000.0, { fd }, holdings, prices, selected, 1, 7);
    if (inflated.valid || !near(inflated.serverNetworth, expected)) {
        fail("an inflated claim must be reported invalid");
    }

    nlohmann::json fdJson{ { "id", "fd-1" }, { "amount", 5000 }, { "duration", 24 }, { "interestRate", 6.5 } };
    FixedDeposit parsed = fdJson.get<FixedDeposit>();
    if (parsed.durationMonths != 24 || parsed.startYear != 1 || parsed.isMatured) {
        fail("fixed deposit JSON defaults are wrong");
    }

    const std::vector<nlohmann::json> badDeposits{
        { { "amount", 5000 }, { "duration", 1e20 } },
        { { "amount", 5000 }, { "duration", 12.5 } },
        { { "amount", 5000 }, { "duration", -3 } },
        { { "amount", 5000 }, { "duration", 12 }, { "startMonth", 13 } },
        { { "amount", 5000 }, { "duration", 12 }, { "startYear", 1e12 } },
        { { "amount", 5000 }, { "duration", "12" } },
    };
    for (const auto& bad : badDeposits) {
        try {
            (void)bad.get<FixedDeposit>();
            fail("an out-of-range deposit was accepted: " + bad.dump());
        } catch (const std::invalid_argument&) {
        }
    }
    if (nlohmann::json{ { "duration", 12.0 }, { "startMonth", 6 } }.get<FixedDeposit>().durationMonths != 12) {
        fail("a whole-number duration written as a float was rejected");
    }

    if (Money::fromDouble(0.1) + Money::fromDouble(0.2) != Money::fromDouble(0.3)) {
        fail("money sums must be exact at micro-unit precision");
    }

    std::cout << "valuation_test passed" << std::endl;
    return 0;
}
