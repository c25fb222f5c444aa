// cpamm - EstimateCalculator Tests

#include <catch2/catch_test_macros.hpp>
#include <cpamm/estimate.hpp>
#include "test_helpers.hpp"

using namespace cpamm;
using namespace cpamm::test;

TEST_CASE("Estimates on an empty pool", "[estimate]") {
    PoolTotals totals;
    EstimateCalculator calc(totals);

    REQUIRE(calc.equivalent_token1_for(B(10)).status == errors::ZERO_LIQUIDITY);
    REQUIRE(calc.equivalent_token2_for(B(10)).status == errors::ZERO_LIQUIDITY);
    REQUIRE(calc.withdraw_estimate(B(10)).status == errors::ZERO_LIQUIDITY);

    // Activity is checked before the share bound
    REQUIRE(calc.withdraw_estimate(B(0)).status == errors::ZERO_LIQUIDITY);
}

TEST_CASE("Equivalent amounts follow the pool ratio", "[estimate]") {
    // 1 token1 : 3 token2
    PoolTotals totals{GENESIS_SHARES, B(200), B(600)};
    EstimateCalculator calc(totals);

    SECTION("Exact") {
        AmountResult t2 = calc.equivalent_token2_for(B(50));
        REQUIRE(t2.ok());
        REQUIRE(t2.amount == B(150));

        AmountResult t1 = calc.equivalent_token1_for(B(150));
        REQUIRE(t1.ok());
        REQUIRE(t1.amount == B(50));
    }

    SECTION("Floors") {
        // 200 * 7 / 600 = 2.33
        REQUIRE(calc.equivalent_token1_for(B(7)).amount == B(2));
        // 200 * 1 / 600 = 0.33
        REQUIRE(calc.equivalent_token1_for(B(1)).amount == B(0));
    }

    SECTION("Quotes track the totals they view") {
        totals.total_token2 = B(200);
        REQUIRE(calc.equivalent_token2_for(B(50)).amount == B(50));
    }

    SECTION("Quote beyond 128 bits") {
        PoolTotals big{GENESIS_SHARES, U128_MAX, B(1)};
        EstimateCalculator big_calc(big);
        REQUIRE(big_calc.equivalent_token1_for(B(2)).status == errors::ARITHMETIC_OVERFLOW);
    }
}

TEST_CASE("Withdraw estimate", "[estimate]") {
    PoolTotals totals{B(150000000), B(150), B(300)};
    EstimateCalculator calc(totals);

    SECTION("Proportional share") {
        WithdrawResult r = calc.withdraw_estimate(B(50000000));
        REQUIRE(r.ok());
        REQUIRE(r.amount_token1 == B(50));
        REQUIRE(r.amount_token2 == B(100));
    }

    SECTION("All shares return everything") {
        WithdrawResult r = calc.withdraw_estimate(B(150000000));
        REQUIRE(r.ok());
        REQUIRE(r.amount_token1 == B(150));
        REQUIRE(r.amount_token2 == B(300));
    }

    SECTION("Tiny share floors to zero") {
        WithdrawResult r = calc.withdraw_estimate(B(1));
        REQUIRE(r.ok());
        REQUIRE(r.amount_token1 == B(0));
        REQUIRE(r.amount_token2 == B(0));
    }

    SECTION("More than total shares") {
        REQUIRE(calc.withdraw_estimate(B(150000001)).status == errors::INVALID_SHARE);
    }

    SECTION("Repeated calls are identical") {
        WithdrawResult a = calc.withdraw_estimate(B(12345678));
        WithdrawResult b = calc.withdraw_estimate(B(12345678));
        REQUIRE(a.status == b.status);
        REQUIRE(a.amount_token1 == b.amount_token1);
        REQUIRE(a.amount_token2 == b.amount_token2);
        REQUIRE(totals == PoolTotals{B(150000000), B(150), B(300)});
    }
}
