// =============================================================================
// estimate.cpp - EstimateCalculator Implementation
// =============================================================================

#include "cpamm/estimate.hpp"
#include "cpamm/invariant.hpp"
#include "cpamm/math.hpp"

namespace cpamm {

EstimateCalculator::EstimateCalculator(const PoolTotals& totals)
    : totals_(totals) {}

AmountResult EstimateCalculator::equivalent_token1_for(Balance amount_token2) const {
    int32_t rc = invariant::active_pool(totals_);
    if (rc != errors::OK) {
        return {rc, 0};
    }

    Balance amount = 0;
    if (!mul_div(totals_.total_token1, amount_token2, totals_.total_token2, amount)) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }
    return {errors::OK, amount};
}

AmountResult EstimateCalculator::equivalent_token2_for(Balance amount_token1) const {
    int32_t rc = invariant::active_pool(totals_);
    if (rc != errors::OK) {
        return {rc, 0};
    }

    Balance amount = 0;
    if (!mul_div(totals_.total_token2, amount_token1, totals_.total_token1, amount)) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }
    return {errors::OK, amount};
}

WithdrawResult EstimateCalculator::withdraw_estimate(Balance share) const {
    int32_t rc = invariant::active_pool(totals_);
    if (rc != errors::OK) {
        return {rc, 0, 0};
    }
    if (share > totals_.total_shares) {
        return {errors::INVALID_SHARE, 0, 0};
    }

    // share <= total_shares, so both quotients fit
    Balance amount1 = 0;
    Balance amount2 = 0;
    if (!mul_div(share, totals_.total_token1, totals_.total_shares, amount1) ||
        !mul_div(share, totals_.total_token2, totals_.total_shares, amount2)) {
        return {errors::ARITHMETIC_OVERFLOW, 0, 0};
    }
    return {errors::OK, amount1, amount2};
}

} // namespace cpamm
