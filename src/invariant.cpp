// =============================================================================
// invariant.cpp - Constant-Product Invariant
// =============================================================================

#include "cpamm/invariant.hpp"

namespace cpamm {
namespace invariant {

U256 get_k(const PoolTotals& totals) {
    return mul_u128(totals.total_token1, totals.total_token2);
}

int32_t active_pool(const PoolTotals& totals) {
    if (get_k(totals).is_zero()) {
        return errors::ZERO_LIQUIDITY;
    }
    return errors::OK;
}

bool is_consistent(const PoolTotals& totals) {
    bool token1_empty = totals.total_token1 == 0;
    bool token2_empty = totals.total_token2 == 0;
    if (token1_empty != token2_empty) return false;

    bool funded = !get_k(totals).is_zero();
    return funded == (totals.total_shares != 0);
}

} // namespace invariant
} // namespace cpamm
