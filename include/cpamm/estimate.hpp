#ifndef CPAMM_ESTIMATE_HPP
#define CPAMM_ESTIMATE_HPP

#include "types.hpp"

namespace cpamm {

// =============================================================================
// EstimateCalculator - ratio-based deposit/withdraw quotes
// =============================================================================

// Reads the pool totals it was built over; never mutates them.
// All divisions floor. Every quote fails with ZERO_LIQUIDITY on an empty pool.
class EstimateCalculator {
public:
    explicit EstimateCalculator(const PoolTotals& totals);

    // Token1 required alongside amount_token2 at the current ratio
    AmountResult equivalent_token1_for(Balance amount_token2) const;

    // Token2 required alongside amount_token1 at the current ratio
    AmountResult equivalent_token2_for(Balance amount_token1) const;

    // Token1/token2 released by burning share (INVALID_SHARE if share > total)
    WithdrawResult withdraw_estimate(Balance share) const;

private:
    const PoolTotals& totals_;
};

} // namespace cpamm

#endif // CPAMM_ESTIMATE_HPP
