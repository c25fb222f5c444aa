#ifndef CPAMM_INVARIANT_HPP
#define CPAMM_INVARIANT_HPP

#include "types.hpp"
#include "math.hpp"

namespace cpamm {

// =============================================================================
// Constant-Product Invariant
// =============================================================================

namespace invariant {

// K = total_token1 * total_token2 (full 256-bit product)
U256 get_k(const PoolTotals& totals);

// ZERO_LIQUIDITY while K == 0; gate for every ratio-dependent computation
int32_t active_pool(const PoolTotals& totals);

// Pool is either fully empty or fully funded, and shares exist iff K != 0
bool is_consistent(const PoolTotals& totals);

} // namespace invariant

} // namespace cpamm

#endif // CPAMM_INVARIANT_HPP
