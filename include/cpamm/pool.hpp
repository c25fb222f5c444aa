#ifndef CPAMM_POOL_HPP
#define CPAMM_POOL_HPP

#include <vector>

#include "types.hpp"
#include "math.hpp"
#include "ledger.hpp"
#include "estimate.hpp"
#include "events.hpp"
#include "config.hpp"

namespace cpamm {

// =============================================================================
// Pool State (single pool aggregate)
// =============================================================================

struct PoolState {
    PoolTotals totals;
    Balance fee_basis_points = 0;   // [0, FEE_BPS_LIMIT), stored only
    AssetLedger ledger;
};

// =============================================================================
// LiquidityManager - constant-product pool deposits and withdrawals
// =============================================================================

// Single-threaded: callers serialize access. Every mutating operation
// validates and stages first, then commits in one step; on error the pool
// and all accounts are unchanged.
class LiquidityManager {
public:
    // fee_basis_points >= FEE_BPS_LIMIT is stored as 0
    explicit LiquidityManager(Balance fee_basis_points = 0);
    explicit LiquidityManager(const PoolConfig& config);
    ~LiquidityManager() = default;

    // Non-copyable
    LiquidityManager(const LiquidityManager&) = delete;
    LiquidityManager& operator=(const LiquidityManager&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    // Deposit both tokens and mint shares.
    // Empty pool: GENESIS_SHARES regardless of amounts (the first deposit
    // sets the price ratio). Otherwise amounts must match the pool ratio
    // exactly under floor division.
    // Errors: ZERO_AMOUNT, INSUFFICIENT_AMOUNT, NON_EQUIVALENT_VALUE,
    //         THRESHOLD_NOT_REACHED, ARITHMETIC_OVERFLOW, REENTRANCY
    AmountResult provide(const Address& caller, Balance amount_token1, Balance amount_token2);

    // Burn shares and release the proportional token amounts.
    // The caller's share balance is checked before pool activity.
    // Errors: ZERO_AMOUNT, INSUFFICIENT_AMOUNT, ZERO_LIQUIDITY, INVALID_SHARE,
    //         ARITHMETIC_OVERFLOW, REENTRANCY
    WithdrawResult withdraw(const Address& caller, Balance share);

    // Credit off-pool token balances (bootstrap/test helper)
    // Errors: ARITHMETIC_OVERFLOW, REENTRANCY
    int32_t faucet(const Address& caller, Balance amount_token1, Balance amount_token2);

    // =========================================================================
    // Query Operations
    // =========================================================================

    Holdings holdings_of(const Address& caller) const;
    PoolDetails pool_details() const;

    AmountResult equivalent_token1_for(Balance amount_token2) const;
    AmountResult equivalent_token2_for(Balance amount_token1) const;
    WithdrawResult withdraw_estimate(Balance share) const;

    U256 get_k() const;
    const AssetLedger& ledger() const { return state_.ledger; }

    // =========================================================================
    // Hook Registration
    // =========================================================================

    // Not owned; must outlive registration. Null and duplicates are ignored.
    void register_hooks(IPoolHooks* hooks);
    void unregister_hooks(IPoolHooks* hooks);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_accounts;
        uint64_t total_provides;
        uint64_t total_withdrawals;
        uint64_t total_faucets;
        uint64_t rejected_ops;
    };
    Stats get_stats() const;

private:
    PoolState state_;
    EstimateCalculator estimates_{state_.totals};

    std::vector<IPoolHooks*> hooks_;
    bool unlocked_{true};   // false while hooks run

    uint64_t total_provides_{0};
    uint64_t total_withdrawals_{0};
    uint64_t total_faucets_{0};
    uint64_t rejected_ops_{0};

    // Share amount for a deposit against the current totals
    AmountResult compute_share(Balance amount_token1, Balance amount_token2) const;

    void commit(const Address& caller, const AccountState& account, const PoolTotals& totals);
    int32_t reject(const char* op, const Address& caller, int32_t code);

    void notify(const PoolEvent& event);
};

} // namespace cpamm

#endif // CPAMM_POOL_HPP
