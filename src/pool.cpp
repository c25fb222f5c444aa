// =============================================================================
// pool.cpp - LiquidityManager Implementation (constant-product pool)
// =============================================================================

#include "cpamm/pool.hpp"
#include "cpamm/invariant.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace cpamm {

// =============================================================================
// Constructor
// =============================================================================

LiquidityManager::LiquidityManager(Balance fee_basis_points) {
    state_.fee_basis_points = clamp_fee(fee_basis_points);
    if (state_.fee_basis_points != fee_basis_points) {
        spdlog::warn("fee {} bps out of range [0, {}), stored as 0",
                     to_string(fee_basis_points), to_string(FEE_BPS_LIMIT));
    }
}

LiquidityManager::LiquidityManager(const PoolConfig& config)
    : LiquidityManager(config.fee_basis_points) {}

// =============================================================================
// Provide Liquidity
// =============================================================================

AmountResult LiquidityManager::compute_share(Balance amount_token1, Balance amount_token2) const {
    const PoolTotals& totals = state_.totals;

    if (totals.total_shares == 0) {
        // Genesis liquidity: fixed issue, independent of deposited amounts
        return {errors::OK, GENESIS_SHARES};
    }

    Balance share1 = 0;
    Balance share2 = 0;
    if (!mul_div(totals.total_shares, amount_token1, totals.total_token1, share1) ||
        !mul_div(totals.total_shares, amount_token2, totals.total_token2, share2)) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }

    if (share1 != share2) {
        return {errors::NON_EQUIVALENT_VALUE, 0};
    }
    return {errors::OK, share1};
}

AmountResult LiquidityManager::provide(const Address& caller,
                                       Balance amount_token1, Balance amount_token2) {
    if (!unlocked_) {
        return {reject("provide", caller, errors::REENTRANCY), 0};
    }

    int32_t rc = state_.ledger.check_amount(caller, AssetKind::TOKEN1, amount_token1);
    if (rc == errors::OK) {
        rc = state_.ledger.check_amount(caller, AssetKind::TOKEN2, amount_token2);
    }
    if (rc != errors::OK) {
        return {reject("provide", caller, rc), 0};
    }

    AmountResult share = compute_share(amount_token1, amount_token2);
    if (!share.ok()) {
        return {reject("provide", caller, share.status), 0};
    }
    if (share.amount == 0) {
        return {reject("provide", caller, errors::THRESHOLD_NOT_REACHED), 0};
    }

    // Stage caller account and pool totals
    AccountState account = state_.ledger.account(caller);
    PoolTotals totals = state_.totals;

    rc = AssetLedger::sub_from(account, AssetKind::TOKEN1, amount_token1);
    if (rc == errors::OK) rc = AssetLedger::sub_from(account, AssetKind::TOKEN2, amount_token2);
    if (rc == errors::OK) rc = AssetLedger::add_to(account, AssetKind::SHARE, share.amount);
    if (rc == errors::OK &&
        (!checked_add(totals.total_token1, amount_token1, totals.total_token1) ||
         !checked_add(totals.total_token2, amount_token2, totals.total_token2) ||
         !checked_add(totals.total_shares, share.amount, totals.total_shares))) {
        rc = errors::ARITHMETIC_OVERFLOW;
    }
    if (rc != errors::OK) {
        return {reject("provide", caller, rc), 0};
    }

    commit(caller, account, totals);
    ++total_provides_;

    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("provide: caller={} token1={} token2={} shares={}",
                      to_hex(caller), to_string(amount_token1), to_string(amount_token2),
                      to_string(share.amount));
    }

    notify(PoolEvent{EventKind::LIQUIDITY_PROVIDED, caller,
                     amount_token1, amount_token2, share.amount, state_.totals});
    return {errors::OK, share.amount};
}

// =============================================================================
// Withdraw Liquidity
// =============================================================================

WithdrawResult LiquidityManager::withdraw(const Address& caller, Balance share) {
    if (!unlocked_) {
        return {reject("withdraw", caller, errors::REENTRANCY), 0, 0};
    }

    int32_t rc = state_.ledger.check_amount(caller, AssetKind::SHARE, share);
    if (rc != errors::OK) {
        return {reject("withdraw", caller, rc), 0, 0};
    }

    // Re-checks pool activity and share bound
    WithdrawResult estimate = estimates_.withdraw_estimate(share);
    if (!estimate.ok()) {
        return {reject("withdraw", caller, estimate.status), 0, 0};
    }

    AccountState account = state_.ledger.account(caller);
    PoolTotals totals = state_.totals;

    rc = AssetLedger::sub_from(account, AssetKind::SHARE, share);
    if (rc == errors::OK) rc = AssetLedger::add_to(account, AssetKind::TOKEN1, estimate.amount_token1);
    if (rc == errors::OK) rc = AssetLedger::add_to(account, AssetKind::TOKEN2, estimate.amount_token2);
    if (rc == errors::OK &&
        (!checked_sub(totals.total_shares, share, totals.total_shares) ||
         !checked_sub(totals.total_token1, estimate.amount_token1, totals.total_token1) ||
         !checked_sub(totals.total_token2, estimate.amount_token2, totals.total_token2))) {
        rc = errors::INVALID_SHARE;
    }
    if (rc != errors::OK) {
        return {reject("withdraw", caller, rc), 0, 0};
    }

    commit(caller, account, totals);
    ++total_withdrawals_;

    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("withdraw: caller={} shares={} token1={} token2={}",
                      to_hex(caller), to_string(share), to_string(estimate.amount_token1),
                      to_string(estimate.amount_token2));
    }
    if (invariant::active_pool(state_.totals) != errors::OK) {
        spdlog::info("pool drained by {}, liquidity is zero", to_hex(caller));
    }

    notify(PoolEvent{EventKind::LIQUIDITY_WITHDRAWN, caller,
                     estimate.amount_token1, estimate.amount_token2, share, state_.totals});
    return {errors::OK, estimate.amount_token1, estimate.amount_token2};
}

// =============================================================================
// Faucet
// =============================================================================

int32_t LiquidityManager::faucet(const Address& caller,
                                 Balance amount_token1, Balance amount_token2) {
    if (!unlocked_) {
        return reject("faucet", caller, errors::REENTRANCY);
    }

    AccountState account = state_.ledger.account(caller);
    int32_t rc = AssetLedger::add_to(account, AssetKind::TOKEN1, amount_token1);
    if (rc == errors::OK) rc = AssetLedger::add_to(account, AssetKind::TOKEN2, amount_token2);
    if (rc != errors::OK) {
        return reject("faucet", caller, rc);
    }

    state_.ledger.upsert(caller, account);
    ++total_faucets_;

    notify(PoolEvent{EventKind::FAUCET_CREDITED, caller,
                     amount_token1, amount_token2, 0, state_.totals});
    return errors::OK;
}

// =============================================================================
// Query Operations
// =============================================================================

Holdings LiquidityManager::holdings_of(const Address& caller) const {
    AccountState account = state_.ledger.account(caller);
    return Holdings{account.token1, account.token2, account.shares};
}

PoolDetails LiquidityManager::pool_details() const {
    return PoolDetails{
        state_.totals.total_token1,
        state_.totals.total_token2,
        state_.totals.total_shares,
        state_.fee_basis_points
    };
}

AmountResult LiquidityManager::equivalent_token1_for(Balance amount_token2) const {
    return estimates_.equivalent_token1_for(amount_token2);
}

AmountResult LiquidityManager::equivalent_token2_for(Balance amount_token1) const {
    return estimates_.equivalent_token2_for(amount_token1);
}

WithdrawResult LiquidityManager::withdraw_estimate(Balance share) const {
    return estimates_.withdraw_estimate(share);
}

U256 LiquidityManager::get_k() const {
    return invariant::get_k(state_.totals);
}

// =============================================================================
// Hook Registration
// =============================================================================

void LiquidityManager::register_hooks(IPoolHooks* hooks) {
    if (!hooks) return;
    if (std::find(hooks_.begin(), hooks_.end(), hooks) != hooks_.end()) return;
    hooks_.push_back(hooks);
}

void LiquidityManager::unregister_hooks(IPoolHooks* hooks) {
    hooks_.erase(std::remove(hooks_.begin(), hooks_.end(), hooks), hooks_.end());
}

// =============================================================================
// Statistics
// =============================================================================

LiquidityManager::Stats LiquidityManager::get_stats() const {
    return Stats{
        static_cast<uint64_t>(state_.ledger.account_count()),
        total_provides_,
        total_withdrawals_,
        total_faucets_,
        rejected_ops_
    };
}

// =============================================================================
// Internal Helpers
// =============================================================================

void LiquidityManager::commit(const Address& caller, const AccountState& account,
                              const PoolTotals& totals) {
    state_.totals = totals;
    state_.ledger.upsert(caller, account);

    if (!invariant::is_consistent(state_.totals)) {
        spdlog::error("pool totals inconsistent after commit: token1={} token2={} shares={}",
                      to_string(state_.totals.total_token1),
                      to_string(state_.totals.total_token2),
                      to_string(state_.totals.total_shares));
    }
}

int32_t LiquidityManager::reject(const char* op, const Address& caller, int32_t code) {
    ++rejected_ops_;
    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("{} rejected for {}: {}", op, to_hex(caller), error_string(code));
    }
    return code;
}

void LiquidityManager::notify(const PoolEvent& event) {
    if (hooks_.empty()) return;

    // Hooks may (un)register while running; one unregistered mid-dispatch
    // may already be destroyed and is skipped
    std::vector<IPoolHooks*> snapshot = hooks_;

    unlocked_ = false;
    try {
        for (IPoolHooks* hooks : snapshot) {
            if (std::find(hooks_.begin(), hooks_.end(), hooks) == hooks_.end()) continue;
            switch (event.kind) {
                case EventKind::LIQUIDITY_PROVIDED: hooks->after_provide(event); break;
                case EventKind::LIQUIDITY_WITHDRAWN: hooks->after_withdraw(event); break;
                case EventKind::FAUCET_CREDITED: hooks->after_faucet(event); break;
            }
        }
    } catch (...) {
        unlocked_ = true;
        throw;
    }
    unlocked_ = true;
}

} // namespace cpamm
