// =============================================================================
// ledger.cpp - AssetLedger Implementation
// =============================================================================

#include "cpamm/ledger.hpp"
#include "cpamm/math.hpp"

namespace cpamm {

// =============================================================================
// AccountState
// =============================================================================

Balance AccountState::get(AssetKind kind) const {
    switch (kind) {
        case AssetKind::TOKEN1: return token1;
        case AssetKind::TOKEN2: return token2;
        case AssetKind::SHARE: return shares;
    }
    return 0;
}

Balance& AccountState::get(AssetKind kind) {
    switch (kind) {
        case AssetKind::TOKEN1: return token1;
        case AssetKind::TOKEN2: return token2;
        case AssetKind::SHARE: break;
    }
    return shares;
}

// =============================================================================
// Queries
// =============================================================================

Balance AssetLedger::balance_of(const Address& account, AssetKind kind) const {
    auto it = accounts_.find(account);
    return it != accounts_.end() ? it->second.get(kind) : 0;
}

int32_t AssetLedger::check_amount(const Address& account, AssetKind kind, Balance amount) const {
    if (amount == 0) {
        return errors::ZERO_AMOUNT;
    }
    if (amount > balance_of(account, kind)) {
        return errors::INSUFFICIENT_AMOUNT;
    }
    return errors::OK;
}

AccountState AssetLedger::account(const Address& account) const {
    auto it = accounts_.find(account);
    return it != accounts_.end() ? it->second : AccountState{};
}

std::optional<AccountState> AssetLedger::find(const Address& account) const {
    auto it = accounts_.find(account);
    if (it == accounts_.end()) return std::nullopt;
    return it->second;
}

Balance AssetLedger::total_of(AssetKind kind) const {
    Balance total = 0;
    for (const auto& [addr, state] : accounts_) {
        total += state.get(kind);
    }
    return total;
}

// =============================================================================
// Mutations
// =============================================================================

int32_t AssetLedger::add_to(AccountState& state, AssetKind kind, Balance amount) {
    Balance& slot = state.get(kind);
    Balance next = 0;
    if (!checked_add(slot, amount, next)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    slot = next;
    return errors::OK;
}

int32_t AssetLedger::sub_from(AccountState& state, AssetKind kind, Balance amount) {
    Balance& slot = state.get(kind);
    Balance next = 0;
    if (!checked_sub(slot, amount, next)) {
        return errors::INSUFFICIENT_AMOUNT;
    }
    slot = next;
    return errors::OK;
}

int32_t AssetLedger::credit(const Address& account, AssetKind kind, Balance amount) {
    AccountState staged = this->account(account);
    int32_t rc = add_to(staged, kind, amount);
    if (rc != errors::OK) return rc;
    upsert(account, staged);
    return errors::OK;
}

int32_t AssetLedger::debit(const Address& account, AssetKind kind, Balance amount) {
    AccountState staged = this->account(account);
    int32_t rc = sub_from(staged, kind, amount);
    if (rc != errors::OK) return rc;
    upsert(account, staged);
    return errors::OK;
}

void AssetLedger::upsert(const Address& account, const AccountState& state) {
    accounts_[account] = state;
}

} // namespace cpamm
