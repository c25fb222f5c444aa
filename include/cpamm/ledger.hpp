#ifndef CPAMM_LEDGER_HPP
#define CPAMM_LEDGER_HPP

#include <unordered_map>
#include <optional>

#include "types.hpp"

namespace cpamm {

// =============================================================================
// Account State
// =============================================================================

struct AccountState {
    Balance token1 = 0;   // Off-pool token1 available to deposit
    Balance token2 = 0;   // Off-pool token2 available to deposit
    Balance shares = 0;   // Pool ownership

    Balance get(AssetKind kind) const;
    Balance& get(AssetKind kind);

    bool operator==(const AccountState& other) const {
        return token1 == other.token1 && token2 == other.token2 && shares == other.shares;
    }
    bool operator!=(const AccountState& other) const { return !(*this == other); }
};

// =============================================================================
// AssetLedger - per-caller token and share balances, absent == zero
// =============================================================================

class AssetLedger {
public:
    AssetLedger() = default;

    // Balance lookup (0 for unseen accounts)
    Balance balance_of(const Address& account, AssetKind kind) const;

    // ZERO_AMOUNT if amount == 0, INSUFFICIENT_AMOUNT if amount > balance
    int32_t check_amount(const Address& account, AssetKind kind, Balance amount) const;

    // In-place mutations; state is unchanged on error
    int32_t credit(const Address& account, AssetKind kind, Balance amount);
    int32_t debit(const Address& account, AssetKind kind, Balance amount);

    // Staging: copy out (zero record if unseen), modify, write back with upsert()
    AccountState account(const Address& account) const;
    void upsert(const Address& account, const AccountState& state);

    std::optional<AccountState> find(const Address& account) const;
    size_t account_count() const { return accounts_.size(); }

    // Sum of one asset across every account
    Balance total_of(AssetKind kind) const;

    // Value-level helpers for staged updates
    static int32_t add_to(AccountState& state, AssetKind kind, Balance amount);
    static int32_t sub_from(AccountState& state, AssetKind kind, Balance amount);

private:
    std::unordered_map<Address, AccountState, AddressHash> accounts_;
};

} // namespace cpamm

#endif // CPAMM_LEDGER_HPP
