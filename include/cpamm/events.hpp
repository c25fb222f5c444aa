#ifndef CPAMM_EVENTS_HPP
#define CPAMM_EVENTS_HPP

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace cpamm {

// =============================================================================
// Pool Events (committed state transitions)
// =============================================================================

enum class EventKind : uint8_t {
    LIQUIDITY_PROVIDED = 0,
    LIQUIDITY_WITHDRAWN = 1,
    FAUCET_CREDITED = 2
};

const char* to_string(EventKind kind);

struct PoolEvent {
    EventKind kind;
    Address caller;
    Balance amount_token1;
    Balance amount_token2;
    Balance shares;          // Minted or burned; 0 for faucet
    PoolTotals totals;       // Pool state after the commit
};

// Balances as decimal strings, caller as 0x-hex
void to_json(nlohmann::json& j, const PoolEvent& event);

// =============================================================================
// Hook Interface
// =============================================================================

// Called after a successful commit only. Mutating calls back into the
// pool from inside a hook are rejected with errors::REENTRANCY.
class IPoolHooks {
public:
    virtual ~IPoolHooks() = default;

    virtual void after_provide(const PoolEvent&) {}
    virtual void after_withdraw(const PoolEvent&) {}
    virtual void after_faucet(const PoolEvent&) {}
};

// Writes every event to the default logger as one JSON line
class LoggingHooks : public IPoolHooks {
public:
    void after_provide(const PoolEvent& event) override;
    void after_withdraw(const PoolEvent& event) override;
    void after_faucet(const PoolEvent& event) override;

private:
    static void log_event(const PoolEvent& event);
};

} // namespace cpamm

#endif // CPAMM_EVENTS_HPP
