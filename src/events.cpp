// =============================================================================
// events.cpp - Pool event serialization and logging hooks
// =============================================================================

#include "cpamm/events.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cpamm {

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::LIQUIDITY_PROVIDED: return "liquidity_provided";
        case EventKind::LIQUIDITY_WITHDRAWN: return "liquidity_withdrawn";
        case EventKind::FAUCET_CREDITED: return "faucet_credited";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const PoolEvent& event) {
    j = nlohmann::json{
        {"event", to_string(event.kind)},
        {"caller", to_hex(event.caller)},
        {"amount_token1", to_string(event.amount_token1)},
        {"amount_token2", to_string(event.amount_token2)},
        {"shares", to_string(event.shares)},
        {"pool", {
            {"total_token1", to_string(event.totals.total_token1)},
            {"total_token2", to_string(event.totals.total_token2)},
            {"total_shares", to_string(event.totals.total_shares)}
        }}
    };
}

// =============================================================================
// LoggingHooks
// =============================================================================

void LoggingHooks::after_provide(const PoolEvent& event) { log_event(event); }
void LoggingHooks::after_withdraw(const PoolEvent& event) { log_event(event); }
void LoggingHooks::after_faucet(const PoolEvent& event) { log_event(event); }

void LoggingHooks::log_event(const PoolEvent& event) {
    nlohmann::json j = event;
    spdlog::info("{}", j.dump());
}

} // namespace cpamm
