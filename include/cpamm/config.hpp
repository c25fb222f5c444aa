#ifndef CPAMM_CONFIG_HPP
#define CPAMM_CONFIG_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace cpamm {

// =============================================================================
// Pool Configuration
// =============================================================================

struct PoolConfig {
    Balance fee_basis_points = 0;   // Clamped to 0 when >= FEE_BPS_LIMIT
    std::string log_level = "info";

    PoolConfig() = default;

    // Load from JSON file; throws std::runtime_error
    static PoolConfig from_file(std::string_view path);

    // Load from JSON text; throws std::runtime_error
    //   { "fee_basis_points": 30 | "30", "log_level": "debug" }
    static PoolConfig from_json(std::string_view content);

    PoolConfig& with_fee(Balance bps) {
        fee_basis_points = bps;
        return *this;
    }

    PoolConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    // Fee as stored by the pool
    Balance effective_fee() const {
        return clamp_fee(fee_basis_points);
    }
};

} // namespace cpamm

#endif // CPAMM_CONFIG_HPP
