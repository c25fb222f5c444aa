#ifndef CPAMM_TYPES_HPP
#define CPAMM_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>
#include <optional>

namespace cpamm {

// =============================================================================
// Caller Identity (opaque 20-byte account address)
// =============================================================================

using Address = std::array<uint8_t, 20>;

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        uint64_t h = 0;
        for (uint8_t b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// Address with the low 8 bytes set from an integer id (big-endian)
constexpr Address address_from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional "0x" prefix; requires exactly 40 hex digits
std::optional<Address> address_from_hex(std::string_view hex);

// =============================================================================
// Balances (unsigned 128-bit, integer units)
// =============================================================================

using U128 = unsigned __int128;
using Balance = U128;

// Share amounts carry 6 implied decimal places
constexpr Balance PRECISION = 1000000;

// Shares minted for the first deposit into an empty pool
constexpr Balance GENESIS_SHARES = 100 * PRECISION;

// Fee parameter upper bound (exclusive), in basis points
constexpr Balance FEE_BPS_LIMIT = 1000;

// Out-of-range fees are stored as 0
constexpr Balance clamp_fee(Balance bps) {
    return bps >= FEE_BPS_LIMIT ? 0 : bps;
}

constexpr U128 U128_MAX = ~U128(0);

// Decimal rendering (fmt/json have no portable 128-bit support)
std::string to_string(U128 v);

// Decimal digits only, no sign, no whitespace; nullopt on overflow
std::optional<U128> parse_u128(std::string_view s);

// =============================================================================
// Asset Kinds
// =============================================================================

enum class AssetKind : uint8_t {
    TOKEN1 = 0,
    TOKEN2 = 1,
    SHARE = 2
};

const char* to_string(AssetKind kind);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t ZERO_LIQUIDITY = -1;
constexpr int32_t ZERO_AMOUNT = -2;
constexpr int32_t INSUFFICIENT_AMOUNT = -3;
constexpr int32_t NON_EQUIVALENT_VALUE = -4;
constexpr int32_t THRESHOLD_NOT_REACHED = -5;
constexpr int32_t INVALID_SHARE = -6;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -7;  // reserved for swaps
constexpr int32_t SLIPPAGE_EXCEEDED = -8;       // reserved for swaps
constexpr int32_t ARITHMETIC_OVERFLOW = -9;
constexpr int32_t REENTRANCY = -30;
}

const char* error_string(int32_t code);

// =============================================================================
// Operation Results
// =============================================================================

struct AmountResult {
    int32_t status;
    Balance amount;

    bool ok() const { return status == errors::OK; }
};

struct WithdrawResult {
    int32_t status;
    Balance amount_token1;
    Balance amount_token2;

    bool ok() const { return status == errors::OK; }
};

// =============================================================================
// Query Views
// =============================================================================

struct Holdings {
    Balance token1;
    Balance token2;
    Balance shares;
};

struct PoolDetails {
    Balance total_token1;
    Balance total_token2;
    Balance total_shares;
    Balance fee_basis_points;
};

// Aggregate pool quantities
struct PoolTotals {
    Balance total_shares = 0;
    Balance total_token1 = 0;
    Balance total_token2 = 0;

    bool operator==(const PoolTotals& other) const {
        return total_shares == other.total_shares &&
               total_token1 == other.total_token1 &&
               total_token2 == other.total_token2;
    }
    bool operator!=(const PoolTotals& other) const { return !(*this == other); }
};

} // namespace cpamm

#endif // CPAMM_TYPES_HPP
