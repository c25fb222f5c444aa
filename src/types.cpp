// =============================================================================
// types.cpp - Address, balance and error-code helpers
// =============================================================================

#include "cpamm/types.hpp"
#include <algorithm>

namespace cpamm {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Address
// =============================================================================

std::string to_hex(const Address& addr) {
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::optional<Address> address_from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    Address addr = {};
    if (hex.size() != addr.size() * 2) return std::nullopt;

    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

// =============================================================================
// 128-bit Decimal Conversion
// =============================================================================

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<U128> parse_u128(std::string_view s) {
    if (s.empty()) return std::nullopt;

    U128 value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (value > (U128_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

// =============================================================================
// Enum / Error Names
// =============================================================================

const char* to_string(AssetKind kind) {
    switch (kind) {
        case AssetKind::TOKEN1: return "token1";
        case AssetKind::TOKEN2: return "token2";
        case AssetKind::SHARE: return "share";
    }
    return "unknown";
}

const char* error_string(int32_t code) {
    switch (code) {
        case errors::OK: return "ok";
        case errors::ZERO_LIQUIDITY: return "zero liquidity";
        case errors::ZERO_AMOUNT: return "amount cannot be zero";
        case errors::INSUFFICIENT_AMOUNT: return "insufficient amount";
        case errors::NON_EQUIVALENT_VALUE: return "equivalent value of tokens not provided";
        case errors::THRESHOLD_NOT_REACHED: return "share below contribution threshold";
        case errors::INVALID_SHARE: return "share exceeds total shares";
        case errors::INSUFFICIENT_LIQUIDITY: return "insufficient pool liquidity";
        case errors::SLIPPAGE_EXCEEDED: return "slippage tolerance exceeded";
        case errors::ARITHMETIC_OVERFLOW: return "arithmetic overflow";
        case errors::REENTRANCY: return "reentrant call";
    }
    return "unknown error";
}

} // namespace cpamm
