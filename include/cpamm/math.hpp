#ifndef CPAMM_MATH_HPP
#define CPAMM_MATH_HPP

#include "types.hpp"

namespace cpamm {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

// Multiply two U128 values to produce U256
inline U256 mul_u128(U128 a, U128 b) {
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// Floor division of U256 by U128.
// Returns false when denom is zero or the quotient needs more than 128 bits.
inline bool div_u256_u128(const U256& num, U128 denom, U128& quot) {
    if (denom == 0) return false;
    if (num.hi == 0) {
        quot = num.lo / denom;
        return true;
    }
    if (num.hi >= denom) return false;

    // Restoring long division over the low limb; rem < denom on entry to each step
    U128 rem = num.hi;
    U128 q = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        q <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;
            q |= 1;
        }
    }
    quot = q;
    return true;
}

// floor(a * b / denom) without intermediate overflow
inline bool mul_div(U128 a, U128 b, U128 denom, U128& out) {
    return div_u256_u128(mul_u128(a, b), denom, out);
}

// =============================================================================
// Checked 128-bit add/sub
// =============================================================================

inline bool checked_add(U128 a, U128 b, U128& out) {
    if (b > U128_MAX - a) return false;
    out = a + b;
    return true;
}

inline bool checked_sub(U128 a, U128 b, U128& out) {
    if (b > a) return false;
    out = a - b;
    return true;
}

} // namespace cpamm

#endif // CPAMM_MATH_HPP
