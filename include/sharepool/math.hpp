#ifndef SHAREPOOL_MATH_HPP
#define SHAREPOOL_MATH_HPP

#include <optional>

#include "types.hpp"

namespace sharepool {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

namespace wide {

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}

    bool bit(int i) const {
        return i >= 128 ? ((hi >> (i - 128)) & 1) != 0 : ((lo >> i) & 1) != 0;
    }
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

struct DivResult {
    U128 quotient;
    U128 remainder;
    bool overflow;   // quotient did not fit in 128 bits
};

// Floor division of U256 by a non-zero U128 (restoring long division).
// The running remainder is kept below `denom`; `carry` holds the bit shifted
// out of it so the compare works for divisors with the top bit set.
inline DivResult div_u256_u128(const U256& num, U128 denom) {
    if (num.hi == 0) {
        return {num.lo / denom, num.lo % denom, false};
    }

    U128 quot = 0;
    U128 rem = 0;
    bool overflow = false;

    for (int i = 255; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | (num.bit(i) ? 1 : 0);
        if (carry || rem >= denom) {
            rem -= denom;  // wraps correctly when carry is set
            if (i >= 128) {
                overflow = true;
            } else {
                quot |= U128(1) << i;
            }
        }
    }
    return {quot, rem, overflow};
}

} // namespace wide

// =============================================================================
// mul_div: floor(a * b / denom) with a 256-bit intermediate
// =============================================================================

// Returns nullopt when denom is zero or the result exceeds 128 bits.
inline std::optional<U128> checked_mul_div(U128 a, U128 b, U128 denom) {
    if (denom == 0) return std::nullopt;
    wide::DivResult r = wide::div_u256_u128(wide::mul_u128(a, b), denom);
    if (r.overflow) return std::nullopt;
    return r.quotient;
}

// Caller guarantees denom != 0 and that the result fits.
inline U128 mul_div(U128 a, U128 b, U128 denom) {
    return wide::div_u256_u128(wide::mul_u128(a, b), denom).quotient;
}

inline std::optional<U128> checked_add(U128 a, U128 b) {
    if (a > U128_MAX - b) return std::nullopt;
    return a + b;
}

} // namespace sharepool

#endif // SHAREPOOL_MATH_HPP
