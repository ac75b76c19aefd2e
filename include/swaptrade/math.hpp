#ifndef SWAPTRADE_MATH_HPP
#define SWAPTRADE_MATH_HPP

#include "types.hpp"

namespace swaptrade {

// =============================================================================
// Checked 128-bit Arithmetic
// =============================================================================
//
// Every operation reports overflow through its return value and leaves
// `out` untouched on failure. Callers turn a false return into an error
// code; nothing wraps or saturates silently.

namespace math {

inline bool checked_add(I128 a, I128 b, I128& out) {
    I128 r;
    if (__builtin_add_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

inline bool checked_sub(I128 a, I128 b, I128& out) {
    I128 r;
    if (__builtin_sub_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

inline bool checked_mul(I128 a, I128 b, I128& out) {
    I128 r;
    if (__builtin_mul_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

// =============================================================================
// 256-bit Intermediate (two U128 limbs)
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
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

// Full 128x128 -> 256 product
U256 mul_u128(U128 a, U128 b);

// floor(num / denom); fails when denom == 0 or the quotient needs > 128 bits
bool div_u256_u128(const U256& num, U128 denom, U128& quot, U128* rem = nullptr);

// floor(a * b / denom) for non-negative operands, 256-bit exact.
// Fails on negative input, zero denominator or a quotient above I128_MAX.
bool mul_div(I128 a, I128 b, I128 denom, I128& out);

// a1 * b1 <= a2 * b2 for non-negative operands (exact)
bool product_le(I128 a1, I128 b1, I128 a2, I128 b2);

// floor(sqrt(a * b)) for non-negative operands
I128 isqrt_product(I128 a, I128 b);

} // namespace math

} // namespace swaptrade

#endif // SWAPTRADE_MATH_HPP
