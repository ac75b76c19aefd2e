// =============================================================================
// math.cpp - 256-bit intermediate arithmetic for AMM pricing
// =============================================================================

#include "swaptrade/math.hpp"

namespace swaptrade {
namespace math {

// =============================================================================
// Multiplication
// =============================================================================

U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    // Cross products
    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// =============================================================================
// Division (restoring shift-subtract, one bit per step)
// =============================================================================

bool div_u256_u128(const U256& num, U128 denom, U128& quot, U128* rem) {
    if (denom == 0) return false;

    // Quotient fits in 128 bits only when the high limb is below the divisor
    if (num.hi >= denom) return false;

    if (num.hi == 0) {
        quot = num.lo / denom;
        if (rem) *rem = num.lo % denom;
        return true;
    }

    U128 r = num.hi;
    U128 q = 0;
    for (int i = 127; i >= 0; --i) {
        // r may temporarily need 129 bits; track the shifted-out bit
        bool carry = (r >> 127) != 0;
        r = (r << 1) | ((num.lo >> i) & 1);
        q <<= 1;
        if (carry || r >= denom) {
            r -= denom;  // Wraps correctly when carry is set
            q |= 1;
        }
    }

    quot = q;
    if (rem) *rem = r;
    return true;
}

// =============================================================================
// Safe mul_div
// =============================================================================

bool mul_div(I128 a, I128 b, I128 denom, I128& out) {
    if (a < 0 || b < 0 || denom <= 0) return false;

    U256 product = mul_u128(static_cast<U128>(a), static_cast<U128>(b));
    U128 q = 0;
    if (!div_u256_u128(product, static_cast<U128>(denom), q)) return false;
    if (q > static_cast<U128>(I128_MAX)) return false;

    out = static_cast<I128>(q);
    return true;
}

bool product_le(I128 a1, I128 b1, I128 a2, I128 b2) {
    U256 lhs = mul_u128(static_cast<U128>(a1), static_cast<U128>(b1));
    U256 rhs = mul_u128(static_cast<U128>(a2), static_cast<U128>(b2));
    return lhs <= rhs;
}

// =============================================================================
// Integer Square Root
// =============================================================================

I128 isqrt_product(I128 a, I128 b) {
    if (a <= 0 || b <= 0) return 0;

    U256 target = mul_u128(static_cast<U128>(a), static_cast<U128>(b));

    // Largest r with r*r <= target; r < 2^128 always holds
    U128 lo = 0;
    U128 hi = ~U128(0);
    while (lo < hi) {
        U128 mid = lo + (hi - lo) / 2 + 1;
        if (mul_u128(mid, mid) <= target) {
            lo = mid;
        } else {
            hi = mid - 1;
        }
    }

    return lo > static_cast<U128>(I128_MAX) ? I128_MAX : static_cast<I128>(lo);
}

} // namespace math
} // namespace swaptrade
