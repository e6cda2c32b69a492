// =============================================================================
// math.cpp - Full-Width Fixed-Point Helpers
// =============================================================================

#include "peerlend/math.hpp"

#include <stdexcept>

namespace peerlend {

namespace {

constexpr U128 LOW64 = (static_cast<U128>(1) << 64) - 1;

// 128 x 128 -> 256-bit product as (hi, lo)
void mul_wide(U128 a, U128 b, U128& hi, U128& lo) {
    U128 a0 = a & LOW64, a1 = a >> 64;
    U128 b0 = b & LOW64, b1 = b >> 64;

    U128 p00 = a0 * b0;
    U128 p01 = a0 * b1;
    U128 p10 = a1 * b0;
    U128 p11 = a1 * b1;

    U128 mid = (p00 >> 64) + (p01 & LOW64) + (p10 & LOW64);
    lo = (p00 & LOW64) | (mid << 64);
    hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
}

} // namespace

U128 checked_add(U128 a, U128 b) {
    if (a > U128_MAX - b) {
        throw std::overflow_error("checked_add: sum exceeds 128 bits");
    }
    return a + b;
}

U128 mul_div(U128 a, U128 b, U128 d, bool round_up) {
    if (d == 0) {
        throw std::domain_error("mul_div: division by zero");
    }

    U128 hi = 0, lo = 0;
    mul_wide(a, b, hi, lo);

    if (hi == 0) {
        U128 q = lo / d;
        if (round_up && lo % d != 0) ++q;
        return q;
    }

    if (hi >= d) {
        throw std::overflow_error("mul_div: result exceeds 128 bits");
    }

    // Shift-subtract long division of (hi, lo) by d; hi < d keeps q in range
    U128 q = 0;
    U128 r = hi;
    for (int i = 127; i >= 0; --i) {
        bool carry = (r >> 127) != 0;
        r = (r << 1) | ((lo >> i) & 1);
        q <<= 1;
        if (carry || r >= d) {
            r -= d;
            q |= 1;
        }
    }

    if (round_up && r != 0) {
        if (q == ~static_cast<U128>(0)) {
            throw std::overflow_error("mul_div: rounded result exceeds 128 bits");
        }
        ++q;
    }
    return q;
}

namespace x18 {

U128 from_double(double v) {
    if (v <= 0) return 0;
    return static_cast<U128>(v * static_cast<double>(X18_ONE));
}

double to_double(U128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

} // namespace x18

namespace bps {

U128 weighted_avg(U128 x, U128 y, uint32_t pct) {
    if (pct > constants::MAX_BPS) pct = constants::MAX_BPS;
    return mul_div(x, constants::MAX_BPS - pct, constants::MAX_BPS, false) +
           mul_div(y, pct, constants::MAX_BPS, false);
}

} // namespace bps

} // namespace peerlend
