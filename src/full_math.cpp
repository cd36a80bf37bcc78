// =============================================================================
// full_math.cpp - mul_div with 512-bit intermediates
// =============================================================================

#include "clamm/full_math.hpp"
#include "clamm/errors.hpp"

namespace clamm {
namespace full_math {

namespace {

const U512 U256_MAX_WIDE = (U512(1) << 256) - 1;

U256 narrow(const U512& v) {
    if (v > U256_MAX_WIDE) {
        throw ArithmeticOverflow("full_math: result exceeds 256 bits");
    }
    return v.convert_to<U256>();
}

} // anonymous namespace

U256 mul_div(const U256& a, const U256& b, const U256& denom) {
    if (denom == 0) {
        throw ArithmeticOverflow("full_math: division by zero");
    }
    U512 product = U512(a) * U512(b);
    return narrow(product / U512(denom));
}

U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denom) {
    if (denom == 0) {
        throw ArithmeticOverflow("full_math: division by zero");
    }
    U512 product = U512(a) * U512(b);
    U512 wide_denom(denom);
    U512 result = product / wide_denom;
    if (product % wide_denom != 0) {
        result += 1;
    }
    return narrow(result);
}

U256 div_rounding_up(const U256& a, const U256& b) {
    if (b == 0) {
        throw ArithmeticOverflow("full_math: division by zero");
    }
    U256 result = a / b;
    if (a % b != 0) {
        result += 1;
    }
    return result;
}

U256 to_u256(U128 v) {
    U256 hi(static_cast<uint64_t>(v >> 64));
    U256 lo(static_cast<uint64_t>(v));
    return (hi << 64) | lo;
}

I256 to_i256(I128 v) {
    // Magnitude computed in unsigned space so INT128_MIN does not overflow
    U128 mag = v < 0 ? U128(0) - static_cast<U128>(v) : static_cast<U128>(v);
    I256 result = static_cast<I256>(to_u256(mag));
    return v < 0 ? I256(-result) : result;
}

U128 to_u128(const U256& v) {
    if (v > to_u256(U128_MAX)) {
        throw ArithmeticOverflow("full_math: value exceeds 128 bits");
    }
    const U256 mask64 = (U256(1) << 64) - 1;
    uint64_t hi = (v >> 64).convert_to<uint64_t>();
    uint64_t lo = (v & mask64).convert_to<uint64_t>();
    return (static_cast<U128>(hi) << 64) | lo;
}

U256 to_u256(const I256& v) {
    if (v < 0) {
        throw ArithmeticOverflow("full_math: negative value where unsigned expected");
    }
    return static_cast<U256>(v);
}

} // namespace full_math
} // namespace clamm
