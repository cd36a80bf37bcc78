// =============================================================================
// sqrt_price_math.cpp - Amount deltas and next-price computation
// =============================================================================

#include "clamm/sqrt_price_math.hpp"
#include "clamm/full_math.hpp"
#include "clamm/errors.hpp"

#include <utility>

namespace clamm {
namespace sqrt_price_math {

namespace {

const U512 U160_MAX = (U512(1) << 160) - 1;

U512 ceil_div(const U512& num, const U512& denom) {
    U512 q = num / denom;
    if (num % denom != 0) {
        q += 1;
    }
    return q;
}

U256 to_price(const U512& v) {
    if (v > U160_MAX) {
        throw ArithmeticOverflow("sqrt price exceeds 160 bits");
    }
    return v.convert_to<U256>();
}

// Rounds up so that the price moves less when adding token0 and more when
// removing it
U256 next_price_from_amount0_rounding_up(const U256& sqrt_price_x96, U128 liquidity,
                                         const U256& amount, bool add) {
    if (amount == 0) return sqrt_price_x96;

    U512 numerator1 = U512(full_math::to_u256(liquidity)) << 96;
    U512 price(sqrt_price_x96);
    U512 product = U512(amount) * price;

    if (add) {
        return to_price(ceil_div(numerator1 * price, numerator1 + product));
    }

    if (product >= numerator1) {
        throw ArithmeticOverflow("output exceeds token0 reserves of the range");
    }
    return to_price(ceil_div(numerator1 * price, numerator1 - product));
}

// Rounds down when adding token1 and up when removing it
U256 next_price_from_amount1_rounding_down(const U256& sqrt_price_x96, U128 liquidity,
                                           const U256& amount, bool add) {
    U512 wide_liquidity(full_math::to_u256(liquidity));
    U512 shifted = U512(amount) << 96;
    U512 price(sqrt_price_x96);

    if (add) {
        return to_price(price + shifted / wide_liquidity);
    }

    U512 quotient = ceil_div(shifted, wide_liquidity);
    if (price <= quotient) {
        throw ArithmeticOverflow("output exceeds token1 reserves of the range");
    }
    return to_price(price - quotient);
}

} // anonymous namespace

U256 get_amount0_delta(U256 sqrt_a_x96, U256 sqrt_b_x96, U128 liquidity, bool round_up) {
    if (sqrt_a_x96 > sqrt_b_x96) {
        std::swap(sqrt_a_x96, sqrt_b_x96);
    }
    if (sqrt_a_x96 == 0) {
        throw PriceOutOfRange("sqrt price is zero");
    }

    U256 numerator1 = full_math::to_u256(liquidity) << 96;
    U256 numerator2 = sqrt_b_x96 - sqrt_a_x96;

    if (round_up) {
        return full_math::div_rounding_up(
            full_math::mul_div_rounding_up(numerator1, numerator2, sqrt_b_x96),
            sqrt_a_x96);
    }
    return full_math::mul_div(numerator1, numerator2, sqrt_b_x96) / sqrt_a_x96;
}

U256 get_amount1_delta(U256 sqrt_a_x96, U256 sqrt_b_x96, U128 liquidity, bool round_up) {
    if (sqrt_a_x96 > sqrt_b_x96) {
        std::swap(sqrt_a_x96, sqrt_b_x96);
    }

    U256 wide_liquidity = full_math::to_u256(liquidity);
    U256 delta = sqrt_b_x96 - sqrt_a_x96;

    return round_up
        ? full_math::mul_div_rounding_up(wide_liquidity, delta, full_math::Q96)
        : full_math::mul_div(wide_liquidity, delta, full_math::Q96);
}

U256 get_next_sqrt_price_from_input(const U256& sqrt_price_x96, U128 liquidity,
                                    const U256& amount_in, bool zero_for_one) {
    if (sqrt_price_x96 == 0 || liquidity == 0) {
        throw ArithmeticOverflow("next price requires nonzero price and liquidity");
    }
    return zero_for_one
        ? next_price_from_amount0_rounding_up(sqrt_price_x96, liquidity, amount_in, true)
        : next_price_from_amount1_rounding_down(sqrt_price_x96, liquidity, amount_in, true);
}

U256 get_next_sqrt_price_from_output(const U256& sqrt_price_x96, U128 liquidity,
                                     const U256& amount_out, bool zero_for_one) {
    if (sqrt_price_x96 == 0 || liquidity == 0) {
        throw ArithmeticOverflow("next price requires nonzero price and liquidity");
    }
    return zero_for_one
        ? next_price_from_amount1_rounding_down(sqrt_price_x96, liquidity, amount_out, false)
        : next_price_from_amount0_rounding_up(sqrt_price_x96, liquidity, amount_out, false);
}

} // namespace sqrt_price_math
} // namespace clamm
