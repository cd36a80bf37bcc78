// =============================================================================
// liquidity_math.cpp - Liquidity <-> token amount conversion
// =============================================================================

#include "clamm/liquidity_math.hpp"
#include "clamm/sqrt_price_math.hpp"
#include "clamm/full_math.hpp"
#include "clamm/errors.hpp"

#include <algorithm>

namespace clamm {
namespace liquidity_math {

namespace {

U256 liquidity_for_amount0(const U256& sqrt_a, const U256& sqrt_b, const U256& amount0) {
    U256 intermediate = full_math::mul_div(sqrt_a, sqrt_b, full_math::Q96);
    return full_math::mul_div(amount0, intermediate, sqrt_b - sqrt_a);
}

U256 liquidity_for_amount1(const U256& sqrt_a, const U256& sqrt_b, const U256& amount1) {
    return full_math::mul_div(amount1, full_math::Q96, sqrt_b - sqrt_a);
}

} // anonymous namespace

std::pair<U256, U256> get_amounts_for_liquidity(
    const U256& sqrt_price_x96,
    U256 sqrt_price_a_x96,
    U256 sqrt_price_b_x96,
    U128 liquidity,
    bool round_up
) {
    if (sqrt_price_a_x96 > sqrt_price_b_x96) {
        std::swap(sqrt_price_a_x96, sqrt_price_b_x96);
    }

    U256 amount0 = 0, amount1 = 0;

    if (sqrt_price_x96 <= sqrt_price_a_x96) {
        // Below range
        amount0 = sqrt_price_math::get_amount0_delta(
            sqrt_price_a_x96, sqrt_price_b_x96, liquidity, round_up);
    } else if (sqrt_price_x96 < sqrt_price_b_x96) {
        // In range
        amount0 = sqrt_price_math::get_amount0_delta(
            sqrt_price_x96, sqrt_price_b_x96, liquidity, round_up);
        amount1 = sqrt_price_math::get_amount1_delta(
            sqrt_price_a_x96, sqrt_price_x96, liquidity, round_up);
    } else {
        // Above range
        amount1 = sqrt_price_math::get_amount1_delta(
            sqrt_price_a_x96, sqrt_price_b_x96, liquidity, round_up);
    }

    return {amount0, amount1};
}

U128 get_liquidity_for_amounts(
    const U256& sqrt_price_x96,
    U256 sqrt_price_a_x96,
    U256 sqrt_price_b_x96,
    const U256& amount0,
    const U256& amount1
) {
    if (sqrt_price_a_x96 > sqrt_price_b_x96) {
        std::swap(sqrt_price_a_x96, sqrt_price_b_x96);
    }

    U256 liquidity;
    if (sqrt_price_x96 <= sqrt_price_a_x96) {
        liquidity = liquidity_for_amount0(sqrt_price_a_x96, sqrt_price_b_x96, amount0);
    } else if (sqrt_price_x96 < sqrt_price_b_x96) {
        U256 liquidity0 = liquidity_for_amount0(sqrt_price_x96, sqrt_price_b_x96, amount0);
        U256 liquidity1 = liquidity_for_amount1(sqrt_price_a_x96, sqrt_price_x96, amount1);
        liquidity = liquidity0 < liquidity1 ? liquidity0 : liquidity1;
    } else {
        liquidity = liquidity_for_amount1(sqrt_price_a_x96, sqrt_price_b_x96, amount1);
    }

    return full_math::to_u128(liquidity);
}

U128 add_delta(U128 liquidity, I128 delta) {
    if (delta < 0) {
        U128 magnitude = U128(0) - static_cast<U128>(delta);
        if (magnitude > liquidity) {
            throw InsufficientLiquidity("liquidity would go negative");
        }
        return liquidity - magnitude;
    }
    U128 magnitude = static_cast<U128>(delta);
    if (magnitude > U128_MAX - liquidity) {
        throw ArithmeticOverflow("liquidity exceeds 2^128 - 1");
    }
    return liquidity + magnitude;
}

} // namespace liquidity_math
} // namespace clamm
