// =============================================================================
// swap_math.cpp - Single swap step (constant product within one segment)
// =============================================================================

#include "clamm/swap_math.hpp"
#include "clamm/sqrt_price_math.hpp"
#include "clamm/full_math.hpp"

namespace clamm {
namespace swap_math {

SwapStep compute_swap_step(const U256& sqrt_price_current_x96,
                           const U256& sqrt_price_target_x96,
                           U128 liquidity,
                           const I256& amount_remaining,
                           uint32_t fee_pips) {
    SwapStep step{};

    bool zero_for_one = sqrt_price_current_x96 >= sqrt_price_target_x96;
    bool exact_in = amount_remaining >= 0;

    const U256 fee_denominator(fees::FEE_DENOMINATOR);
    const U256 fee(fee_pips);

    // No liquidity: move price directly to target
    if (liquidity == 0) {
        step.sqrt_price_next_x96 = sqrt_price_target_x96;
        return step;
    }

    U256 remaining_abs = full_math::to_u256(exact_in ? amount_remaining : I256(-amount_remaining));

    if (exact_in) {
        U256 amount_remaining_less_fee =
            full_math::mul_div(remaining_abs, fee_denominator - fee, fee_denominator);
        step.amount_in = zero_for_one
            ? sqrt_price_math::get_amount0_delta(sqrt_price_target_x96, sqrt_price_current_x96, liquidity, true)
            : sqrt_price_math::get_amount1_delta(sqrt_price_current_x96, sqrt_price_target_x96, liquidity, true);
        if (amount_remaining_less_fee >= step.amount_in) {
            step.sqrt_price_next_x96 = sqrt_price_target_x96;
        } else {
            step.sqrt_price_next_x96 = sqrt_price_math::get_next_sqrt_price_from_input(
                sqrt_price_current_x96, liquidity, amount_remaining_less_fee, zero_for_one);
        }
    } else {
        step.amount_out = zero_for_one
            ? sqrt_price_math::get_amount1_delta(sqrt_price_target_x96, sqrt_price_current_x96, liquidity, false)
            : sqrt_price_math::get_amount0_delta(sqrt_price_current_x96, sqrt_price_target_x96, liquidity, false);
        if (remaining_abs >= step.amount_out) {
            step.sqrt_price_next_x96 = sqrt_price_target_x96;
        } else {
            step.sqrt_price_next_x96 = sqrt_price_math::get_next_sqrt_price_from_output(
                sqrt_price_current_x96, liquidity, remaining_abs, zero_for_one);
        }
    }

    bool reached_target = sqrt_price_target_x96 == step.sqrt_price_next_x96;

    // Recompute amounts for the actual segment travelled
    if (zero_for_one) {
        if (!(reached_target && exact_in)) {
            step.amount_in = sqrt_price_math::get_amount0_delta(
                step.sqrt_price_next_x96, sqrt_price_current_x96, liquidity, true);
        }
        if (!(reached_target && !exact_in)) {
            step.amount_out = sqrt_price_math::get_amount1_delta(
                step.sqrt_price_next_x96, sqrt_price_current_x96, liquidity, false);
        }
    } else {
        if (!(reached_target && exact_in)) {
            step.amount_in = sqrt_price_math::get_amount1_delta(
                sqrt_price_current_x96, step.sqrt_price_next_x96, liquidity, true);
        }
        if (!(reached_target && !exact_in)) {
            step.amount_out = sqrt_price_math::get_amount0_delta(
                sqrt_price_current_x96, step.sqrt_price_next_x96, liquidity, false);
        }
    }

    // Never pay out more than requested
    if (!exact_in && step.amount_out > remaining_abs) {
        step.amount_out = remaining_abs;
    }

    if (exact_in && !reached_target) {
        step.fee_amount = remaining_abs - step.amount_in;
    } else {
        step.fee_amount = full_math::mul_div_rounding_up(step.amount_in, fee, fee_denominator - fee);
    }

    return step;
}

} // namespace swap_math
} // namespace clamm
