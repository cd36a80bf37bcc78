// =============================================================================
// tick_math.cpp - Tick <-> Q64.96 sqrt price conversion
// =============================================================================

#include "clamm/tick_math.hpp"
#include "clamm/errors.hpp"

#include <array>
#include <limits>
#include <string>

namespace clamm {
namespace tick_math {

namespace {

// sqrt(1.0001)^(-2^i) as Q128.128 for i = 0..19
const std::array<U256, 20>& ratio_table() {
    static const std::array<U256, 20> table = {
        U256("0xfffcb933bd6fad37aa2d162d1a594001"),
        U256("0xfff97272373d413259a46990580e213a"),
        U256("0xfff2e50f5f656932ef12357cf3c7fdcc"),
        U256("0xffe5caca7e10e4e61c3624eaa0941cd0"),
        U256("0xffcb9843d60f6159c9db58835c926644"),
        U256("0xff973b41fa98c081472e6896dfb254c0"),
        U256("0xff2ea16466c96a3843ec78b326b52861"),
        U256("0xfe5dee046a99a2a811c461f1969c3053"),
        U256("0xfcbe86c7900a88aedcffc83b479aa3a4"),
        U256("0xf987a7253ac413176f2b074cf7815e54"),
        U256("0xf3392b0822b70005940c7a398e4b70f3"),
        U256("0xe7159475a2c29b7443b29c7fa6e889d9"),
        U256("0xd097f3bdfd2022b8845ad8f792aa5825"),
        U256("0xa9f746462d870fdf8a65dc1f90e061e5"),
        U256("0x70d869a156d2a1b890bb3df62baf32f7"),
        U256("0x31be135f97d08fd981231505542fcfa6"),
        U256("0x9aa508b5b7a84e1c677de54f3e99bc9"),
        U256("0x5d6af8dedb81196699c329225ee604"),
        U256("0x2216e584f5fa1ea926041bedfe98"),
        U256("0x48a170391f7dc42444e8fa2"),
    };
    return table;
}

} // anonymous namespace

U256 get_sqrt_ratio_at_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        throw PriceOutOfRange("tick " + std::to_string(tick) + " out of range");
    }

    uint32_t abs_tick = tick < 0 ? static_cast<uint32_t>(-static_cast<int64_t>(tick))
                                 : static_cast<uint32_t>(tick);
    const auto& table = ratio_table();

    // Bit-decomposition power series in Q128.128
    U256 ratio = (abs_tick & 0x1) != 0 ? table[0] : (U256(1) << 128);
    for (size_t i = 1; i < table.size(); ++i) {
        if ((abs_tick & (1u << i)) != 0) {
            ratio = (ratio * table[i]) >> 128;
        }
    }

    // Table holds reciprocals; invert for positive ticks
    if (tick > 0) {
        ratio = (std::numeric_limits<U256>::max)() / ratio;
    }

    // Q128.128 -> Q64.96, rounding up so the inverse lookup stays consistent
    U256 remainder = ratio & ((U256(1) << 32) - 1);
    return (ratio >> 32) + (remainder == 0 ? 0 : 1);
}

int32_t get_tick_at_sqrt_ratio(const U256& sqrt_price_x96) {
    if (sqrt_price_x96 < MIN_SQRT_RATIO || sqrt_price_x96 > MAX_SQRT_RATIO) {
        throw PriceOutOfRange("sqrt price out of range");
    }

    // Binary search over the strictly increasing forward mapping
    int64_t lo = MIN_TICK;
    int64_t hi = MAX_TICK;
    while (lo < hi) {
        int64_t mid = lo + (hi - lo + 1) / 2;
        if (get_sqrt_ratio_at_tick(static_cast<int32_t>(mid)) <= sqrt_price_x96) {
            lo = mid;
        } else {
            hi = mid - 1;
        }
    }
    return static_cast<int32_t>(lo);
}

double price_from_sqrt_ratio(const U256& sqrt_price_x96) {
    // Split at 2^48 twice to stay within double range
    double sqrt_price = sqrt_price_x96.convert_to<double>();
    sqrt_price /= static_cast<double>(1ULL << 48);
    sqrt_price /= static_cast<double>(1ULL << 48);
    return sqrt_price * sqrt_price;
}

void check_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        throw ValidationError("tick out of range: " + std::to_string(tick));
    }
}

void check_ticks(int32_t tick_lower, int32_t tick_upper) {
    if (tick_lower >= tick_upper) {
        throw ValidationError("invalid tick range: [" + std::to_string(tick_lower) +
                              ", " + std::to_string(tick_upper) + ")");
    }
    check_tick(tick_lower);
    check_tick(tick_upper);
}

} // namespace tick_math
} // namespace clamm
