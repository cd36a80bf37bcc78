// =============================================================================
// tick_ledger.cpp - Per-tick liquidity bookkeeping and bounded tick search
// =============================================================================

#include "clamm/tick_ledger.hpp"
#include "clamm/liquidity_math.hpp"
#include "clamm/tick_math.hpp"
#include "clamm/errors.hpp"

#include <algorithm>
#include <string>

namespace clamm {

TickLedger::TickLedger(bool clear_initialized_on_empty)
    : clear_initialized_on_empty_(clear_initialized_on_empty) {}

TickInfo TickLedger::get(int32_t tick) const {
    auto it = ticks_.find(tick);
    return it != ticks_.end() ? it->second : TickInfo{0, 0, false};
}

TickInfo TickLedger::updated(int32_t tick, I128 liquidity_delta, bool upper) const {
    TickInfo info = get(tick);
    U128 gross_before = info.liquidity_gross;

    info.liquidity_gross = liquidity_math::add_delta(gross_before, liquidity_delta);

    // Upper boundaries subtract the delta from net, lower boundaries add it
    I128 net = info.liquidity_net;
    bool overflow;
    if (upper) {
        overflow = liquidity_delta > 0 ? net < I128_MIN + liquidity_delta
                                       : net > I128_MAX + liquidity_delta;
    } else {
        overflow = liquidity_delta > 0 ? net > I128_MAX - liquidity_delta
                                       : net < I128_MIN - liquidity_delta;
    }
    if (overflow) {
        throw ArithmeticOverflow("liquidity_net overflow at tick " + std::to_string(tick));
    }
    info.liquidity_net = upper ? net - liquidity_delta : net + liquidity_delta;

    // Initialize tick if first liquidity
    if (gross_before == 0 && info.liquidity_gross > 0) {
        info.initialized = true;
    } else if (info.liquidity_gross == 0 && clear_initialized_on_empty_) {
        info.initialized = false;
    }

    return info;
}

void TickLedger::store(int32_t tick, const TickInfo& info) {
    if (clear_initialized_on_empty_ && info.liquidity_gross == 0) {
        ticks_.erase(tick);
        return;
    }
    ticks_[tick] = info;
}

TickInfo TickLedger::record_liquidity_change(int32_t tick, I128 liquidity_delta, bool upper) {
    TickInfo info = updated(tick, liquidity_delta, upper);
    store(tick, info);
    return info;
}

std::pair<int32_t, bool> TickLedger::find_next_initialized_tick(int32_t from_tick, bool lte,
                                                                int32_t search_window) const {
    if (search_window <= 0) {
        throw ValidationError("tick search window must be positive");
    }

    if (lte) {
        // Moving down: highest initialized tick in [from - window, from]
        int32_t boundary = static_cast<int32_t>(std::max<int64_t>(
            static_cast<int64_t>(from_tick) - search_window, tick_math::MIN_TICK));
        auto it = ticks_.upper_bound(from_tick);
        while (it != ticks_.begin()) {
            --it;
            if (it->first < boundary) break;
            if (it->second.initialized) {
                return {it->first, true};
            }
        }
        return {boundary, false};
    }

    // Moving up: lowest initialized tick in (from, from + window]
    int32_t boundary = static_cast<int32_t>(std::min<int64_t>(
        static_cast<int64_t>(from_tick) + search_window, tick_math::MAX_TICK));
    for (auto it = ticks_.upper_bound(from_tick); it != ticks_.end() && it->first <= boundary; ++it) {
        if (it->second.initialized) {
            return {it->first, true};
        }
    }
    return {boundary, false};
}

} // namespace clamm
