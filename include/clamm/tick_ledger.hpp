#ifndef CLAMM_TICK_LEDGER_HPP
#define CLAMM_TICK_LEDGER_HPP

#include <map>
#include <utility>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Tick Info
// =============================================================================

struct TickInfo {
    U128 liquidity_gross;    // Total liquidity referencing this tick
    I128 liquidity_net;      // Applied to active liquidity when crossed upward
    bool initialized;
};

// =============================================================================
// TickLedger - sparse tick -> TickInfo map
// Absent ticks read as zero-valued TickInfo.
// =============================================================================

class TickLedger {
public:
    explicit TickLedger(bool clear_initialized_on_empty = false);

    // Apply a position's liquidity change at one of its boundaries.
    // liquidity_delta > 0 adds liquidity, < 0 removes it; `upper` selects
    // which boundary the tick is (net is subtracted at the upper boundary).
    TickInfo record_liquidity_change(int32_t tick, I128 liquidity_delta, bool upper);

    // The TickInfo record_liquidity_change would store, without storing it.
    // Throws InsufficientLiquidity / ArithmeticOverflow.
    TickInfo updated(int32_t tick, I128 liquidity_delta, bool upper) const;

    // Publish a value computed by updated()
    void store(int32_t tick, const TickInfo& info);

    TickInfo get(int32_t tick) const;

    // Nearest initialized tick within `search_window` ticks of from_tick.
    // lte: search [from_tick - window, from_tick], highest first
    // !lte: search (from_tick, from_tick + window], lowest first
    // Returns {window boundary, false} when none is initialized.
    std::pair<int32_t, bool> find_next_initialized_tick(int32_t from_tick, bool lte,
                                                        int32_t search_window) const;

    size_t size() const { return ticks_.size(); }
    bool clears_initialized_on_empty() const { return clear_initialized_on_empty_; }

private:
    std::map<int32_t, TickInfo> ticks_;
    bool clear_initialized_on_empty_;
};

} // namespace clamm

#endif // CLAMM_TICK_LEDGER_HPP
