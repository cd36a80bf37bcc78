// =============================================================================
// pool.cpp - PoolEngine: mint, burn and cross-tick swap
// =============================================================================

#include "clamm/pool.hpp"
#include "clamm/errors.hpp"
#include "clamm/full_math.hpp"
#include "clamm/tick_math.hpp"
#include "clamm/liquidity_math.hpp"
#include "clamm/swap_math.hpp"

#include <algorithm>

namespace clamm {

namespace {

I128 to_liquidity_delta(U128 amount) {
    if (amount == 0) {
        throw ValidationError("liquidity amount must be positive", errors::ZERO_AMOUNT);
    }
    if (amount > static_cast<U128>(I128_MAX)) {
        throw ArithmeticOverflow("liquidity amount exceeds 2^127 - 1");
    }
    return static_cast<I128>(amount);
}

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

PoolEngine::PoolEngine(const PoolConfig& config, ICustody& custody, IShareLedger& shares,
                       IPoolObserver* observer)
    : token0_(config.token0),
      token1_(config.token1),
      tick_search_window_(config.tick_search_window),
      custody_(custody),
      shares_(shares),
      observer_(observer),
      state_{},
      ticks_(config.clear_initialized_on_empty) {
    // Validate: currencies must be sorted
    if (!(config.token0 < config.token1)) {
        throw ValidationError("token0 must sort below token1", errors::CURRENCIES_NOT_SORTED);
    }

    // Validate: sqrt price in valid range
    if (config.initial_sqrt_price_x96 < tick_math::MIN_SQRT_RATIO ||
        config.initial_sqrt_price_x96 >= tick_math::MAX_SQRT_RATIO) {
        throw PriceOutOfRange("initial sqrt price out of range: " +
                              config.initial_sqrt_price_x96.str());
    }

    config.validate();

    state_.sqrt_price_x96 = config.initial_sqrt_price_x96;
    state_.tick = tick_math::get_tick_at_sqrt_ratio(config.initial_sqrt_price_x96);
    state_.liquidity = 0;
    state_.fee_growth_global0_x128 = 0;
    state_.fee_growth_global1_x128 = 0;
    state_.unlocked = true;
}

// =============================================================================
// Locking
// =============================================================================

PoolEngine::OperationGuard::OperationGuard(PoolEngine& engine)
    : engine_(engine), lock_(engine.mutex_, std::defer_lock) {
    if (engine_.owner_.load() == std::this_thread::get_id()) {
        throw ReentrancyError("pool operation already in progress");
    }
    lock_.lock();
    engine_.owner_.store(std::this_thread::get_id());
    engine_.state_.unlocked = false;
}

PoolEngine::OperationGuard::~OperationGuard() {
    engine_.state_.unlocked = true;
    engine_.owner_.store(std::thread::id());
}

std::shared_lock<std::shared_mutex> PoolEngine::read_lock() const {
    if (owner_.load() == std::this_thread::get_id()) {
        return std::shared_lock<std::shared_mutex>(mutex_, std::defer_lock);
    }
    return std::shared_lock<std::shared_mutex>(mutex_);
}

PriceSnapshot PoolEngine::snapshot() const {
    return PriceSnapshot{state_.sqrt_price_x96, state_.tick, state_.liquidity};
}

void PoolEngine::notify(const AuditRecord& record) noexcept {
    if (observer_) {
        observer_->on_record(record);
    }
}

// =============================================================================
// Mint
// =============================================================================

MintResult PoolEngine::mint(const Address& caller, int32_t tick_lower, int32_t tick_upper,
                            U128 amount, const U256& amount0_max, const U256& amount1_max) {
    tick_math::check_ticks(tick_lower, tick_upper);
    I128 liquidity_delta = to_liquidity_delta(amount);

    U256 sqrt_price_lower = tick_math::get_sqrt_ratio_at_tick(tick_lower);
    U256 sqrt_price_upper = tick_math::get_sqrt_ratio_at_tick(tick_upper);

    AuditRecord record{};
    MintResult result{};
    {
        OperationGuard guard(*this);
        record.before = snapshot();

        auto [amount0, amount1] = liquidity_math::get_amounts_for_liquidity(
            state_.sqrt_price_x96, sqrt_price_lower, sqrt_price_upper, amount, true);

        if (amount0 > amount0_max || amount1 > amount1_max) {
            throw SlippageExceeded("mint requires " + amount0.str() + " token0 and " +
                                   amount1.str() + " token1");
        }

        // Stage ledger changes
        TickInfo lower = ticks_.updated(tick_lower, liquidity_delta, false);
        TickInfo upper = ticks_.updated(tick_upper, liquidity_delta, true);

        U128 liquidity_after = state_.liquidity;
        if (state_.tick >= tick_lower && state_.tick < tick_upper) {
            liquidity_after = liquidity_math::add_delta(state_.liquidity, liquidity_delta);
        }

        PositionKey key{caller, tick_lower, tick_upper};
        Position position = positions_.updated(key, liquidity_delta);

        // Settle: pull both tokens, then issue shares
        if (amount0 > 0) {
            custody_.debit(caller, token0_, amount0);
        }
        try {
            if (amount1 > 0) {
                custody_.debit(caller, token1_, amount1);
            }
            try {
                shares_.mint(caller, amount);
            } catch (...) {
                if (amount1 > 0) custody_.refund(caller, token1_, amount1);
                throw;
            }
        } catch (...) {
            if (amount0 > 0) custody_.refund(caller, token0_, amount0);
            throw;
        }

        // Commit
        ticks_.store(tick_lower, lower);
        ticks_.store(tick_upper, upper);
        positions_.store(key, position);
        state_.liquidity = liquidity_after;

        result = MintResult{amount0, amount1};

        record.kind = AuditKind::Mint;
        record.actor = caller;
        record.tick_lower = tick_lower;
        record.tick_upper = tick_upper;
        record.liquidity = amount;
        record.delta = BalanceDelta{I256(amount0), I256(amount1)};
        record.after = snapshot();

        total_mints_.fetch_add(1, std::memory_order_relaxed);
    }

    notify(record);
    return result;
}

// =============================================================================
// Burn
// =============================================================================

BurnResult PoolEngine::burn(const Address& caller, int32_t tick_lower, int32_t tick_upper,
                            U128 amount) {
    tick_math::check_ticks(tick_lower, tick_upper);
    I128 liquidity_delta = -to_liquidity_delta(amount);

    U256 sqrt_price_lower = tick_math::get_sqrt_ratio_at_tick(tick_lower);
    U256 sqrt_price_upper = tick_math::get_sqrt_ratio_at_tick(tick_upper);

    AuditRecord record{};
    BurnResult result{};
    {
        OperationGuard guard(*this);
        record.before = snapshot();

        PositionKey key{caller, tick_lower, tick_upper};
        Position position = positions_.updated(key, liquidity_delta);

        auto [amount0, amount1] = liquidity_math::get_amounts_for_liquidity(
            state_.sqrt_price_x96, sqrt_price_lower, sqrt_price_upper, amount, false);

        TickInfo lower = ticks_.updated(tick_lower, liquidity_delta, false);
        TickInfo upper = ticks_.updated(tick_upper, liquidity_delta, true);

        U128 liquidity_after = state_.liquidity;
        if (state_.tick >= tick_lower && state_.tick < tick_upper) {
            liquidity_after = liquidity_math::add_delta(state_.liquidity, liquidity_delta);
        }

        // Settle: retire shares, then pay out
        shares_.burn(caller, amount);
        try {
            if (amount0 > 0) {
                custody_.credit(caller, token0_, amount0);
            }
            try {
                if (amount1 > 0) {
                    custody_.credit(caller, token1_, amount1);
                }
            } catch (...) {
                if (amount0 > 0) custody_.reclaim(caller, token0_, amount0);
                throw;
            }
        } catch (...) {
            shares_.mint(caller, amount);
            throw;
        }

        // Commit
        ticks_.store(tick_lower, lower);
        ticks_.store(tick_upper, upper);
        positions_.store(key, position);
        state_.liquidity = liquidity_after;

        result = BurnResult{amount0, amount1};

        record.kind = AuditKind::Burn;
        record.actor = caller;
        record.tick_lower = tick_lower;
        record.tick_upper = tick_upper;
        record.liquidity = amount;
        record.delta = BalanceDelta{-I256(amount0), -I256(amount1)};
        record.after = snapshot();

        total_burns_.fetch_add(1, std::memory_order_relaxed);
    }

    notify(record);
    return result;
}

// =============================================================================
// Swap
// =============================================================================

SwapResult PoolEngine::swap(const Address& caller, bool zero_for_one, const I256& amount_specified,
                            const U256& sqrt_price_limit_x96) {
    if (amount_specified == 0) {
        throw ValidationError("amount cannot be zero", errors::ZERO_AMOUNT);
    }

    AuditRecord record{};
    SwapResult result{};
    {
        OperationGuard guard(*this);
        record.before = snapshot();

        // Validate price limit
        if (zero_for_one) {
            if (sqrt_price_limit_x96 >= state_.sqrt_price_x96 ||
                sqrt_price_limit_x96 <= tick_math::MIN_SQRT_RATIO) {
                throw ValidationError("invalid price limit", errors::PRICE_LIMIT_EXCEEDED);
            }
        } else {
            if (sqrt_price_limit_x96 <= state_.sqrt_price_x96 ||
                sqrt_price_limit_x96 >= tick_math::MAX_SQRT_RATIO) {
                throw ValidationError("invalid price limit", errors::PRICE_LIMIT_EXCEEDED);
            }
        }

        bool exact_input = amount_specified > 0;

        SwapState swap_state{};
        swap_state.amount_remaining = amount_specified;
        swap_state.amount_calculated = 0;
        swap_state.sqrt_price_x96 = state_.sqrt_price_x96;
        swap_state.tick = state_.tick;
        swap_state.liquidity = state_.liquidity;

        U256 fee_total = 0;
        uint32_t ticks_crossed = 0;

        // Main swap loop: one segment between initialized ticks per iteration
        while (swap_state.amount_remaining != 0 && swap_state.sqrt_price_x96 != sqrt_price_limit_x96) {
            U256 sqrt_price_start = swap_state.sqrt_price_x96;

            auto [tick_next, initialized] = ticks_.find_next_initialized_tick(
                swap_state.tick, zero_for_one, tick_search_window_);
            U256 sqrt_price_next = tick_math::get_sqrt_ratio_at_tick(tick_next);

            // Clamp to price limit
            U256 sqrt_price_target = zero_for_one
                ? std::max(sqrt_price_next, sqrt_price_limit_x96)
                : std::min(sqrt_price_next, sqrt_price_limit_x96);

            swap_math::SwapStep step = swap_math::compute_swap_step(
                swap_state.sqrt_price_x96, sqrt_price_target, swap_state.liquidity,
                swap_state.amount_remaining, fees::FEE_030);

            swap_state.sqrt_price_x96 = step.sqrt_price_next_x96;
            if (exact_input) {
                swap_state.amount_remaining -= I256(U256(step.amount_in + step.fee_amount));
                swap_state.amount_calculated -= I256(step.amount_out);
            } else {
                swap_state.amount_remaining += I256(step.amount_out);
                swap_state.amount_calculated += I256(U256(step.amount_in + step.fee_amount));
            }
            fee_total += step.fee_amount;

            if (swap_state.sqrt_price_x96 == sqrt_price_next) {
                // Cross tick
                if (initialized) {
                    I128 liquidity_net = ticks_.get(tick_next).liquidity_net;
                    if (zero_for_one) {
                        liquidity_net = -liquidity_net;
                    }
                    swap_state.liquidity = liquidity_math::add_delta(swap_state.liquidity, liquidity_net);
                    ++ticks_crossed;
                }
                swap_state.tick = zero_for_one ? tick_next - 1 : tick_next;
            } else if (swap_state.sqrt_price_x96 != sqrt_price_start) {
                swap_state.tick = tick_math::get_tick_at_sqrt_ratio(swap_state.sqrt_price_x96);
            }
        }

        // Balance delta: positive = caller owes pool
        BalanceDelta delta{};
        I256 specified_used = amount_specified - swap_state.amount_remaining;
        if (zero_for_one == exact_input) {
            delta.amount0 = specified_used;
            delta.amount1 = swap_state.amount_calculated;
        } else {
            delta.amount0 = swap_state.amount_calculated;
            delta.amount1 = specified_used;
        }

        // Settle: pull the input token, then pay the output token
        const Currency& token_in = zero_for_one ? token0_ : token1_;
        const Currency& token_out = zero_for_one ? token1_ : token0_;
        U256 amount_in = full_math::to_u256(zero_for_one ? delta.amount0 : delta.amount1);
        U256 amount_out = full_math::to_u256(zero_for_one ? I256(-delta.amount1) : I256(-delta.amount0));

        if (amount_in > 0) {
            custody_.debit(caller, token_in, amount_in);
        }
        try {
            if (amount_out > 0) {
                custody_.credit(caller, token_out, amount_out);
            }
        } catch (...) {
            if (amount_in > 0) custody_.refund(caller, token_in, amount_in);
            throw;
        }

        // Commit
        state_.sqrt_price_x96 = swap_state.sqrt_price_x96;
        state_.tick = swap_state.tick;
        state_.liquidity = swap_state.liquidity;

        result.delta = delta;
        result.sqrt_price_x96 = swap_state.sqrt_price_x96;
        result.tick = swap_state.tick;
        result.liquidity = swap_state.liquidity;
        result.fee_amount = fee_total;
        result.ticks_crossed = ticks_crossed;

        record.kind = AuditKind::Swap;
        record.actor = caller;
        record.zero_for_one = zero_for_one;
        record.amount_specified = amount_specified;
        record.delta = delta;
        record.after = snapshot();

        total_swaps_.fetch_add(1, std::memory_order_relaxed);
        total_ticks_crossed_.fetch_add(ticks_crossed, std::memory_order_relaxed);
    }

    notify(record);
    return result;
}

// =============================================================================
// Query Operations
// =============================================================================

PoolState PoolEngine::get_pool_state() const {
    auto lock = read_lock();
    return state_;
}

PositionView PoolEngine::get_position(const Address& owner, int32_t tick_lower,
                                      int32_t tick_upper) const {
    auto lock = read_lock();
    Position pos = positions_.get(PositionKey{owner, tick_lower, tick_upper});
    return PositionView{pos.liquidity, pos.tokens_owed0, pos.tokens_owed1};
}

TickInfo PoolEngine::get_tick(int32_t tick) const {
    auto lock = read_lock();
    return ticks_.get(tick);
}

PoolEngine::Stats PoolEngine::get_stats() const {
    auto lock = read_lock();
    return Stats{
        total_mints_.load(),
        total_burns_.load(),
        total_swaps_.load(),
        total_ticks_crossed_.load(),
        ticks_.size(),
        positions_.size(),
    };
}

} // namespace clamm
