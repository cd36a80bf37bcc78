// clamm - Pool Engine Tests

#include <catch2/catch.hpp>
#include <clamm/pool.hpp>
#include <clamm/tick_math.hpp>
#include <clamm/full_math.hpp>
#include <clamm/errors.hpp>

#include <limits>
#include <memory>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

using namespace clamm;

namespace {

const U256 NO_LIMIT = (std::numeric_limits<U256>::max)();
const U256 FUNDING = U256(1) << 200;

// Range used by the headline scenarios: prices ~1000 to ~1024
constexpr int32_t RANGE_LOWER = 69080;
constexpr int32_t RANGE_UPPER = 69320;
constexpr int32_t START_TICK = 69200;

U256 sqrt_at(int32_t tick) {
    return tick_math::get_sqrt_ratio_at_tick(tick);
}

I256 ten_e18() {
    return I256("10000000000000000000");
}

struct PoolFixture {
    const Address pool_account = addresses::from_index(1000);
    const Address alice = addresses::from_index(1);
    const Address bob = addresses::from_index(2);
    const Address trader = addresses::from_index(3);
    const Currency token0{addresses::from_index(10)};
    const Currency token1{addresses::from_index(20)};

    InMemoryCustody custody{pool_account};
    InMemoryShareLedger shares;
    AuditLog audit;
    std::unique_ptr<PoolEngine> pool;

    explicit PoolFixture(int32_t start_tick = START_TICK, bool clear_initialized_on_empty = false) {
        PoolConfig config;
        config.token0 = token0;
        config.token1 = token1;
        config.initial_sqrt_price_x96 = sqrt_at(start_tick);
        config.clear_initialized_on_empty = clear_initialized_on_empty;
        pool = std::make_unique<PoolEngine>(config, custody, shares, &audit);

        for (const Address& account : {alice, bob, trader}) {
            fund(account);
        }
    }

    void fund(const Address& account) {
        custody.deposit(account, token0, FUNDING);
        custody.deposit(account, token1, FUNDING);
        custody.approve(account, token0, NO_LIMIT);
        custody.approve(account, token1, NO_LIMIT);
    }

    MintResult mint(const Address& who, int32_t lower, int32_t upper, U128 amount) {
        return pool->mint(who, lower, upper, amount, NO_LIMIT, NO_LIMIT);
    }
};

} // namespace

TEST_CASE("Pool construction", "[pool]") {
    InMemoryCustody custody(addresses::from_index(1000));
    InMemoryShareLedger shares;

    PoolConfig config;
    config.token0 = Currency(addresses::from_index(10));
    config.token1 = Currency(addresses::from_index(20));
    config.initial_sqrt_price_x96 = sqrt_at(START_TICK);

    SECTION("Initial tick derived from the price") {
        PoolEngine pool(config, custody, shares);
        PoolState state = pool.get_pool_state();
        REQUIRE(state.tick == START_TICK);
        REQUIRE(state.sqrt_price_x96 == sqrt_at(START_TICK));
        REQUIRE(state.liquidity == 0);
        REQUIRE(state.unlocked);
        REQUIRE(pool.fee() == 3000);
    }

    SECTION("Price between ticks floors the tick") {
        config.initial_sqrt_price_x96 = sqrt_at(START_TICK) + 1;
        PoolEngine pool(config, custody, shares);
        REQUIRE(pool.get_pool_state().tick == START_TICK);
    }

    SECTION("Unsorted tokens") {
        std::swap(config.token0, config.token1);
        try {
            PoolEngine pool(config, custody, shares);
            FAIL("expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.code() == errors::CURRENCIES_NOT_SORTED);
        }
    }

    SECTION("Price outside the bounds") {
        config.initial_sqrt_price_x96 = tick_math::MIN_SQRT_RATIO - 1;
        REQUIRE_THROWS_AS(PoolEngine(config, custody, shares), PriceOutOfRange);
        config.initial_sqrt_price_x96 = tick_math::MAX_SQRT_RATIO;
        REQUIRE_THROWS_AS(PoolEngine(config, custody, shares), PriceOutOfRange);
    }
}

TEST_CASE("Mint, swap and burn scenarios", "[pool]") {
    PoolFixture f;
    const U256 initial_price = f.pool->get_pool_state().sqrt_price_x96;

    // Provide liquidity around the starting price
    MintResult minted = f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 1000000);

    SECTION("Mint inside the current price") {
        REQUIRE(minted.amount0 > 0);
        REQUIRE(minted.amount1 > 0);
        REQUIRE(f.pool->get_pool_state().liquidity == U128(1000000));
        REQUIRE(f.pool->get_position(f.alice, RANGE_LOWER, RANGE_UPPER).liquidity == U128(1000000));
        REQUIRE(f.shares.balance_of(f.alice) == U128(1000000));

        REQUIRE(f.custody.balance_of(f.alice, f.token0) == U256(FUNDING - minted.amount0));
        REQUIRE(f.custody.reserve(f.token1) == minted.amount1);

        TickInfo lower = f.pool->get_tick(RANGE_LOWER);
        TickInfo upper = f.pool->get_tick(RANGE_UPPER);
        REQUIRE(lower.initialized);
        REQUIRE(lower.liquidity_net == 1000000);
        REQUIRE(upper.liquidity_net == -1000000);
        REQUIRE(upper.liquidity_gross == U128(1000000));
    }

    SECTION("Large exact-input swap runs through the range to the limit") {
        U256 limit = initial_price / 2;
        SwapResult result = f.pool->swap(f.trader, true, ten_e18(), limit);
        PoolState state = f.pool->get_pool_state();

        REQUIRE(state.sqrt_price_x96 < initial_price);
        REQUIRE(state.tick < START_TICK);
        REQUIRE(state.sqrt_price_x96 == limit);
        REQUIRE(result.sqrt_price_x96 == limit);
        REQUIRE(result.tick == tick_math::get_tick_at_sqrt_ratio(limit));

        REQUIRE(result.delta.amount1 < 0);
        REQUIRE(result.delta.amount0 > 0);
        REQUIRE(result.delta.amount0 <= ten_e18());
        REQUIRE(result.fee_amount > 0);

        // Left the only range through its lower boundary
        REQUIRE(result.ticks_crossed == 1);
        REQUIRE(state.liquidity == 0);
        REQUIRE(result.liquidity == 0);

        // Token1 paid out cannot exceed what the range held
        U256 paid_out = full_math::to_u256(I256(-result.delta.amount1));
        REQUIRE(paid_out <= minted.amount1);
        REQUIRE(f.custody.balance_of(f.trader, f.token1) == U256(FUNDING + paid_out));
    }

    SECTION("Burning half the position returns about half the tokens") {
        BurnResult burned = f.pool->burn(f.alice, RANGE_LOWER, RANGE_UPPER, 500000);

        REQUIRE(U256(burned.amount0 * 2) <= U256(minted.amount0 + 3));
        REQUIRE(U256(burned.amount0 * 2 + 3) >= minted.amount0);
        REQUIRE(U256(burned.amount1 * 2) <= U256(minted.amount1 + 3));
        REQUIRE(U256(burned.amount1 * 2 + 3) >= minted.amount1);

        REQUIRE(f.pool->get_position(f.alice, RANGE_LOWER, RANGE_UPPER).liquidity == U128(500000));
        REQUIRE(f.pool->get_pool_state().liquidity == U128(500000));
        REQUIRE(f.shares.balance_of(f.alice) == U128(500000));
        REQUIRE(f.pool->get_tick(RANGE_LOWER).liquidity_gross == U128(500000));
    }

    SECTION("Invalid requests are rejected without changes") {
        PoolState before = f.pool->get_pool_state();

        REQUIRE_THROWS_AS(f.mint(f.alice, RANGE_UPPER, RANGE_LOWER, 1000), ValidationError);
        REQUIRE_THROWS_AS(f.pool->burn(f.alice, RANGE_LOWER, RANGE_UPPER, 1000001), InsufficientLiquidity);
        REQUIRE_THROWS_AS(f.pool->burn(f.bob, RANGE_LOWER, RANGE_UPPER, 1), InsufficientLiquidity);
        REQUIRE_THROWS_AS(f.pool->swap(f.trader, true, 0, initial_price / 2), ValidationError);
        REQUIRE_THROWS_AS(f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 0), ValidationError);
        REQUIRE_THROWS_AS(f.pool->burn(f.alice, RANGE_LOWER, RANGE_UPPER, 0), ValidationError);

        PoolState after = f.pool->get_pool_state();
        REQUIRE(after.liquidity == before.liquidity);
        REQUIRE(after.sqrt_price_x96 == before.sqrt_price_x96);
        REQUIRE(after.tick == before.tick);
        REQUIRE(f.pool->get_position(f.alice, RANGE_LOWER, RANGE_UPPER).liquidity == U128(1000000));
        REQUIRE(f.audit.size() == 1);
    }
}

TEST_CASE("Mint ranges relative to the price", "[pool]") {
    PoolFixture f;

    SECTION("Range above the price takes only token0") {
        MintResult r = f.mint(f.alice, 70000, 71000, 1000000);
        REQUIRE(r.amount0 > 0);
        REQUIRE(r.amount1 == 0);
        REQUIRE(f.pool->get_pool_state().liquidity == 0);
    }

    SECTION("Range below the price takes only token1") {
        MintResult r = f.mint(f.alice, 60000, 61000, 1000000);
        REQUIRE(r.amount0 == 0);
        REQUIRE(r.amount1 > 0);
        REQUIRE(f.pool->get_pool_state().liquidity == 0);
    }

    SECTION("Full range at the tick bounds") {
        REQUIRE_NOTHROW(f.mint(f.alice, tick_math::MIN_TICK, tick_math::MAX_TICK, 1000));
        REQUIRE(f.pool->get_pool_state().liquidity == U128(1000));
        REQUIRE(f.pool->get_tick(tick_math::MIN_TICK).initialized);
        REQUIRE(f.pool->get_tick(tick_math::MAX_TICK).initialized);
    }

    SECTION("Ticks beyond the bounds") {
        REQUIRE_THROWS_AS(f.mint(f.alice, tick_math::MIN_TICK - 1, 0, 1000), ValidationError);
        REQUIRE_THROWS_AS(f.mint(f.alice, 0, tick_math::MAX_TICK + 1, 1000), ValidationError);
    }

    SECTION("Repeated mints accumulate into one position") {
        f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 400);
        f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 600);
        f.mint(f.bob, RANGE_LOWER, RANGE_UPPER, 50);

        REQUIRE(f.pool->get_position(f.alice, RANGE_LOWER, RANGE_UPPER).liquidity == U128(1000));
        REQUIRE(f.pool->get_position(f.bob, RANGE_LOWER, RANGE_UPPER).liquidity == U128(50));
        REQUIRE(f.pool->get_tick(RANGE_LOWER).liquidity_gross == U128(1050));
        REQUIRE(f.pool->get_pool_state().liquidity == U128(1050));
    }
}

TEST_CASE("Mint then burn at an unchanged price", "[pool]") {
    PoolFixture f;

    MintResult minted = f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 123456789);
    BurnResult burned = f.pool->burn(f.alice, RANGE_LOWER, RANGE_UPPER, 123456789);

    REQUIRE(burned.amount0 <= minted.amount0);
    REQUIRE(burned.amount1 <= minted.amount1);
    REQUIRE(U256(burned.amount0 + 1) >= minted.amount0);
    REQUIRE(U256(burned.amount1 + 1) >= minted.amount1);

    REQUIRE(f.pool->get_position(f.alice, RANGE_LOWER, RANGE_UPPER).liquidity == 0);
    REQUIRE(f.pool->get_pool_state().liquidity == 0);
    REQUIRE(f.shares.balance_of(f.alice) == 0);
    REQUIRE(f.pool->get_stats().open_positions == 0);

    // Rounding leaves dust in the pool, never a shortfall
    REQUIRE(f.custody.reserve(f.token0) == U256(minted.amount0 - burned.amount0));
    REQUIRE(f.custody.reserve(f.token1) == U256(minted.amount1 - burned.amount1));
}

TEST_CASE("Active liquidity follows tick crossings", "[pool]") {
    PoolFixture f;

    f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 1000000);   // contains the price
    f.mint(f.bob, 68000, 69140, 300000);                  // below the price
    REQUIRE(f.pool->get_pool_state().liquidity == U128(1000000));

    SECTION("Moving down crosses both boundaries") {
        SwapResult down = f.pool->swap(f.trader, true, ten_e18(), sqrt_at(68500));

        // +300000 entering bob's range at 69140, -1000000 leaving alice's at 69080
        REQUIRE(down.ticks_crossed == 2);
        REQUIRE(down.tick == 68500);
        REQUIRE(down.liquidity == U128(300000));
        REQUIRE(f.pool->get_pool_state().liquidity == U128(300000));

        SECTION("Moving back up restores it") {
            SwapResult up = f.pool->swap(f.trader, false, ten_e18(), sqrt_at(69250));
            REQUIRE(up.ticks_crossed == 2);
            REQUIRE(up.tick == 69250);
            REQUIRE(up.liquidity == U128(1000000));
            REQUIRE(f.pool->get_stats().total_ticks_crossed == 4);
        }
    }

    SECTION("Stopping inside a segment crosses nothing") {
        SwapResult r = f.pool->swap(f.trader, true, I256(10), sqrt_at(68500));
        REQUIRE(r.ticks_crossed == 0);
        REQUIRE(r.liquidity == U128(1000000));
        REQUIRE(r.delta.amount0 == 10);
    }
}

TEST_CASE("Swap variants", "[pool]") {
    PoolFixture f;
    f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 1000000000);
    const U256 start = f.pool->get_pool_state().sqrt_price_x96;

    SECTION("Exact output zero for one") {
        SwapResult r = f.pool->swap(f.trader, true, I256(-1000), tick_math::MIN_SQRT_RATIO + 1);
        REQUIRE(r.delta.amount1 == -1000);
        REQUIRE(r.delta.amount0 > 0);
        REQUIRE(r.sqrt_price_x96 < start);
        REQUIRE(f.custody.balance_of(f.trader, f.token1) == U256(FUNDING + 1000));
    }

    SECTION("Exact input one for zero") {
        SwapResult r = f.pool->swap(f.trader, false, I256(5000), tick_math::MAX_SQRT_RATIO - 1);
        REQUIRE(r.delta.amount1 == 5000);
        REQUIRE(r.delta.amount0 < 0);
        REQUIRE(r.sqrt_price_x96 > start);
        REQUIRE(r.tick >= START_TICK);
        REQUIRE(f.custody.balance_of(f.trader, f.token1) == U256(FUNDING - 5000));
    }

    SECTION("Exact output one for zero") {
        SwapResult r = f.pool->swap(f.trader, false, I256(-3), tick_math::MAX_SQRT_RATIO - 1);
        REQUIRE(r.delta.amount0 == -3);
        REQUIRE(r.delta.amount1 > 0);
    }

    SECTION("Fee is withheld from the input") {
        SwapResult r = f.pool->swap(f.trader, true, I256(100000), tick_math::MIN_SQRT_RATIO + 1);
        REQUIRE(r.delta.amount0 == 100000);
        REQUIRE(r.fee_amount >= 300);
        REQUIRE(r.ticks_crossed == 0);
    }

    SECTION("Price limit validation") {
        try {
            f.pool->swap(f.trader, true, I256(100), start);
            FAIL("expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.code() == errors::PRICE_LIMIT_EXCEEDED);
        }
        REQUIRE_THROWS_AS(f.pool->swap(f.trader, true, I256(100), tick_math::MIN_SQRT_RATIO), ValidationError);
        REQUIRE_THROWS_AS(f.pool->swap(f.trader, false, I256(100), start), ValidationError);
        REQUIRE_THROWS_AS(f.pool->swap(f.trader, false, I256(100), tick_math::MAX_SQRT_RATIO), ValidationError);
        REQUIRE(f.pool->get_stats().total_swaps == 0);
    }
}

TEST_CASE("Swap without liquidity moves only the price", "[pool]") {
    PoolFixture f;

    SwapResult r = f.pool->swap(f.trader, true, I256(1000), sqrt_at(69000));
    REQUIRE(r.delta.amount0 == 0);
    REQUIRE(r.delta.amount1 == 0);
    REQUIRE(r.sqrt_price_x96 == sqrt_at(69000));
    REQUIRE(r.tick == 69000);
    REQUIRE(f.custody.balance_of(f.trader, f.token0) == FUNDING);
}

TEST_CASE("Failed operations leave no trace", "[pool]") {
    PoolFixture f;
    const Address carol = addresses::from_index(4);

    SECTION("Slippage limit") {
        REQUIRE_THROWS_AS(f.pool->mint(f.alice, RANGE_LOWER, RANGE_UPPER, 1000000, 0, NO_LIMIT),
                          SlippageExceeded);
        REQUIRE_FALSE(f.pool->get_tick(RANGE_LOWER).initialized);
        REQUIRE(f.pool->get_position(f.alice, RANGE_LOWER, RANGE_UPPER).liquidity == 0);
        REQUIRE(f.custody.balance_of(f.alice, f.token0) == FUNDING);
        REQUIRE(f.shares.balance_of(f.alice) == 0);
    }

    SECTION("Second token debit fails after the first succeeded") {
        f.custody.deposit(carol, f.token0, FUNDING);
        f.custody.approve(carol, f.token0, NO_LIMIT);

        try {
            f.mint(carol, RANGE_LOWER, RANGE_UPPER, 1000000);
            FAIL("expected InsufficientFunds");
        } catch (const InsufficientFunds& e) {
            REQUIRE(e.code() == errors::INSUFFICIENT_BALANCE);
        }

        REQUIRE(f.custody.balance_of(carol, f.token0) == FUNDING);
        REQUIRE(f.custody.reserve(f.token0) == 0);
        REQUIRE(f.pool->get_pool_state().liquidity == 0);
        REQUIRE(f.pool->get_tick(RANGE_UPPER).liquidity_gross == 0);
        REQUIRE(f.shares.balance_of(carol) == 0);
    }

    SECTION("Trader cannot pay for a swap") {
        f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 1000000);
        PoolState before = f.pool->get_pool_state();

        REQUIRE_THROWS_AS(f.pool->swap(carol, true, I256(1000), tick_math::MIN_SQRT_RATIO + 1),
                          InsufficientFunds);

        PoolState after = f.pool->get_pool_state();
        REQUIRE(after.sqrt_price_x96 == before.sqrt_price_x96);
        REQUIRE(after.tick == before.tick);
        REQUIRE(after.unlocked);
        REQUIRE(f.custody.balance_of(carol, f.token1) == 0);
    }

    REQUIRE(f.pool->get_pool_state().unlocked);
}

namespace {

// Everything a rolled-back settlement must leave untouched
struct Ledger {
    U256 alice0, alice1, trader0, trader1, reserve0, reserve1;
    U128 position;
    U128 shares;
    U128 lower_gross;
    PoolState state;

    static Ledger of(const PoolFixture& f) {
        return Ledger{
            f.custody.balance_of(f.alice, f.token0),
            f.custody.balance_of(f.alice, f.token1),
            f.custody.balance_of(f.trader, f.token0),
            f.custody.balance_of(f.trader, f.token1),
            f.custody.reserve(f.token0),
            f.custody.reserve(f.token1),
            f.pool->get_position(f.alice, RANGE_LOWER, RANGE_UPPER).liquidity,
            f.shares.balance_of(f.alice),
            f.pool->get_tick(RANGE_LOWER).liquidity_gross,
            f.pool->get_pool_state(),
        };
    }
};

void require_unchanged(const Ledger& before, const Ledger& after) {
    REQUIRE(after.alice0 == before.alice0);
    REQUIRE(after.alice1 == before.alice1);
    REQUIRE(after.trader0 == before.trader0);
    REQUIRE(after.trader1 == before.trader1);
    REQUIRE(after.reserve0 == before.reserve0);
    REQUIRE(after.reserve1 == before.reserve1);
    REQUIRE(after.position == before.position);
    REQUIRE(after.shares == before.shares);
    REQUIRE(after.lower_gross == before.lower_gross);
    REQUIRE(after.state.sqrt_price_x96 == before.state.sqrt_price_x96);
    REQUIRE(after.state.tick == before.state.tick);
    REQUIRE(after.state.liquidity == before.state.liquidity);
    REQUIRE(after.state.unlocked);
}

} // namespace

TEST_CASE("Rejected transfers roll settlement back", "[pool]") {
    PoolFixture f;
    f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 1000000);
    const Ledger before = Ledger::of(f);

    SECTION("Burn whose token1 payout is rejected after token0 was paid") {
        // Rollback must not depend on the caller's allowance
        f.custody.approve(f.alice, f.token0, 0);
        f.custody.set_transfer_hook([&](const Address&, const Currency& token, const U256&, bool is_debit) {
            if (!is_debit && token == f.token1) {
                throw InsufficientFunds("token1 rejected the transfer");
            }
        });

        REQUIRE_THROWS_AS(f.pool->burn(f.alice, RANGE_LOWER, RANGE_UPPER, 1000000), InsufficientFunds);
        require_unchanged(before, Ledger::of(f));
        REQUIRE(f.pool->get_stats().total_burns == 0);
    }

    SECTION("Burn whose token0 payout is rejected") {
        f.custody.set_transfer_hook([&](const Address&, const Currency& token, const U256&, bool is_debit) {
            if (!is_debit && token == f.token0) {
                throw InsufficientFunds("token0 rejected the transfer");
            }
        });

        REQUIRE_THROWS_AS(f.pool->burn(f.alice, RANGE_LOWER, RANGE_UPPER, 500000), InsufficientFunds);
        require_unchanged(before, Ledger::of(f));
    }

    SECTION("Swap whose output payout is rejected") {
        f.custody.set_transfer_hook([&](const Address&, const Currency& token, const U256&, bool is_debit) {
            if (!is_debit && token == f.token1) {
                throw InsufficientFunds("token1 rejected the transfer");
            }
        });

        REQUIRE_THROWS_AS(f.pool->swap(f.trader, true, I256(50), tick_math::MIN_SQRT_RATIO + 1),
                          InsufficientFunds);
        require_unchanged(before, Ledger::of(f));
        REQUIRE(f.pool->get_stats().total_swaps == 0);
    }

    SECTION("Mint whose second debit fails refunds the first without callbacks") {
        // Any payout back to alice would also be rejected
        f.custody.set_transfer_hook([&](const Address&, const Currency& token, const U256&, bool is_debit) {
            if (!is_debit || token == f.token1) {
                throw InsufficientFunds("transfer rejected");
            }
        });

        REQUIRE_THROWS_AS(f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 1000), InsufficientFunds);
        require_unchanged(before, Ledger::of(f));
        REQUIRE(f.pool->get_stats().total_mints == 1);
    }

    f.custody.set_transfer_hook(nullptr);
    REQUIRE_NOTHROW(f.pool->burn(f.alice, RANGE_LOWER, RANGE_UPPER, 1000000));
}

TEST_CASE("Reentrant calls are rejected", "[pool]") {
    PoolFixture f;
    f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 1000000);

    SECTION("Callback that swallows the rejection") {
        bool entered = false;
        bool rejected = false;
        bool saw_locked = false;
        f.custody.set_transfer_hook([&](const Address&, const Currency&, const U256&, bool) {
            if (entered) return;
            entered = true;
            saw_locked = !f.pool->get_pool_state().unlocked;
            try {
                f.pool->swap(f.trader, true, I256(100), tick_math::MIN_SQRT_RATIO + 1);
            } catch (const ReentrancyError& e) {
                rejected = e.code() == errors::REENTRANCY;
            }
        });

        f.mint(f.bob, RANGE_LOWER, RANGE_UPPER, 1000);
        REQUIRE(rejected);
        REQUIRE(saw_locked);
        REQUIRE(f.pool->get_stats().total_swaps == 0);
        REQUIRE(f.pool->get_pool_state().liquidity == U128(1001000));
    }

    SECTION("Callback that propagates the rejection aborts the outer call") {
        f.custody.set_transfer_hook([&](const Address&, const Currency&, const U256&, bool) {
            f.pool->burn(f.alice, RANGE_LOWER, RANGE_UPPER, 1);
        });

        PoolState before = f.pool->get_pool_state();
        REQUIRE_THROWS_AS(f.pool->swap(f.trader, true, I256(1000), tick_math::MIN_SQRT_RATIO + 1),
                          ReentrancyError);

        PoolState after = f.pool->get_pool_state();
        REQUIRE(after.sqrt_price_x96 == before.sqrt_price_x96);
        REQUIRE(after.unlocked);
        REQUIRE(f.custody.balance_of(f.trader, f.token0) == FUNDING);
        REQUIRE(f.pool->get_position(f.alice, RANGE_LOWER, RANGE_UPPER).liquidity == U128(1000000));

        // Guard released: the pool is usable again
        f.custody.set_transfer_hook(nullptr);
        REQUIRE_NOTHROW(f.pool->swap(f.trader, true, I256(1000), tick_math::MIN_SQRT_RATIO + 1));
    }
}

TEST_CASE("Concurrent mints serialize", "[pool]") {
    PoolFixture f;
    constexpr int THREADS = 4;
    constexpr int MINTS = 25;

    std::vector<Address> accounts;
    for (int i = 0; i < THREADS; ++i) {
        accounts.push_back(addresses::from_index(500 + i));
        f.fund(accounts.back());
    }

    std::vector<std::thread> threads;
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&f, &accounts, i]() {
            for (int j = 0; j < MINTS; ++j) {
                f.mint(accounts[i], RANGE_LOWER, RANGE_UPPER, 10);
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(f.pool->get_pool_state().liquidity == U128(THREADS * MINTS * 10));
    REQUIRE(f.pool->get_tick(RANGE_LOWER).liquidity_gross == U128(THREADS * MINTS * 10));
    REQUIRE(f.pool->get_stats().total_mints == THREADS * MINTS);
    for (const Address& account : accounts) {
        REQUIRE(f.pool->get_position(account, RANGE_LOWER, RANGE_UPPER).liquidity == U128(MINTS * 10));
    }
}

TEST_CASE("Initialized flag after a tick empties", "[pool]") {
    SECTION("Kept by default") {
        PoolFixture f;
        f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 1000);
        f.pool->burn(f.alice, RANGE_LOWER, RANGE_UPPER, 1000);

        REQUIRE(f.pool->get_tick(RANGE_LOWER).initialized);
        REQUIRE(f.pool->get_tick(RANGE_LOWER).liquidity_gross == 0);

        // Crossing an empty initialized tick changes nothing
        SwapResult r = f.pool->swap(f.trader, true, I256(1000), sqrt_at(69000));
        REQUIRE(r.liquidity == 0);
        REQUIRE(r.tick == 69000);
    }

    SECTION("Cleared when configured") {
        PoolFixture f(START_TICK, true);
        f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 1000);
        f.pool->burn(f.alice, RANGE_LOWER, RANGE_UPPER, 1000);

        REQUIRE_FALSE(f.pool->get_tick(RANGE_LOWER).initialized);
        REQUIRE(f.pool->get_stats().initialized_ticks == 0);

        SwapResult r = f.pool->swap(f.trader, true, I256(1000), sqrt_at(69000));
        REQUIRE(r.ticks_crossed == 0);
        REQUIRE(r.tick == 69000);
    }
}

TEST_CASE("Observers cannot fail a committed operation", "[pool]") {
    STATIC_REQUIRE(noexcept(std::declval<IPoolObserver&>().on_record(std::declval<const AuditRecord&>())));
    STATIC_REQUIRE(noexcept(std::declval<AuditLog&>().on_record(std::declval<const AuditRecord&>())));
}

TEST_CASE("Audit records", "[pool]") {
    PoolFixture f;

    f.mint(f.alice, RANGE_LOWER, RANGE_UPPER, 1000000);
    f.pool->swap(f.trader, true, I256(50), tick_math::MIN_SQRT_RATIO + 1);
    f.pool->burn(f.alice, RANGE_LOWER, RANGE_UPPER, 1000);
    REQUIRE_THROWS_AS(f.pool->burn(f.bob, RANGE_LOWER, RANGE_UPPER, 1000), InsufficientLiquidity);

    std::vector<AuditRecord> records = f.audit.records();
    REQUIRE(records.size() == 3);

    REQUIRE(records[0].kind == AuditKind::Mint);
    REQUIRE(records[0].actor == f.alice);
    REQUIRE(records[0].liquidity == U128(1000000));
    REQUIRE(records[0].before.liquidity == 0);
    REQUIRE(records[0].after.liquidity == U128(1000000));
    REQUIRE(records[0].delta.amount0 > 0);

    REQUIRE(records[1].kind == AuditKind::Swap);
    REQUIRE(records[1].zero_for_one);
    REQUIRE(records[1].amount_specified == 50);
    REQUIRE(records[1].after.sqrt_price_x96 < records[1].before.sqrt_price_x96);

    REQUIRE(records[2].kind == AuditKind::Burn);
    REQUIRE(records[2].delta.amount0 <= 0);
    REQUIRE(records[2].delta.amount1 < 0);

    PoolEngine::Stats stats = f.pool->get_stats();
    REQUIRE(stats.total_mints == 1);
    REQUIRE(stats.total_swaps == 1);
    REQUIRE(stats.total_burns == 1);
    REQUIRE(stats.open_positions == 1);
    REQUIRE(stats.initialized_ticks == 2);
}

TEST_CASE("Audit log output", "[pool]") {
    InMemoryCustody custody(addresses::from_index(1000));
    InMemoryShareLedger shares;
    const Address alice = addresses::from_index(1);

    PoolConfig config;
    config.token0 = Currency(addresses::from_index(10));
    config.token1 = Currency(addresses::from_index(20));
    config.initial_sqrt_price_x96 = sqrt_at(START_TICK);

    custody.deposit(alice, config.token0, FUNDING);
    custody.deposit(alice, config.token1, FUNDING);
    custody.approve(alice, config.token0, NO_LIMIT);
    custody.approve(alice, config.token1, NO_LIMIT);

    SECTION("Info level writes a line per record") {
        std::ostringstream out;
        AuditLog log(out, "info");
        PoolEngine pool(config, custody, shares, &log);

        pool.mint(alice, RANGE_LOWER, RANGE_UPPER, 1000, NO_LIMIT, NO_LIMIT);
        REQUIRE(out.str().find("[mint] actor=0x0000000000000000000000000000000000000001") != std::string::npos);
        REQUIRE(out.str().find("range=[69080,69320)") != std::string::npos);
    }

    SECTION("Warn level only records") {
        std::ostringstream out;
        AuditLog log(out, "warn");
        PoolEngine pool(config, custody, shares, &log);

        pool.mint(alice, RANGE_LOWER, RANGE_UPPER, 1000, NO_LIMIT, NO_LIMIT);
        REQUIRE(out.str().empty());
        REQUIRE(log.size() == 1);
    }
}
