// SwapTrade - Liquidity pool tests

#include <catch2/catch_test_macros.hpp>
#include "swaptrade/math.hpp"
#include "swaptrade/pool.hpp"
#include "test_helpers.hpp"

using namespace swaptrade;
using namespace fixtures;

namespace {

LiquidityPool seeded_pool(I128 a, I128 b) {
    LiquidityPool pool;
    I128 minted = 0;
    REQUIRE(pool.deposit_liquidity(LP, a, b, minted) == errors::OK);
    return pool;
}

} // namespace

TEST_CASE("Swap pricing on a 1,000,000 / 1,000,000 pool", "[pool]") {
    LiquidityPool pool = seeded_pool(1'000'000, 1'000'000);
    FeeEngine engine;

    SECTION("Fee stays in the pool") {
        SwapQuote quote;
        REQUIRE(pool.quote_swap(PoolSide::A, 1000, engine, FeeRouting::POOL, quote) == errors::OK);
        REQUIRE(quote.fee == 3);
        REQUIRE(quote.effective_in == 997);
        REQUIRE(quote.curve_in_after == 1'000'997);
        REQUIRE(quote.reserve_out_after == 999'003);
        REQUIRE(quote.amount_out == 997);
        REQUIRE(quote.reserve_in_after == 1'001'000);
        REQUIRE(quote.fee_to_accumulator == 0);
        REQUIRE(math::product_le(quote.curve_in_after, quote.reserve_out_after,
                                 1'000'000, 1'000'000));

        REQUIRE(pool.apply_swap(quote) == errors::OK);
        REQUIRE(pool.reserve_a() == 1'001'000);
        REQUIRE(pool.reserve_b() == 999'003);
    }

    SECTION("Fee routed to the accumulator") {
        SwapQuote quote;
        REQUIRE(pool.quote_swap(PoolSide::A, 1000, engine, FeeRouting::ACCUMULATOR, quote) ==
                errors::OK);
        REQUIRE(quote.amount_out == 997);
        REQUIRE(quote.reserve_in_after == 1'000'997);
        REQUIRE(quote.fee_to_accumulator == 3);
    }

    SECTION("Tiny input against a deep reserve keeps the product bounded") {
        LiquidityPool deep = seeded_pool(1'000'000'000, 1'000);
        SwapQuote quote;
        REQUIRE(deep.quote_swap(PoolSide::A, 10, engine, FeeRouting::POOL, quote) == errors::OK);
        REQUIRE(quote.fee == 0);
        REQUIRE(quote.amount_out == 1);
        REQUIRE(math::product_le(quote.curve_in_after, quote.reserve_out_after,
                                 1'000'000'000, 1'000));
    }

    SECTION("Quotes go stale when reserves move") {
        SwapQuote first, second;
        REQUIRE(pool.quote_swap(PoolSide::A, 1000, engine, FeeRouting::POOL, first) == errors::OK);
        REQUIRE(pool.quote_swap(PoolSide::B, 500, engine, FeeRouting::POOL, second) == errors::OK);
        REQUIRE(pool.apply_swap(first) == errors::OK);
        REQUIRE(pool.apply_swap(second) == errors::INVALID_STATE);
    }

    SECTION("Non-positive input is rejected") {
        SwapQuote quote;
        REQUIRE(pool.quote_swap(PoolSide::A, 0, engine, FeeRouting::POOL, quote) ==
                errors::INVALID_AMOUNT);
    }
}

TEST_CASE("Empty pool has no liquidity", "[pool]") {
    LiquidityPool pool;
    FeeEngine engine;
    SwapQuote quote;
    REQUIRE(pool.quote_swap(PoolSide::A, 1000, engine, FeeRouting::POOL, quote) ==
            errors::INSUFFICIENT_LIQUIDITY);
    REQUIRE(pool.side_of(NATIVE_XLM) == PoolSide::A);
    REQUIRE(pool.side_of(USDC) == PoolSide::B);
    REQUIRE_FALSE(pool.side_of(Asset::custom("EURC")).has_value());
}

TEST_CASE("LP token accounting", "[pool]") {
    LiquidityPool pool;
    I128 minted = 0;

    SECTION("First deposit mints the geometric mean") {
        REQUIRE(pool.deposit_liquidity(LP, 2'000'000, 1'000'000, minted) == errors::OK);
        REQUIRE(minted == 1'414'213);
        REQUIRE(pool.lp_total_supply() == 1'414'213);
        REQUIRE(pool.lp_balance(LP) == 1'414'213);
    }

    SECTION("Later deposits mint the smaller proportional share") {
        REQUIRE(pool.deposit_liquidity(LP, 1'000'000, 1'000'000, minted) == errors::OK);
        REQUIRE(pool.deposit_liquidity(ALICE, 1000, 2000, minted) == errors::OK);
        REQUIRE(minted == 1000);
        REQUIRE(pool.lp_positions_sum() == std::optional<I128>(pool.lp_total_supply()));
    }

    SECTION("Withdraw pays out proportionally") {
        REQUIRE(pool.deposit_liquidity(LP, 1'000'000, 1'000'000, minted) == errors::OK);
        WithdrawResult out{0, 0};
        REQUIRE(pool.withdraw_liquidity(LP, 250'000, out) == errors::OK);
        REQUIRE(out.amount_a == 250'000);
        REQUIRE(out.amount_b == 250'000);
        REQUIRE(pool.reserve_a() == 750'000);
        REQUIRE(pool.lp_total_supply() == 750'000);
        REQUIRE(pool.lp_balance(LP) == 750'000);
    }

    SECTION("Withdraw more than held fails") {
        REQUIRE(pool.deposit_liquidity(LP, 1000, 1000, minted) == errors::OK);
        WithdrawResult out{0, 0};
        REQUIRE(pool.withdraw_liquidity(LP, 1001, out) == errors::INSUFFICIENT_LP_TOKENS);
        REQUIRE(pool.withdraw_liquidity(ALICE, 1, out) == errors::INSUFFICIENT_LP_TOKENS);
    }

    SECTION("Burn removes tokens but keeps the supply") {
        REQUIRE(pool.deposit_liquidity(LP, 1000, 1000, minted) == errors::OK);
        REQUIRE(pool.burn_lp_tokens(LP, 400) == errors::OK);
        REQUIRE(pool.lp_balance(LP) == 600);
        REQUIRE(pool.lp_total_supply() == 1000);
        REQUIRE(*pool.lp_positions_sum() < pool.lp_total_supply());
    }

    SECTION("Restore rejects negative values") {
        REQUIRE(pool.restore(-1, 0, 0, {}) == errors::INVALID_STATE);
        REQUIRE(pool.restore(10, 10, 5, {LPPosition{LP, 10, 10, -5}}) == errors::INVALID_STATE);
        REQUIRE(pool.restore(10, 10, 5, {LPPosition{LP, 10, 10, 5}}) == errors::OK);
        REQUIRE(pool.lp_balance(LP) == 5);
    }
}
