// SwapTrade - Randomized property tests (fixed seeds)

#include <catch2/catch_test_macros.hpp>
#include "swaptrade/dispatcher.hpp"
#include "swaptrade/fee.hpp"
#include "swaptrade/math.hpp"
#include "swaptrade/pool.hpp"
#include "test_helpers.hpp"

#include <random>

using namespace swaptrade;
using namespace fixtures;

namespace {

constexpr uint64_t SEEDS[] = {1, 7, 42, 20240901, 0xC0FFEE};

I128 random_amount(std::mt19937_64& rng, uint64_t max) {
    return static_cast<I128>(std::uniform_int_distribution<uint64_t>(1, max)(rng));
}

const Address& random_user(std::mt19937_64& rng) {
    static const Address USERS[] = {ALICE, BOB, LP};
    return USERS[std::uniform_int_distribution<size_t>(0, 2)(rng)];
}

const Asset& random_asset(std::mt19937_64& rng) {
    return std::uniform_int_distribution<int>(0, 1)(rng) == 0 ? NATIVE_XLM : USDC;
}

// Committed counters that must never go backwards
struct Watermark {
    uint64_t trade_count = 0;
    uint64_t failed_order_count = 0;
    I128 total_volume = 0;
    I128 total_minted = 0;
    I128 fee_accumulator = 0;
    uint64_t timestamp = 0;

    void advance(const OperationDispatcher& dex) {
        const Metrics& m = dex.metrics();
        REQUIRE(m.trade_count >= trade_count);
        REQUIRE(m.failed_order_count >= failed_order_count);
        REQUIRE(m.total_volume >= total_volume);
        REQUIRE(dex.state().total_minted >= total_minted);
        REQUIRE(dex.state().fee_accumulator >= fee_accumulator);
        REQUIRE(dex.state().metrics.timestamp() >= timestamp);

        trade_count = m.trade_count;
        failed_order_count = m.failed_order_count;
        total_volume = m.total_volume;
        total_minted = dex.state().total_minted;
        fee_accumulator = dex.state().fee_accumulator;
        timestamp = dex.state().metrics.timestamp();
    }
};

} // namespace

// =============================================================================
// Random Operation Sequences
// =============================================================================

TEST_CASE("Random operation sequences never break an invariant", "[properties]") {
    for (uint64_t seed : SEEDS) {
        INFO("seed " << seed);
        std::mt19937_64 rng(seed);

        const FeeRouting routing = seed % 2 == 0 ? FeeRouting::POOL : FeeRouting::ACCUMULATOR;
        OperationDispatcher dex(
            LedgerConfig{}.with_admin(ADMIN).with_swap_fee(30, routing).with_transfer_fee(25));
        Watermark watermark;
        uint64_t clock = 1;

        for (int step = 0; step < 400; ++step) {
            clock += std::uniform_int_distribution<uint64_t>(0, 3)(rng);
            const Address& user = random_user(rng);
            // One call in ten comes from the wrong identity
            const bool impostor = std::uniform_int_distribution<int>(0, 9)(rng) == 0;
            const CallContext as_user{impostor ? ADMIN : user, clock};

            OperationResult result{};
            switch (std::uniform_int_distribution<int>(0, 8)(rng)) {
                case 0:
                    result = dex.mint({impostor ? user : ADMIN, clock}, user, random_asset(rng),
                                      random_amount(rng, 5'000'000));
                    break;
                case 1:
                    result = dex.transfer(as_user, NATIVE_XLM, USDC, user,
                                          random_amount(rng, 100'000));
                    break;
                case 2:
                case 3: {
                    const Asset& from = random_asset(rng);
                    const Asset& to = from == NATIVE_XLM ? USDC : NATIVE_XLM;
                    result = dex.swap(as_user, user, from, to, random_amount(rng, 200'000));
                    break;
                }
                case 4:
                    result = dex.add_liquidity(as_user, user, random_amount(rng, 500'000),
                                               random_amount(rng, 500'000));
                    break;
                case 5:
                    result = dex.remove_liquidity(as_user, user, random_amount(rng, 300'000));
                    break;
                case 6:
                    result = dex.burn_lp_tokens(as_user, user, random_amount(rng, 1000));
                    break;
                case 7:
                    result = dex.pause_trading({impostor ? user : ADMIN, clock});
                    break;
                default:
                    result = dex.resume_trading({impostor ? user : ADMIN, clock});
                    break;
            }

            INFO("step " << step << " status " << error_name(result.status));
            REQUIRE(result.status != errors::INVARIANT_VIOLATION);
            REQUIRE_FALSE(dex.is_halted());
            if (impostor) REQUIRE(result.status == errors::UNAUTHORIZED);
            for (const auto& report : dex.audit()) {
                INFO(invariant_name(report.id) << ": " << report.diagnostic);
                REQUIRE(report.holds);
            }
            watermark.advance(dex);
        }

        REQUIRE(dex.metrics().trade_count > 0);
    }
}

// =============================================================================
// Fee Bounds
// =============================================================================

TEST_CASE("Fees stay within bounds and grow with the amount", "[properties][fee]") {
    std::mt19937_64 rng(99);
    std::uniform_int_distribution<uint64_t> amounts(0, 1'000'000'000'000'000'000ULL);
    std::uniform_int_distribution<uint32_t> rates(0, fees::MAX_FEE_BPS);

    for (int i = 0; i < 2000; ++i) {
        auto engine = FeeEngine::create(rates(rng));
        REQUIRE(engine.has_value());

        I128 a = static_cast<I128>(amounts(rng));
        I128 b = static_cast<I128>(amounts(rng));
        if (a > b) std::swap(a, b);

        I128 fee_a = engine->compute(a);
        I128 fee_b = engine->compute(b);
        INFO("bps " << engine->fee_bps() << " amounts " << to_string(a) << ", " << to_string(b));
        REQUIRE(fee_a >= 0);
        REQUIRE(fee_a <= FeeEngine::max_fee(a));
        REQUIRE(fee_b <= FeeEngine::max_fee(b));
        REQUIRE(fee_a <= fee_b);
    }
}

// =============================================================================
// Constant Product
// =============================================================================

TEST_CASE("Swaps never grow the priced curve product", "[properties][pool]") {
    for (uint64_t seed : SEEDS) {
        INFO("seed " << seed);
        std::mt19937_64 rng(seed);

        LiquidityPool pool(NATIVE_XLM, USDC);
        I128 minted = 0;
        REQUIRE(pool.deposit_liquidity(LP, random_amount(rng, 1'000'000'000),
                                       random_amount(rng, 1'000'000'000), minted) == errors::OK);
        auto engine = FeeEngine::create(static_cast<uint32_t>(seed % (fees::MAX_FEE_BPS + 1)));
        REQUIRE(engine.has_value());

        for (int i = 0; i < 500; ++i) {
            const PoolSide side = std::uniform_int_distribution<int>(0, 1)(rng) == 0
                                      ? PoolSide::A : PoolSide::B;
            const I128 x0 = pool.reserve(side);
            const I128 y0 = pool.reserve(other_side(side));

            SwapQuote quote;
            int32_t status = pool.quote_swap(side, random_amount(rng, 50'000'000), *engine,
                                             FeeRouting::POOL, quote);
            if (status != errors::OK) {
                REQUIRE(status == errors::INSUFFICIENT_LIQUIDITY);
                continue;
            }
            REQUIRE(quote.amount_out < y0);
            REQUIRE(quote.fee + quote.effective_in == quote.amount_in);
            REQUIRE(math::product_le(quote.curve_in_after, quote.reserve_out_after, x0, y0));

            REQUIRE(pool.apply_swap(quote) == errors::OK);
            REQUIRE(pool.reserve(side) == x0 + quote.amount_in);
            REQUIRE(pool.reserve(other_side(side)) == y0 - quote.amount_out);
        }
    }
}
