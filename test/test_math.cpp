// SwapTrade - Fixed-point math and fee tests

#include <catch2/catch_test_macros.hpp>
#include "swaptrade/fee.hpp"
#include "swaptrade/math.hpp"
#include "test_helpers.hpp"

using namespace swaptrade;

TEST_CASE("Checked 128-bit arithmetic", "[math]") {
    I128 out = 0;

    SECTION("Add") {
        REQUIRE(math::checked_add(40, 2, out));
        REQUIRE(out == 42);
        REQUIRE_FALSE(math::checked_add(I128_MAX, 1, out));
    }

    SECTION("Sub") {
        REQUIRE(math::checked_sub(2, 40, out));
        REQUIRE(out == -38);
        REQUIRE_FALSE(math::checked_sub(-I128_MAX - 1, 1, out));
    }

    SECTION("Mul") {
        REQUIRE(math::checked_mul(1'000'000, 1'000'000, out));
        REQUIRE(out == 1'000'000'000'000);
        REQUIRE_FALSE(math::checked_mul(I128_MAX, 2, out));
    }
}

TEST_CASE("256-bit product and division", "[math]") {
    SECTION("2^64 * 2^64 carries into the high limb") {
        U128 two64 = U128(1) << 64;
        math::U256 p = math::mul_u128(two64, two64);
        REQUIRE(p.lo == 0);
        REQUIRE(p.hi == 1);
    }

    SECTION("Division by zero fails") {
        U128 q = 0;
        REQUIRE_FALSE(math::div_u256_u128(math::U256{10, 0}, 0, q));
    }

    SECTION("Quotient wider than 128 bits fails") {
        U128 q = 0;
        REQUIRE_FALSE(math::div_u256_u128(math::U256{0, 5}, 5, q));
    }

    SECTION("Remainder") {
        U128 q = 0, r = 0;
        REQUIRE(math::div_u256_u128(math::U256{17, 0}, 5, q, &r));
        REQUIRE(q == 3);
        REQUIRE(r == 2);
    }
}

TEST_CASE("mul_div", "[math]") {
    I128 out = 0;

    SECTION("Floors the exact quotient") {
        REQUIRE(math::mul_div(1'000'000, 1'000'000, 1'000'997, out));
        REQUIRE(out == 999'003);
    }

    SECTION("Intermediate product beyond 128 bits") {
        REQUIRE(math::mul_div(I128_MAX, I128_MAX, I128_MAX, out));
        REQUIRE(out == I128_MAX);
    }

    SECTION("Result overflow is reported") {
        REQUIRE_FALSE(math::mul_div(I128_MAX, I128_MAX, 1, out));
    }

    SECTION("Negative operands and zero denominator are rejected") {
        REQUIRE_FALSE(math::mul_div(-1, 5, 2, out));
        REQUIRE_FALSE(math::mul_div(1, 5, 0, out));
    }
}

TEST_CASE("Product comparison and square root", "[math]") {
    REQUIRE(math::product_le(1'000'997, 999'003, 1'000'000, 1'000'000));
    REQUIRE_FALSE(math::product_le(1'001'000, 999'003, 1'000'000, 1'000'000));
    REQUIRE(math::product_le(I128_MAX, I128_MAX, I128_MAX, I128_MAX));

    REQUIRE(math::isqrt_product(1'000'000, 1'000'000) == 1'000'000);
    REQUIRE(math::isqrt_product(2'000'000, 1'000'000) == 1'414'213);
    REQUIRE(math::isqrt_product(2, 1) == 1);
    REQUIRE(math::isqrt_product(0, 100) == 0);
    REQUIRE(math::isqrt_product(I128_MAX, I128_MAX) == I128_MAX);
}

TEST_CASE("Fee engine", "[fee]") {
    FeeEngine engine;

    SECTION("Default pool rate is 30 bps") {
        REQUIRE(engine.fee_bps() == fees::SWAP_FEE_BPS);
        REQUIRE(engine.compute(1000) == 3);
        REQUIRE(engine.compute(333) == 0);
        REQUIRE(engine.compute(334) == 1);
    }

    SECTION("Zero and negative amounts are free") {
        REQUIRE(engine.compute(0) == 0);
        REQUIRE(engine.compute(-1000) == 0);
    }

    SECTION("Configuration above the ceiling is rejected") {
        REQUIRE(engine.configure(fees::MAX_FEE_BPS + 1) == errors::FEE_CONFIGURATION_INVALID);
        REQUIRE(engine.fee_bps() == fees::SWAP_FEE_BPS);
        REQUIRE_FALSE(FeeEngine::create(101).has_value());
        REQUIRE(FeeEngine::create(100).has_value());
    }

    SECTION("Ceiling rate matches max_fee") {
        auto ceiling = FeeEngine::create(fees::MAX_FEE_BPS);
        REQUIRE(ceiling);
        REQUIRE(ceiling->compute(123'456'789) == FeeEngine::max_fee(123'456'789));
        REQUIRE(FeeEngine::max_fee(1000) == 10);
    }

    SECTION("Huge amounts do not overflow") {
        REQUIRE(engine.compute(I128_MAX) == I128_MAX / 10000 * 30 + (I128_MAX % 10000) * 30 / 10000);
    }
}
