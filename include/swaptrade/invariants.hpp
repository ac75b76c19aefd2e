#ifndef SWAPTRADE_INVARIANTS_HPP
#define SWAPTRADE_INVARIANTS_HPP

#include <string>
#include <vector>

#include "types.hpp"
#include "state.hpp"

namespace swaptrade {

// =============================================================================
// Invariant Identifiers
// =============================================================================

enum class InvariantId : uint8_t {
    CONSERVATION = 1,          // sum(balances) + reserves + fees == total_minted
    AUTHORIZATION = 2,         // only authorized identities changed state
    MONOTONICITY = 3,          // version/clock/counters never decrease
    FEE_BOUNDS = 4,            // 0 <= fee <= 1% of amount
    CONSTANT_PRODUCT = 5,      // x1 * y1 <= x0 * y0, reserves >= 0
    NON_NEGATIVE_BALANCES = 6, // every balance >= 0
    LP_CONSERVATION = 7        // sum(lp positions) <= lp supply
};

const char* invariant_name(InvariantId id);

// Outcome of one predicate. computed/expected carry the compared totals
// where the predicate has them (conservation, LP conservation).
struct InvariantReport {
    InvariantId id;
    bool holds;
    std::string diagnostic;   // Empty when holds
    I128 computed;
    I128 expected;
};

// Who an operation claims authority as
enum class Authority : uint8_t {
    USER = 0,
    ADMIN = 1
};

// =============================================================================
// Invariant Predicates
// =============================================================================
//
// Pure functions over committed or would-be state. None of them mutates
// anything, so external verifiers may call them at any time.

namespace invariants {

InvariantReport check_conservation(const LedgerState& state);

InvariantReport check_authorization(const LedgerState& before, const LedgerState& after,
                                    const Address& caller, Authority authority);

InvariantReport check_monotonicity(const LedgerState& before, const LedgerState& after);

InvariantReport check_fee_bounds(I128 amount, I128 fee);

// Priced-curve product: (x1, y1) against (x0, y0)
InvariantReport check_constant_product(I128 x0, I128 y0, I128 x1, I128 y1);

// Curve product of a swap quote, taking y1 from the pool after the swap,
// plus non-negative physical reserves
InvariantReport check_constant_product(const SwapQuote& quote, const LiquidityPool& after);

// State-only part of the constant-product check
InvariantReport check_reserves(const LiquidityPool& pool);

InvariantReport check_non_negative_balances(const LedgerState& state);

InvariantReport check_lp_conservation(const LedgerState& state);

// Every predicate that needs only the current state: conservation,
// non-negative reserves and balances, LP conservation
std::vector<InvariantReport> audit(const LedgerState& state);

} // namespace invariants

} // namespace swaptrade

#endif // SWAPTRADE_INVARIANTS_HPP
