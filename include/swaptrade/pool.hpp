#ifndef SWAPTRADE_POOL_HPP
#define SWAPTRADE_POOL_HPP

#include <map>
#include <set>
#include <vector>
#include <optional>

#include "types.hpp"
#include "fee.hpp"

namespace swaptrade {

// =============================================================================
// Pool Side
// =============================================================================

enum class PoolSide : uint8_t {
    A = 0,
    B = 1
};

inline PoolSide other_side(PoolSide side) {
    return side == PoolSide::A ? PoolSide::B : PoolSide::A;
}

// =============================================================================
// LP Position
// =============================================================================

struct LPPosition {
    Address owner;
    I128 asset_a_deposited;
    I128 asset_b_deposited;
    I128 lp_tokens;
};

// =============================================================================
// Swap Quote (computed against a fixed reserve snapshot)
// =============================================================================

struct SwapQuote {
    PoolSide input_side;
    I128 amount_in;           // Gross input debited from the trader
    I128 fee;                 // Withheld from the priced curve
    I128 effective_in;        // amount_in - fee
    I128 amount_out;          // Credited to the trader (may be 0)

    // Curve reserves: x0/y0 before, x1/y1 after pricing
    I128 reserve_in_before;
    I128 reserve_out_before;
    I128 curve_in_after;      // x0 + effective_in
    I128 reserve_out_after;   // y0 - amount_out

    // Physical reserve after the swap (includes the fee under POOL routing)
    I128 reserve_in_after;
    I128 fee_to_accumulator;  // Non-zero only under ACCUMULATOR routing
};

struct WithdrawResult {
    I128 amount_a;
    I128 amount_b;
};

// =============================================================================
// LiquidityPool - two-asset constant-product AMM with LP accounting
// =============================================================================

class LiquidityPool {
public:
    LiquidityPool();
    LiquidityPool(Asset asset_a, Asset asset_b);

    const Asset& asset_a() const { return asset_a_; }
    const Asset& asset_b() const { return asset_b_; }
    const Asset& asset(PoolSide side) const { return side == PoolSide::A ? asset_a_ : asset_b_; }
    std::optional<PoolSide> side_of(const Asset& asset) const;

    I128 reserve_a() const { return reserve_a_; }
    I128 reserve_b() const { return reserve_b_; }
    I128 reserve(PoolSide side) const { return side == PoolSide::A ? reserve_a_ : reserve_b_; }

    // =========================================================================
    // Swap
    // =========================================================================

    // Pure: prices input_amount against the current reserves
    int32_t quote_swap(PoolSide input_side, I128 input_amount, const FeeEngine& fee_engine,
                       FeeRouting routing, SwapQuote& out) const;

    // Commit a quote; INVALID_STATE if the reserves moved since quoting
    int32_t apply_swap(const SwapQuote& quote);

    // =========================================================================
    // Liquidity
    // =========================================================================

    // LP tokens a deposit would mint (0 if the deposit is too small)
    int32_t quote_deposit(I128 amount_a, I128 amount_b, I128& lp_out) const;

    int32_t deposit_liquidity(const Address& provider, I128 amount_a, I128 amount_b,
                              I128& lp_minted);

    int32_t withdraw_liquidity(const Address& provider, I128 lp_amount, WithdrawResult& out);

    // Permanently removes LP tokens from a position; total supply is unchanged
    int32_t burn_lp_tokens(const Address& provider, I128 lp_amount);

    // =========================================================================
    // LP Queries
    // =========================================================================

    I128 lp_total_supply() const { return lp_total_supply_; }
    I128 lp_balance(const Address& provider) const;
    std::optional<LPPosition> position(const Address& provider) const;
    const std::vector<Address>& providers() const { return provider_index_; }

    // Sum over the provider index; nullopt on overflow
    std::optional<I128> lp_positions_sum() const;

    // =========================================================================
    // Restore (state blob decoding)
    // =========================================================================

    int32_t restore(I128 reserve_a, I128 reserve_b, I128 lp_total_supply,
                    const std::vector<LPPosition>& positions);

private:
    Asset asset_a_;
    Asset asset_b_;
    I128 reserve_a_{0};
    I128 reserve_b_{0};

    I128 lp_total_supply_{0};
    std::map<Address, LPPosition> positions_;
    std::vector<Address> provider_index_;  // Append-only
    std::set<Address> known_providers_;

    I128& reserve_ref(PoolSide side) { return side == PoolSide::A ? reserve_a_ : reserve_b_; }
    LPPosition& position_ref(const Address& provider);
};

} // namespace swaptrade

#endif // SWAPTRADE_POOL_HPP
