// =============================================================================
// pool.cpp - Constant-product AMM pool with LP token accounting
// =============================================================================

#include "swaptrade/pool.hpp"
#include "swaptrade/math.hpp"
#include <algorithm>

namespace swaptrade {

// =============================================================================
// Constructor
// =============================================================================

LiquidityPool::LiquidityPool()
    : asset_a_(NATIVE_XLM), asset_b_(USDC) {}

LiquidityPool::LiquidityPool(Asset asset_a, Asset asset_b)
    : asset_a_(std::move(asset_a)), asset_b_(std::move(asset_b)) {}

std::optional<PoolSide> LiquidityPool::side_of(const Asset& asset) const {
    if (asset == asset_a_) return PoolSide::A;
    if (asset == asset_b_) return PoolSide::B;
    return std::nullopt;
}

// =============================================================================
// Swap Computation
// =============================================================================

int32_t LiquidityPool::quote_swap(PoolSide input_side, I128 input_amount,
                                  const FeeEngine& fee_engine, FeeRouting routing,
                                  SwapQuote& out) const {
    if (input_amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    const I128 x0 = reserve(input_side);
    const I128 y0 = reserve(other_side(input_side));
    if (x0 <= 0 || y0 <= 0) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    // Fee is withheld from the amount entering the curve, not added on top
    const I128 fee = fee_engine.compute(input_amount);
    const I128 effective_in = input_amount - fee;

    I128 x1 = 0;
    if (!math::checked_add(x0, effective_in, x1)) {
        return errors::AMOUNT_OVERFLOW;
    }

    // y1 = floor(k0 / x1) with k0 = x0 * y0 held exactly in 256 bits.
    // Rounding down y1 rounds the output up by at most one unit in the
    // pool's favour: x1 * y1 <= k0.
    I128 y1 = 0;
    if (!math::mul_div(x0, y0, x1, y1)) {
        return errors::AMOUNT_OVERFLOW;
    }
    const I128 output = y0 - y1;

    I128 reserve_in_after = x1;
    I128 fee_to_accumulator = 0;
    if (routing == FeeRouting::POOL) {
        if (!math::checked_add(x0, input_amount, reserve_in_after)) {
            return errors::AMOUNT_OVERFLOW;
        }
    } else {
        fee_to_accumulator = fee;
    }

    out.input_side = input_side;
    out.amount_in = input_amount;
    out.fee = fee;
    out.effective_in = effective_in;
    out.amount_out = output;
    out.reserve_in_before = x0;
    out.reserve_out_before = y0;
    out.curve_in_after = x1;
    out.reserve_out_after = y1;
    out.reserve_in_after = reserve_in_after;
    out.fee_to_accumulator = fee_to_accumulator;
    return errors::OK;
}

int32_t LiquidityPool::apply_swap(const SwapQuote& quote) {
    const PoolSide out_side = other_side(quote.input_side);
    if (reserve(quote.input_side) != quote.reserve_in_before ||
        reserve(out_side) != quote.reserve_out_before) {
        return errors::INVALID_STATE;
    }
    if (quote.reserve_in_after < 0 || quote.reserve_out_after < 0) {
        return errors::INVALID_STATE;
    }

    reserve_ref(quote.input_side) = quote.reserve_in_after;
    reserve_ref(out_side) = quote.reserve_out_after;
    return errors::OK;
}

// =============================================================================
// Add Liquidity
// =============================================================================

int32_t LiquidityPool::quote_deposit(I128 amount_a, I128 amount_b, I128& lp_out) const {
    if (amount_a <= 0 || amount_b <= 0) {
        return errors::INVALID_AMOUNT;
    }

    if (lp_total_supply_ == 0) {
        // First provider: geometric mean of the deposit
        lp_out = math::isqrt_product(amount_a, amount_b);
        return errors::OK;
    }

    if (reserve_a_ <= 0 || reserve_b_ <= 0) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    // Proportional share; the smaller side keeps the ratio honest
    I128 share_a = 0;
    I128 share_b = 0;
    if (!math::mul_div(amount_a, lp_total_supply_, reserve_a_, share_a) ||
        !math::mul_div(amount_b, lp_total_supply_, reserve_b_, share_b)) {
        return errors::AMOUNT_OVERFLOW;
    }
    lp_out = std::min(share_a, share_b);
    return errors::OK;
}

int32_t LiquidityPool::deposit_liquidity(const Address& provider, I128 amount_a,
                                         I128 amount_b, I128& lp_minted) {
    I128 lp = 0;
    int32_t status = quote_deposit(amount_a, amount_b, lp);
    if (status != errors::OK) return status;
    if (lp <= 0) {
        return errors::INVALID_AMOUNT;
    }

    // Compute everything before touching state
    I128 new_reserve_a = 0, new_reserve_b = 0, new_supply = 0;
    if (!math::checked_add(reserve_a_, amount_a, new_reserve_a) ||
        !math::checked_add(reserve_b_, amount_b, new_reserve_b) ||
        !math::checked_add(lp_total_supply_, lp, new_supply)) {
        return errors::AMOUNT_OVERFLOW;
    }

    LPPosition updated{provider, 0, 0, 0};
    if (auto existing = position(provider)) updated = *existing;
    if (!math::checked_add(updated.asset_a_deposited, amount_a, updated.asset_a_deposited) ||
        !math::checked_add(updated.asset_b_deposited, amount_b, updated.asset_b_deposited) ||
        !math::checked_add(updated.lp_tokens, lp, updated.lp_tokens)) {
        return errors::AMOUNT_OVERFLOW;
    }

    reserve_a_ = new_reserve_a;
    reserve_b_ = new_reserve_b;
    lp_total_supply_ = new_supply;
    position_ref(provider) = updated;

    lp_minted = lp;
    return errors::OK;
}

// =============================================================================
// Remove Liquidity
// =============================================================================

int32_t LiquidityPool::withdraw_liquidity(const Address& provider, I128 lp_amount,
                                          WithdrawResult& out) {
    if (lp_amount <= 0) {
        return errors::INVALID_AMOUNT;
    }
    if (lp_balance(provider) < lp_amount) {
        return errors::INSUFFICIENT_LP_TOKENS;
    }
    if (lp_total_supply_ <= 0) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    I128 amount_a = 0, amount_b = 0;
    if (!math::mul_div(lp_amount, reserve_a_, lp_total_supply_, amount_a) ||
        !math::mul_div(lp_amount, reserve_b_, lp_total_supply_, amount_b)) {
        return errors::AMOUNT_OVERFLOW;
    }
    if (amount_a <= 0 || amount_b <= 0) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    // lp_amount <= supply, so the shares never exceed the reserves
    reserve_a_ -= amount_a;
    reserve_b_ -= amount_b;
    lp_total_supply_ -= lp_amount;

    LPPosition& pos = position_ref(provider);
    pos.lp_tokens -= lp_amount;
    pos.asset_a_deposited = std::max<I128>(0, pos.asset_a_deposited - amount_a);
    pos.asset_b_deposited = std::max<I128>(0, pos.asset_b_deposited - amount_b);

    out.amount_a = amount_a;
    out.amount_b = amount_b;
    return errors::OK;
}

int32_t LiquidityPool::burn_lp_tokens(const Address& provider, I128 lp_amount) {
    if (lp_amount <= 0) {
        return errors::INVALID_AMOUNT;
    }
    if (lp_balance(provider) < lp_amount) {
        return errors::INSUFFICIENT_LP_TOKENS;
    }

    position_ref(provider).lp_tokens -= lp_amount;
    return errors::OK;
}

// =============================================================================
// LP Queries
// =============================================================================

I128 LiquidityPool::lp_balance(const Address& provider) const {
    auto it = positions_.find(provider);
    return it != positions_.end() ? it->second.lp_tokens : 0;
}

std::optional<LPPosition> LiquidityPool::position(const Address& provider) const {
    auto it = positions_.find(provider);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::optional<I128> LiquidityPool::lp_positions_sum() const {
    I128 sum = 0;
    for (const auto& provider : provider_index_) {
        if (!math::checked_add(sum, lp_balance(provider), sum)) {
            return std::nullopt;
        }
    }
    return sum;
}

LPPosition& LiquidityPool::position_ref(const Address& provider) {
    if (known_providers_.insert(provider).second) {
        provider_index_.push_back(provider);
    }
    auto it = positions_.find(provider);
    if (it == positions_.end()) {
        it = positions_.emplace(provider, LPPosition{provider, 0, 0, 0}).first;
    }
    return it->second;
}

// =============================================================================
// Restore
// =============================================================================

int32_t LiquidityPool::restore(I128 reserve_a, I128 reserve_b, I128 lp_total_supply,
                               const std::vector<LPPosition>& positions) {
    if (reserve_a < 0 || reserve_b < 0 || lp_total_supply < 0) {
        return errors::INVALID_STATE;
    }
    for (const auto& pos : positions) {
        if (pos.lp_tokens < 0 || pos.asset_a_deposited < 0 || pos.asset_b_deposited < 0) {
            return errors::INVALID_STATE;
        }
    }

    reserve_a_ = reserve_a;
    reserve_b_ = reserve_b;
    lp_total_supply_ = lp_total_supply;
    positions_.clear();
    provider_index_.clear();
    known_providers_.clear();
    for (const auto& pos : positions) {
        position_ref(pos.owner) = pos;
    }
    return errors::OK;
}

} // namespace swaptrade
