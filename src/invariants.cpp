// =============================================================================
// invariants.cpp - Read-only ledger invariant predicates
// =============================================================================

#include "swaptrade/invariants.hpp"
#include "swaptrade/fee.hpp"
#include "swaptrade/math.hpp"
#include <fmt/format.h>

namespace swaptrade {

const char* invariant_name(InvariantId id) {
    switch (id) {
        case InvariantId::CONSERVATION:          return "Conservation";
        case InvariantId::AUTHORIZATION:         return "Authorization";
        case InvariantId::MONOTONICITY:          return "Monotonicity";
        case InvariantId::FEE_BOUNDS:            return "FeeBounds";
        case InvariantId::CONSTANT_PRODUCT:      return "ConstantProduct";
        case InvariantId::NON_NEGATIVE_BALANCES: return "NonNegativeBalances";
        case InvariantId::LP_CONSERVATION:       return "LPConservation";
    }
    return "Unknown";
}

namespace invariants {

namespace {

InvariantReport pass(InvariantId id, I128 computed = 0, I128 expected = 0) {
    return InvariantReport{id, true, {}, computed, expected};
}

InvariantReport fail(InvariantId id, std::string diagnostic, I128 computed = 0, I128 expected = 0) {
    return InvariantReport{id, false, std::move(diagnostic), computed, expected};
}

// Users whose balance or LP position differs between two states.
// `after` indexes are append-only supersets of `before`.
std::vector<Address> changed_users(const LedgerState& before, const LedgerState& after) {
    std::vector<Address> out;
    for (const auto& user : after.balances.users()) {
        for (const auto& asset : after.balances.assets()) {
            if (before.balances.read(user, asset) != after.balances.read(user, asset)) {
                out.push_back(user);
                break;
            }
        }
    }
    for (const auto& provider : after.pool.providers()) {
        if (before.pool.lp_balance(provider) != after.pool.lp_balance(provider)) {
            out.push_back(provider);
        }
    }
    for (const auto& [trader, stats] : after.traders) {
        auto it = before.traders.find(trader);
        const TraderStats prior = it != before.traders.end() ? it->second : TraderStats{};
        if (prior.trade_count != stats.trade_count || prior.swap_volume != stats.swap_volume ||
            prior.pnl != stats.pnl) {
            out.push_back(trader);
        }
    }
    return out;
}

} // anonymous namespace

// =============================================================================
// Conservation
// =============================================================================

InvariantReport check_conservation(const LedgerState& state) {
    auto balances = state.balances.total();
    if (!balances) {
        return fail(InvariantId::CONSERVATION, "balance sum overflows 128 bits",
                    0, state.total_minted);
    }

    I128 total = *balances;
    if (!math::checked_add(total, state.pool.reserve_a(), total) ||
        !math::checked_add(total, state.pool.reserve_b(), total) ||
        !math::checked_add(total, state.fee_accumulator, total)) {
        return fail(InvariantId::CONSERVATION, "ledger total overflows 128 bits",
                    0, state.total_minted);
    }

    if (total != state.total_minted) {
        return fail(InvariantId::CONSERVATION,
                    fmt::format("ledger total {} != total minted {} (balances={}, "
                                "reserve_a={}, reserve_b={}, fees={})",
                                to_string(total), to_string(state.total_minted),
                                to_string(*balances), to_string(state.pool.reserve_a()),
                                to_string(state.pool.reserve_b()),
                                to_string(state.fee_accumulator)),
                    total, state.total_minted);
    }
    return pass(InvariantId::CONSERVATION, total, state.total_minted);
}

// =============================================================================
// Authorization
// =============================================================================

InvariantReport check_authorization(const LedgerState& before, const LedgerState& after,
                                    const Address& caller, Authority authority) {
    const bool caller_is_admin = caller == before.admin;

    if (authority == Authority::ADMIN && !caller_is_admin) {
        // An admin operation from anyone else may not have changed anything
        if (!changed_users(before, after).empty() || after.admin != before.admin ||
            after.paused != before.paused || after.total_minted != before.total_minted) {
            return fail(InvariantId::AUTHORIZATION,
                        fmt::format("admin-only state changed by non-admin {}",
                                    addresses::to_hex(caller)));
        }
        return pass(InvariantId::AUTHORIZATION);
    }

    if (authority == Authority::USER) {
        for (const auto& user : changed_users(before, after)) {
            if (user != caller) {
                return fail(InvariantId::AUTHORIZATION,
                            fmt::format("account {} changed by caller {}",
                                        addresses::to_hex(user), addresses::to_hex(caller)));
            }
        }
        if (after.admin != before.admin) {
            return fail(InvariantId::AUTHORIZATION,
                        fmt::format("admin changed by user operation from {}",
                                    addresses::to_hex(caller)));
        }
        if (after.total_minted != before.total_minted) {
            return fail(InvariantId::AUTHORIZATION,
                        fmt::format("supply minted by user operation from {}",
                                    addresses::to_hex(caller)));
        }
    }

    return pass(InvariantId::AUTHORIZATION);
}

// =============================================================================
// Monotonicity
// =============================================================================

InvariantReport check_monotonicity(const LedgerState& before, const LedgerState& after) {
    const MetricsTracker& b = before.metrics;
    const MetricsTracker& a = after.metrics;

    if (a.version() < b.version()) {
        return fail(InvariantId::MONOTONICITY,
                    fmt::format("version decreased {} -> {}", b.version(), a.version()));
    }
    if (a.timestamp() < b.timestamp()) {
        return fail(InvariantId::MONOTONICITY,
                    fmt::format("timestamp decreased {} -> {}", b.timestamp(), a.timestamp()));
    }
    if (a.metrics().trade_count < b.metrics().trade_count) {
        return fail(InvariantId::MONOTONICITY,
                    fmt::format("trade_count decreased {} -> {}",
                                b.metrics().trade_count, a.metrics().trade_count));
    }
    if (a.metrics().failed_order_count < b.metrics().failed_order_count) {
        return fail(InvariantId::MONOTONICITY,
                    fmt::format("failed_order_count decreased {} -> {}",
                                b.metrics().failed_order_count, a.metrics().failed_order_count));
    }
    if (a.metrics().balances_updated < b.metrics().balances_updated) {
        return fail(InvariantId::MONOTONICITY, "balances_updated decreased");
    }
    if (a.metrics().total_volume < b.metrics().total_volume) {
        return fail(InvariantId::MONOTONICITY, "total_volume decreased");
    }
    if (after.active_users.size() < before.active_users.size()) {
        return fail(InvariantId::MONOTONICITY,
                    fmt::format("active user index shrank {} -> {}",
                                before.active_users.size(), after.active_users.size()));
    }
    for (const auto& [trader, stats] : before.traders) {
        auto it = after.traders.find(trader);
        const uint64_t now = it != after.traders.end() ? it->second.trade_count : 0;
        if (now < stats.trade_count) {
            return fail(InvariantId::MONOTONICITY,
                        fmt::format("trade count of {} decreased {} -> {}",
                                    addresses::to_hex(trader), stats.trade_count, now));
        }
    }
    if (after.total_minted < before.total_minted) {
        return fail(InvariantId::MONOTONICITY,
                    fmt::format("total_minted decreased {} -> {}",
                                to_string(before.total_minted), to_string(after.total_minted)));
    }
    if (after.fee_accumulator < before.fee_accumulator) {
        return fail(InvariantId::MONOTONICITY,
                    fmt::format("fee_accumulator decreased {} -> {}",
                                to_string(before.fee_accumulator),
                                to_string(after.fee_accumulator)));
    }
    return pass(InvariantId::MONOTONICITY);
}

// =============================================================================
// Fee Bounds
// =============================================================================

InvariantReport check_fee_bounds(I128 amount, I128 fee) {
    if (fee < 0) {
        return fail(InvariantId::FEE_BOUNDS, fmt::format("negative fee {}", to_string(fee)),
                    fee, 0);
    }
    if (amount <= 0) {
        if (fee != 0) {
            return fail(InvariantId::FEE_BOUNDS,
                        fmt::format("fee {} charged on zero amount", to_string(fee)), fee, 0);
        }
        return pass(InvariantId::FEE_BOUNDS);
    }

    I128 ceiling = FeeEngine::max_fee(amount);
    if (fee > ceiling) {
        return fail(InvariantId::FEE_BOUNDS,
                    fmt::format("fee {} exceeds ceiling {} for amount {}",
                                to_string(fee), to_string(ceiling), to_string(amount)),
                    fee, ceiling);
    }
    return pass(InvariantId::FEE_BOUNDS, fee, ceiling);
}

// =============================================================================
// Constant Product
// =============================================================================

InvariantReport check_constant_product(I128 x0, I128 y0, I128 x1, I128 y1) {
    if (x0 < 0 || y0 < 0 || x1 < 0 || y1 < 0) {
        return fail(InvariantId::CONSTANT_PRODUCT,
                    fmt::format("negative reserves x0={}, y0={}, x1={}, y1={}",
                                to_string(x0), to_string(y0), to_string(x1), to_string(y1)));
    }
    if (!math::product_le(x1, y1, x0, y0)) {
        return fail(InvariantId::CONSTANT_PRODUCT,
                    fmt::format("constant product increased: x1={}, y1={}, x0={}, y0={}",
                                to_string(x1), to_string(y1), to_string(x0), to_string(y0)));
    }
    return pass(InvariantId::CONSTANT_PRODUCT);
}

InvariantReport check_constant_product(const SwapQuote& quote, const LiquidityPool& after) {
    // Priced input from the quote against the output reserve actually left
    const I128 y1 = after.reserve(other_side(quote.input_side));
    InvariantReport curve = check_constant_product(quote.reserve_in_before, quote.reserve_out_before,
                                                   quote.curve_in_after, y1);
    if (!curve.holds) return curve;
    return check_reserves(after);
}

InvariantReport check_reserves(const LiquidityPool& pool) {
    if (pool.reserve_a() < 0 || pool.reserve_b() < 0) {
        return fail(InvariantId::CONSTANT_PRODUCT,
                    fmt::format("negative reserves a={}, b={}",
                                to_string(pool.reserve_a()), to_string(pool.reserve_b())));
    }
    return pass(InvariantId::CONSTANT_PRODUCT);
}

// =============================================================================
// Non-negative Balances
// =============================================================================

InvariantReport check_non_negative_balances(const LedgerState& state) {
    for (const auto& user : state.balances.users()) {
        for (const auto& asset : state.balances.assets()) {
            I128 amount = state.balances.read(user, asset);
            if (amount < 0) {
                return fail(InvariantId::NON_NEGATIVE_BALANCES,
                            fmt::format("balance of {} in {} is {}", addresses::to_hex(user),
                                        asset.code(), to_string(amount)),
                            amount, 0);
            }
        }
    }
    for (const auto& provider : state.pool.providers()) {
        I128 lp = state.pool.lp_balance(provider);
        if (lp < 0) {
            return fail(InvariantId::NON_NEGATIVE_BALANCES,
                        fmt::format("LP balance of {} is {}", addresses::to_hex(provider),
                                    to_string(lp)),
                        lp, 0);
        }
    }
    return pass(InvariantId::NON_NEGATIVE_BALANCES);
}

// =============================================================================
// LP Conservation
// =============================================================================

InvariantReport check_lp_conservation(const LedgerState& state) {
    auto sum = state.pool.lp_positions_sum();
    I128 supply = state.pool.lp_total_supply();
    if (!sum) {
        return fail(InvariantId::LP_CONSERVATION, "LP position sum overflows 128 bits", 0, supply);
    }
    if (*sum > supply) {
        return fail(InvariantId::LP_CONSERVATION,
                    fmt::format("LP positions {} exceed supply {}", to_string(*sum),
                                to_string(supply)),
                    *sum, supply);
    }
    return pass(InvariantId::LP_CONSERVATION, *sum, supply);
}

// =============================================================================
// Audit
// =============================================================================

std::vector<InvariantReport> audit(const LedgerState& state) {
    return {
        check_conservation(state),
        check_reserves(state.pool),
        check_non_negative_balances(state),
        check_lp_conservation(state),
    };
}

} // namespace invariants

} // namespace swaptrade
