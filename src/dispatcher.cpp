// =============================================================================
// dispatcher.cpp - OperationDispatcher state machine
// =============================================================================

#include "swaptrade/dispatcher.hpp"
#include "swaptrade/codec.hpp"
#include "swaptrade/log.hpp"
#include "swaptrade/math.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <limits>

namespace swaptrade {

namespace {

// Invariant subsets
constexpr uint32_t CHECK_CONSERVATION     = 1u << 0;
constexpr uint32_t CHECK_AUTHORIZATION    = 1u << 1;
constexpr uint32_t CHECK_MONOTONICITY     = 1u << 2;
constexpr uint32_t CHECK_FEE_BOUNDS       = 1u << 3;
constexpr uint32_t CHECK_CONSTANT_PRODUCT = 1u << 4;
constexpr uint32_t CHECK_NON_NEGATIVE     = 1u << 5;
constexpr uint32_t CHECK_LP_CONSERVATION  = 1u << 6;

constexpr uint32_t CHECKS_ADMIN = CHECK_AUTHORIZATION | CHECK_MONOTONICITY;
constexpr uint32_t CHECKS_MINT = CHECK_CONSERVATION | CHECKS_ADMIN | CHECK_NON_NEGATIVE;
constexpr uint32_t CHECKS_TRANSFER = CHECKS_MINT | CHECK_FEE_BOUNDS;
constexpr uint32_t CHECKS_SWAP = CHECKS_TRANSFER | CHECK_CONSTANT_PRODUCT;
constexpr uint32_t CHECKS_LIQUIDITY = CHECKS_MINT | CHECK_CONSTANT_PRODUCT | CHECK_LP_CONSERVATION;

constexpr I128 RATE_SCALE = 10'000'000;

// Failures that never reached the state count as failed orders; a halted
// dispatcher or a broken clock does not
bool counts_as_failure(int32_t status) {
    return status != errors::OK && status != errors::HALTED &&
           status != errors::CLOCK_REGRESSION;
}

void note_saturation(bool ok, const char* counter) {
    if (!ok) logger()->warn("{} saturated", counter);
}

I128 saturating_add(I128 a, I128 b) {
    I128 out = 0;
    if (math::checked_add(a, b, out)) return out;
    return b > 0 ? I128_MAX : I128_MIN;
}

// Per-trader counters; the first trade adds the user to the active index
void record_trader(LedgerState& w, const Address& user, I128 amount_in, I128 amount_out) {
    TraderStats& trader = w.traders[user];
    if (trader.trade_count == 0) w.active_users.push_back(user);
    if (trader.trade_count < std::numeric_limits<uint64_t>::max()) ++trader.trade_count;
    trader.swap_volume = saturating_add(trader.swap_volume, amount_in);
    trader.pnl = saturating_add(trader.pnl, amount_out - amount_in);
}

} // anonymous namespace

// =============================================================================
// Names
// =============================================================================

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::VALIDATING: return "Validating";
        case Phase::COMPUTING:  return "Computing";
        case Phase::MUTATING:   return "Mutating";
        case Phase::CHECKING:   return "Checking";
        case Phase::COMMITTED:  return "Committed";
        case Phase::ABORTED:    return "Aborted";
    }
    return "Unknown";
}

namespace {

struct OpEntry {
    OpKind op;
    const char* name;
};

constexpr OpEntry OP_NAMES[] = {
    {OpKind::MINT, "mint"},
    {OpKind::TRANSFER, "transfer"},
    {OpKind::SWAP, "swap"},
    {OpKind::ADD_LIQUIDITY, "add_liquidity"},
    {OpKind::REMOVE_LIQUIDITY, "remove_liquidity"},
    {OpKind::BURN_LP_TOKENS, "burn_lp_tokens"},
    {OpKind::SET_ADMIN, "admin_set_admin"},
    {OpKind::PAUSE, "pause_trading"},
    {OpKind::RESUME, "resume_trading"},
    {OpKind::MIGRATE, "migrate"},
    {OpKind::SET_SWAP_FEE, "set_swap_fee"},
    {OpKind::SET_TRANSFER_FEE, "set_transfer_fee"},
    {OpKind::SET_FEE_ROUTING, "set_fee_routing"},
};

} // anonymous namespace

const char* op_name(OpKind op) {
    for (const auto& entry : OP_NAMES) {
        if (entry.op == op) return entry.name;
    }
    return "unknown";
}

std::optional<OpKind> parse_op(std::string_view name) {
    for (const auto& entry : OP_NAMES) {
        if (name == entry.name) return entry.op;
    }
    return std::nullopt;
}

// =============================================================================
// Constructor
// =============================================================================

OperationDispatcher::OperationDispatcher(LedgerConfig config, const IIdentityVerifier* verifier)
    : config_(std::move(config))
    , gate_(verifier)
    , hooks_(&null_hooks_) {
    config_.validate();

    state_.admin = config_.admin;
    state_.swap_fee_bps = config_.swap_fee_bps;
    state_.transfer_fee_bps = config_.transfer_fee_bps;
    state_.swap_fee_routing = config_.swap_fee_routing;
    state_.pool = LiquidityPool(config_.asset_a, config_.asset_b);
}

void OperationDispatcher::set_hooks(IDispatchHooks* hooks) {
    hooks_ = hooks ? hooks : &null_hooks_;
}

// =============================================================================
// Transition Skeleton
// =============================================================================

OperationResult OperationDispatcher::run(OpKind op, const CallContext& ctx, Authority authority,
                                         uint32_t checks, const Validator& validate,
                                         const Planner& plan, const Mutator& mutate) {
    if (state_.halted && op != OpKind::RESUME) {
        return reject(op, Phase::VALIDATING, errors::HALTED,
                      "dispatcher halted after an invariant violation");
    }
    if (ctx.timestamp < state_.metrics.timestamp()) {
        return reject(op, Phase::VALIDATING, errors::CLOCK_REGRESSION,
                      fmt::format("clock went from {} to {}", state_.metrics.timestamp(),
                                  ctx.timestamp));
    }

    // Validating: authorization first, then preconditions on the committed state
    int32_t status = validate(state_);
    if (status != errors::OK) {
        return reject(op, Phase::VALIDATING, status);
    }

    // Computing: pure, against the same snapshot
    Transition transition;
    if (plan) {
        status = plan(state_, transition);
        if (status != errors::OK) {
            return reject(op, Phase::COMPUTING, status);
        }
    }

    // Mutating: only the working copy changes
    LedgerState working = state_;
    OperationResult result{errors::OK, Phase::MUTATING, std::nullopt, 0, 0, {}};
    status = working.metrics.observe_timestamp(ctx.timestamp);
    if (status == errors::OK) {
        status = mutate(working, transition, result);
    }
    if (status != errors::OK) {
        return reject(op, Phase::MUTATING, status);
    }
    hooks_->after_mutate(op, working);

    // Checking
    auto violation = check(state_, working, ctx, authority, checks, transition);
    if (violation) {
        halt(op, *violation);
        return reject(op, Phase::CHECKING, errors::INVARIANT_VIOLATION,
                      fmt::format("{}: {}", invariant_name(violation->id), violation->diagnostic));
    }

    state_ = std::move(working);
    result.phase = Phase::COMMITTED;
    logger()->debug("{} committed by {} at {}", op_name(op), addresses::to_hex(ctx.caller),
                    ctx.timestamp);
    return result;
}

std::optional<InvariantReport> OperationDispatcher::check(const LedgerState& before,
                                                          const LedgerState& after,
                                                          const CallContext& ctx,
                                                          Authority authority, uint32_t checks,
                                                          const Transition& transition) const {
    std::optional<InvariantReport> failed;
    auto verify = [&failed](InvariantReport report) {
        if (!failed && !report.holds) failed = std::move(report);
    };

    if (checks & CHECK_CONSERVATION) verify(invariants::check_conservation(after));
    if (checks & CHECK_AUTHORIZATION) {
        verify(invariants::check_authorization(before, after, ctx.caller, authority));
    }
    if (checks & CHECK_MONOTONICITY) verify(invariants::check_monotonicity(before, after));
    if (checks & CHECK_FEE_BOUNDS) {
        for (const auto& [amount, fee] : transition.fees) {
            verify(invariants::check_fee_bounds(amount, fee));
        }
    }
    if (checks & CHECK_CONSTANT_PRODUCT) {
        if (transition.quote) {
            verify(invariants::check_constant_product(*transition.quote, after.pool));
        } else {
            verify(invariants::check_reserves(after.pool));
        }
    }
    if (checks & CHECK_NON_NEGATIVE) verify(invariants::check_non_negative_balances(after));
    if (checks & CHECK_LP_CONSERVATION) verify(invariants::check_lp_conservation(after));

    return failed;
}

OperationResult OperationDispatcher::reject(OpKind op, Phase at, int32_t status,
                                            std::string diagnostic) const {
    if (is_fatal(status)) {
        logger()->critical("{} aborted at {}: {} {}", op_name(op), phase_name(at),
                           error_name(status), diagnostic);
    } else {
        logger()->debug("{} aborted at {}: {}", op_name(op), phase_name(at), error_name(status));
    }
    return OperationResult{status, Phase::ABORTED, at, 0, 0, std::move(diagnostic)};
}

void OperationDispatcher::halt(OpKind op, const InvariantReport& report) {
    // Committed state is untouched; stop further mutations until an admin resumes
    state_.paused = true;
    state_.halted = true;
    logger()->critical("{} violated {} ({}); trading paused and dispatcher halted",
                       op_name(op), invariant_name(report.id), report.diagnostic);
}

int32_t OperationDispatcher::require_admin(const LedgerState& state, const CallContext& ctx) const {
    return gate_.require_admin(ctx.caller, state.admin);
}

int32_t OperationDispatcher::require_user(const CallContext& ctx, const Address& user) const {
    return gate_.require(ctx.caller, user);
}

// =============================================================================
// Mint
// =============================================================================

OperationResult OperationDispatcher::mint(const CallContext& ctx, const Address& to,
                                          const Asset& asset, I128 amount) {
    auto validate = [&](const LedgerState& s) {
        int32_t status = require_admin(s, ctx);
        if (status != errors::OK) return status;
        if (amount <= 0) return errors::INVALID_AMOUNT;
        return errors::OK;
    };

    auto mutate = [&](LedgerState& w, const Transition&, OperationResult& result) {
        I128 minted = 0;
        if (!math::checked_add(w.total_minted, amount, minted)) return errors::AMOUNT_OVERFLOW;
        int32_t status = w.balances.credit(to, asset, amount);
        if (status != errors::OK) return status;
        w.total_minted = minted;
        note_saturation(w.metrics.record_balance_updates(1), "balances_updated");
        result.amount0 = amount;
        return errors::OK;
    };

    return run(OpKind::MINT, ctx, Authority::ADMIN, CHECKS_MINT, validate, nullptr, mutate);
}

// =============================================================================
// Transfer (in-account conversion)
// =============================================================================

OperationResult OperationDispatcher::transfer(const CallContext& ctx, const Asset& from_asset,
                                              const Asset& to_asset, const Address& user,
                                              I128 amount) {
    auto validate = [&](const LedgerState& s) {
        int32_t status = require_user(ctx, user);
        if (status != errors::OK) return status;
        if (s.paused) return errors::TRADING_PAUSED;
        if (amount <= 0) return errors::INVALID_AMOUNT;
        if (from_asset == to_asset) return errors::SAME_ASSET_SWAP;
        if (s.balances.read(user, from_asset) < amount) return errors::INSUFFICIENT_BALANCE;
        return errors::OK;
    };

    auto plan = [&](const LedgerState& s, Transition& t) {
        auto engine = FeeEngine::create(s.transfer_fee_bps);
        if (!engine) return errors::FEE_CONFIGURATION_INVALID;
        t.fees.emplace_back(amount, engine->compute(amount));
        return errors::OK;
    };

    auto mutate = [&](LedgerState& w, const Transition& t, OperationResult& result) {
        const I128 fee = t.fees.front().second;
        const I128 credited = amount - fee;

        I128 fees_after = 0;
        if (!math::checked_add(w.fee_accumulator, fee, fees_after)) return errors::AMOUNT_OVERFLOW;

        int32_t status = w.balances.debit(user, from_asset, amount);
        if (status != errors::OK) return status;
        status = w.balances.credit(user, to_asset, credited);
        if (status != errors::OK) return status;

        w.fee_accumulator = fees_after;
        note_saturation(w.metrics.record_balance_updates(2), "balances_updated");
        result.amount0 = credited;
        result.amount1 = fee;
        return errors::OK;
    };

    return run(OpKind::TRANSFER, ctx, Authority::USER, CHECKS_TRANSFER, validate, plan, mutate);
}

// =============================================================================
// Swap
// =============================================================================

OperationResult OperationDispatcher::swap(const CallContext& ctx, const Address& user,
                                          const Asset& from_token, const Asset& to_token,
                                          I128 amount, I128 min_out) {
    auto validate = [&](const LedgerState& s) {
        int32_t status = require_user(ctx, user);
        if (status != errors::OK) return status;
        if (s.paused) return errors::TRADING_PAUSED;
        if (amount <= 0 || min_out < 0) return errors::INVALID_AMOUNT;
        if (from_token == to_token) return errors::SAME_ASSET_SWAP;
        if (!s.pool.side_of(from_token) || !s.pool.side_of(to_token)) return errors::INVALID_ASSET;
        if (s.balances.read(user, from_token) < amount) return errors::INSUFFICIENT_BALANCE;
        return errors::OK;
    };

    auto plan = [&](const LedgerState& s, Transition& t) {
        auto engine = FeeEngine::create(s.swap_fee_bps);
        if (!engine) return errors::FEE_CONFIGURATION_INVALID;

        SwapQuote quote;
        int32_t status = s.pool.quote_swap(*s.pool.side_of(from_token), amount, *engine,
                                           s.swap_fee_routing, quote);
        if (status != errors::OK) return status;
        if (quote.amount_out < min_out) return errors::SLIPPAGE_EXCEEDED;

        t.fees.emplace_back(amount, quote.fee);
        t.quote = quote;
        return errors::OK;
    };

    auto mutate = [&](LedgerState& w, const Transition& t, OperationResult& result) {
        const SwapQuote& quote = *t.quote;

        I128 fees_after = 0;
        if (!math::checked_add(w.fee_accumulator, quote.fee_to_accumulator, fees_after)) {
            return errors::AMOUNT_OVERFLOW;
        }

        int32_t status = w.balances.debit(user, from_token, amount);
        if (status != errors::OK) return status;
        status = w.balances.credit(user, to_token, quote.amount_out);
        if (status != errors::OK) return status;
        status = w.pool.apply_swap(quote);
        if (status != errors::OK) return status;
        w.fee_accumulator = fees_after;

        note_saturation(w.metrics.record_trade(), "trade_count");
        note_saturation(w.metrics.record_volume(amount), "total_volume");
        note_saturation(w.metrics.record_balance_updates(2), "balances_updated");
        record_trader(w, user, amount, quote.amount_out);

        I128 rate = 0;
        if (!math::mul_div(quote.amount_out, RATE_SCALE, amount, rate)) rate = 0;
        auto& records = w.history[user];
        records.push_back(SwapRecord{ctx.timestamp, from_token, to_token, amount,
                                     quote.amount_out, quote.fee, rate});
        while (records.size() > config_.history_limit) records.pop_front();

        result.amount0 = quote.amount_out;
        result.amount1 = quote.fee;
        return errors::OK;
    };

    OperationResult result =
        run(OpKind::SWAP, ctx, Authority::USER, CHECKS_SWAP, validate, plan, mutate);
    if (counts_as_failure(result.status)) {
        note_saturation(state_.metrics.record_failure(), "failed_order_count");
    }
    return result;
}

// =============================================================================
// Liquidity
// =============================================================================

OperationResult OperationDispatcher::add_liquidity(const CallContext& ctx, const Address& user,
                                                   I128 amount_a, I128 amount_b) {
    auto validate = [&](const LedgerState& s) {
        int32_t status = require_user(ctx, user);
        if (status != errors::OK) return status;
        if (s.paused) return errors::TRADING_PAUSED;
        if (amount_a <= 0 || amount_b <= 0) return errors::INVALID_AMOUNT;
        if (s.balances.read(user, s.pool.asset_a()) < amount_a ||
            s.balances.read(user, s.pool.asset_b()) < amount_b) {
            return errors::INSUFFICIENT_BALANCE;
        }
        return errors::OK;
    };

    auto plan = [&](const LedgerState& s, Transition&) {
        I128 lp = 0;
        int32_t status = s.pool.quote_deposit(amount_a, amount_b, lp);
        if (status != errors::OK) return status;
        // Deposit too small to mint a single LP unit
        if (lp <= 0) return errors::INVALID_AMOUNT;
        return errors::OK;
    };

    auto mutate = [&](LedgerState& w, const Transition&, OperationResult& result) {
        int32_t status = w.balances.debit(user, w.pool.asset_a(), amount_a);
        if (status != errors::OK) return status;
        status = w.balances.debit(user, w.pool.asset_b(), amount_b);
        if (status != errors::OK) return status;

        I128 minted = 0;
        status = w.pool.deposit_liquidity(user, amount_a, amount_b, minted);
        if (status != errors::OK) return status;

        note_saturation(w.metrics.record_balance_updates(2), "balances_updated");
        result.amount0 = minted;
        return errors::OK;
    };

    return run(OpKind::ADD_LIQUIDITY, ctx, Authority::USER, CHECKS_LIQUIDITY,
               validate, plan, mutate);
}

OperationResult OperationDispatcher::remove_liquidity(const CallContext& ctx, const Address& user,
                                                      I128 lp_amount) {
    auto validate = [&](const LedgerState& s) {
        int32_t status = require_user(ctx, user);
        if (status != errors::OK) return status;
        if (lp_amount <= 0) return errors::INVALID_AMOUNT;
        if (s.pool.lp_balance(user) < lp_amount) return errors::INSUFFICIENT_LP_TOKENS;
        return errors::OK;
    };

    auto mutate = [&](LedgerState& w, const Transition&, OperationResult& result) {
        WithdrawResult paid{0, 0};
        int32_t status = w.pool.withdraw_liquidity(user, lp_amount, paid);
        if (status != errors::OK) return status;
        status = w.balances.credit(user, w.pool.asset_a(), paid.amount_a);
        if (status != errors::OK) return status;
        status = w.balances.credit(user, w.pool.asset_b(), paid.amount_b);
        if (status != errors::OK) return status;

        note_saturation(w.metrics.record_balance_updates(2), "balances_updated");
        result.amount0 = paid.amount_a;
        result.amount1 = paid.amount_b;
        return errors::OK;
    };

    return run(OpKind::REMOVE_LIQUIDITY, ctx, Authority::USER, CHECKS_LIQUIDITY,
               validate, nullptr, mutate);
}

OperationResult OperationDispatcher::burn_lp_tokens(const CallContext& ctx, const Address& user,
                                                    I128 lp_amount) {
    auto validate = [&](const LedgerState& s) {
        int32_t status = require_user(ctx, user);
        if (status != errors::OK) return status;
        if (lp_amount <= 0) return errors::INVALID_AMOUNT;
        if (s.pool.lp_balance(user) < lp_amount) return errors::INSUFFICIENT_LP_TOKENS;
        return errors::OK;
    };

    auto mutate = [&](LedgerState& w, const Transition&, OperationResult& result) {
        int32_t status = w.pool.burn_lp_tokens(user, lp_amount);
        if (status != errors::OK) return status;
        result.amount0 = lp_amount;
        return errors::OK;
    };

    return run(OpKind::BURN_LP_TOKENS, ctx, Authority::USER, CHECKS_LIQUIDITY,
               validate, nullptr, mutate);
}

// =============================================================================
// Administration
// =============================================================================

OperationResult OperationDispatcher::admin_set_admin(const CallContext& ctx,
                                                     const Address& new_admin) {
    auto validate = [&](const LedgerState& s) { return require_admin(s, ctx); };
    auto mutate = [&](LedgerState& w, const Transition&, OperationResult&) {
        w.admin = new_admin;
        return errors::OK;
    };
    OperationResult result =
        run(OpKind::SET_ADMIN, ctx, Authority::ADMIN, CHECKS_ADMIN, validate, nullptr, mutate);
    if (result.ok()) {
        logger()->info("admin changed to {}", addresses::to_hex(new_admin));
    }
    return result;
}

OperationResult OperationDispatcher::pause_trading(const CallContext& ctx) {
    auto validate = [&](const LedgerState& s) { return require_admin(s, ctx); };
    auto mutate = [](LedgerState& w, const Transition&, OperationResult&) {
        w.paused = true;
        return errors::OK;
    };
    OperationResult result =
        run(OpKind::PAUSE, ctx, Authority::ADMIN, CHECKS_ADMIN, validate, nullptr, mutate);
    if (result.ok()) logger()->info("trading paused");
    return result;
}

OperationResult OperationDispatcher::resume_trading(const CallContext& ctx) {
    auto validate = [&](const LedgerState& s) { return require_admin(s, ctx); };
    auto mutate = [](LedgerState& w, const Transition&, OperationResult&) {
        w.paused = false;
        w.halted = false;
        return errors::OK;
    };
    OperationResult result =
        run(OpKind::RESUME, ctx, Authority::ADMIN, CHECKS_ADMIN, validate, nullptr, mutate);
    if (result.ok()) logger()->info("trading resumed");
    return result;
}

OperationResult OperationDispatcher::migrate(const CallContext& ctx, uint32_t new_version) {
    auto validate = [&](const LedgerState& s) {
        int32_t status = require_admin(s, ctx);
        if (status != errors::OK) return status;
        if (new_version < s.metrics.version()) return errors::INVALID_MIGRATION;
        return errors::OK;
    };
    auto mutate = [&](LedgerState& w, const Transition&, OperationResult&) {
        return w.metrics.observe_version(new_version);
    };
    OperationResult result =
        run(OpKind::MIGRATE, ctx, Authority::ADMIN, CHECKS_ADMIN, validate, nullptr, mutate);
    if (result.ok()) logger()->info("schema version now {}", new_version);
    return result;
}

OperationResult OperationDispatcher::set_swap_fee(const CallContext& ctx, uint32_t fee_bps) {
    auto validate = [&](const LedgerState& s) {
        int32_t status = require_admin(s, ctx);
        if (status != errors::OK) return status;
        if (!FeeEngine::create(fee_bps)) return errors::FEE_CONFIGURATION_INVALID;
        return errors::OK;
    };
    auto mutate = [&](LedgerState& w, const Transition&, OperationResult&) {
        w.swap_fee_bps = fee_bps;
        return errors::OK;
    };
    return run(OpKind::SET_SWAP_FEE, ctx, Authority::ADMIN, CHECKS_ADMIN, validate, nullptr, mutate);
}

OperationResult OperationDispatcher::set_transfer_fee(const CallContext& ctx, uint32_t fee_bps) {
    auto validate = [&](const LedgerState& s) {
        int32_t status = require_admin(s, ctx);
        if (status != errors::OK) return status;
        if (!FeeEngine::create(fee_bps)) return errors::FEE_CONFIGURATION_INVALID;
        return errors::OK;
    };
    auto mutate = [&](LedgerState& w, const Transition&, OperationResult&) {
        w.transfer_fee_bps = fee_bps;
        return errors::OK;
    };
    return run(OpKind::SET_TRANSFER_FEE, ctx, Authority::ADMIN, CHECKS_ADMIN,
               validate, nullptr, mutate);
}

OperationResult OperationDispatcher::set_fee_routing(const CallContext& ctx, FeeRouting routing) {
    auto validate = [&](const LedgerState& s) { return require_admin(s, ctx); };
    auto mutate = [&](LedgerState& w, const Transition&, OperationResult&) {
        w.swap_fee_routing = routing;
        return errors::OK;
    };
    return run(OpKind::SET_FEE_ROUTING, ctx, Authority::ADMIN, CHECKS_ADMIN,
               validate, nullptr, mutate);
}

// =============================================================================
// Batches
// =============================================================================

OperationResult OperationDispatcher::execute(const BatchOperation& op) {
    switch (op.op) {
        case OpKind::MINT:
            return mint(op.ctx, op.user, op.from_asset, op.amount);
        case OpKind::TRANSFER:
            return transfer(op.ctx, op.from_asset, op.to_asset, op.user, op.amount);
        case OpKind::SWAP:
            return swap(op.ctx, op.user, op.from_asset, op.to_asset, op.amount, op.min_out);
        case OpKind::ADD_LIQUIDITY:
            return add_liquidity(op.ctx, op.user, op.amount, op.amount_b);
        case OpKind::REMOVE_LIQUIDITY:
            return remove_liquidity(op.ctx, op.user, op.amount);
        case OpKind::BURN_LP_TOKENS:
            return burn_lp_tokens(op.ctx, op.user, op.amount);
        case OpKind::SET_ADMIN:
            return admin_set_admin(op.ctx, op.user);
        case OpKind::PAUSE:
            return pause_trading(op.ctx);
        case OpKind::RESUME:
            return resume_trading(op.ctx);
        case OpKind::MIGRATE:
            return migrate(op.ctx, op.value);
        case OpKind::SET_SWAP_FEE:
            return set_swap_fee(op.ctx, op.value);
        case OpKind::SET_TRANSFER_FEE:
            return set_transfer_fee(op.ctx, op.value);
        case OpKind::SET_FEE_ROUTING:
            return set_fee_routing(op.ctx, op.routing);
    }
    return reject(op.op, Phase::VALIDATING, errors::INVALID_STATE, "unknown operation");
}

BatchResult OperationDispatcher::execute_batch(const std::vector<BatchOperation>& ops,
                                               BatchMode mode) {
    BatchResult batch{errors::OK, 0, {}};
    if (ops.size() > config_.max_batch_size) {
        logger()->debug("batch of {} exceeds limit {}", ops.size(), config_.max_batch_size);
        batch.status = errors::BATCH_TOO_LARGE;
        return batch;
    }
    batch.results.reserve(ops.size());

    if (mode == BatchMode::BEST_EFFORT) {
        for (const auto& op : ops) {
            batch.results.push_back(execute(op));
            if (batch.results.back().ok()) ++batch.committed;
        }
        return batch;
    }

    const LedgerState snapshot = state_;
    for (const auto& op : ops) {
        batch.results.push_back(execute(op));
        const OperationResult& result = batch.results.back();
        if (result.ok()) {
            ++batch.committed;
            continue;
        }

        // Restore the pre-batch state, keeping a halt raised inside the batch
        const bool halted = state_.halted;
        state_ = snapshot;
        if (halted) {
            state_.paused = true;
            state_.halted = true;
        }
        // The swap's own failure count went with the snapshot
        if (op.op == OpKind::SWAP && counts_as_failure(result.status)) {
            note_saturation(state_.metrics.record_failure(), "failed_order_count");
        }
        logger()->debug("atomic batch rolled back at op {} ({}): {}", batch.results.size() - 1,
                        op_name(op.op), error_name(result.status));
        batch.status = result.status;
        batch.committed = 0;
        return batch;
    }
    return batch;
}

// =============================================================================
// Queries
// =============================================================================

I128 OperationDispatcher::balance_of(const Address& user, const Asset& asset) const {
    return state_.balances.read(user, asset);
}

std::optional<LPPosition> OperationDispatcher::lp_position(const Address& user) const {
    return state_.pool.position(user);
}

std::vector<SwapRecord> OperationDispatcher::user_transactions(const Address& user,
                                                               size_t limit) const {
    std::vector<SwapRecord> out;
    auto it = state_.history.find(user);
    if (it == state_.history.end()) return out;

    const auto& records = it->second;
    for (auto rec = records.rbegin(); rec != records.rend() && out.size() < limit; ++rec) {
        out.push_back(*rec);
    }
    return out;
}

std::vector<InvariantReport> OperationDispatcher::audit() const {
    return invariants::audit(state_);
}

TraderStats OperationDispatcher::user_portfolio(const Address& user) const {
    auto it = state_.traders.find(user);
    return it != state_.traders.end() ? it->second : TraderStats{};
}

std::vector<std::pair<Address, TraderStats>> OperationDispatcher::top_traders(size_t limit) const {
    std::vector<std::pair<Address, TraderStats>> ranked;
    ranked.reserve(state_.active_users.size());
    for (const auto& user : state_.active_users) {
        ranked.emplace_back(user, user_portfolio(user));
    }
    // Ties keep first-trade order
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.second.swap_volume > b.second.swap_volume;
    });
    ranked.resize(std::min({ranked.size(), limit, MAX_TOP_TRADERS}));
    return ranked;
}

OperationDispatcher::Stats OperationDispatcher::get_stats() const {
    const Metrics& m = state_.metrics.metrics();
    return Stats{
        state_.balances.user_count(),
        state_.active_users.size(),
        state_.pool.reserve_a(),
        state_.pool.reserve_b(),
        state_.pool.lp_total_supply(),
        state_.fee_accumulator,
        state_.total_minted,
        m.total_volume,
        m.trade_count,
        m.failed_order_count,
        state_.metrics.version(),
        state_.paused,
        state_.halted,
    };
}

// =============================================================================
// Persistence
// =============================================================================

int32_t OperationDispatcher::load(IStateStore& store) {
    auto blob = store.load();
    if (!blob) {
        logger()->info("no stored state, starting from genesis");
        return errors::OK;
    }

    LedgerState decoded;
    int32_t status = decode_state(*blob, decoded);
    if (status != errors::OK) {
        logger()->error("stored state rejected: {}", error_name(status));
        return status;
    }

    for (const auto& report : invariants::audit(decoded)) {
        if (!report.holds) {
            logger()->error("stored state fails {}: {}", invariant_name(report.id),
                            report.diagnostic);
            return errors::INVALID_STATE;
        }
    }

    state_ = std::move(decoded);
    logger()->info("loaded state: version {}, {} users, timestamp {}",
                   state_.metrics.version(), state_.balances.user_count(),
                   state_.metrics.timestamp());
    return errors::OK;
}

void OperationDispatcher::store(IStateStore& store) const {
    store.store(encode_state(state_));
}

} // namespace swaptrade
