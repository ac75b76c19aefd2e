#ifndef SWAPTRADE_DISPATCHER_HPP
#define SWAPTRADE_DISPATCHER_HPP

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"
#include "auth.hpp"
#include "config.hpp"
#include "invariants.hpp"
#include "state.hpp"
#include "store.hpp"

namespace swaptrade {

// =============================================================================
// Call Context
// =============================================================================

// Supplied by the host for every call: the attested caller and the
// external clock reading
struct CallContext {
    Address caller;
    uint64_t timestamp;
};

// =============================================================================
// Operation Phases and Results
// =============================================================================

enum class Phase : uint8_t {
    VALIDATING = 0,
    COMPUTING = 1,
    MUTATING = 2,
    CHECKING = 3,
    COMMITTED = 4,
    ABORTED = 5
};

const char* phase_name(Phase phase);

enum class OpKind : uint8_t {
    MINT = 0,
    TRANSFER = 1,
    SWAP = 2,
    ADD_LIQUIDITY = 3,
    REMOVE_LIQUIDITY = 4,
    BURN_LP_TOKENS = 5,
    SET_ADMIN = 6,
    PAUSE = 7,
    RESUME = 8,
    MIGRATE = 9,
    SET_SWAP_FEE = 10,
    SET_TRANSFER_FEE = 11,
    SET_FEE_ROUTING = 12
};

const char* op_name(OpKind op);
std::optional<OpKind> parse_op(std::string_view name);

// status == OK means the operation committed. `failed_at` is the phase
// that rejected it (unset on success).
//   swap:             amount0 = output, amount1 = fee
//   transfer:         amount0 = credited, amount1 = fee
//   add_liquidity:    amount0 = LP minted
//   remove_liquidity: amount0 = asset A paid, amount1 = asset B paid
struct OperationResult {
    int32_t status;
    Phase phase;
    std::optional<Phase> failed_at;
    I128 amount0;
    I128 amount1;
    std::string diagnostic;

    bool ok() const { return status == errors::OK; }
};

// =============================================================================
// Dispatch Hooks
// =============================================================================

// Observation point between Mutating and Checking. The working state is
// the would-be post-state; anything a hook does to it is subject to the
// same invariant checks as the operation itself.
class IDispatchHooks {
public:
    virtual ~IDispatchHooks() = default;
    virtual void after_mutate(OpKind op, LedgerState& working) {}
};

class NullDispatchHooks : public IDispatchHooks {};

// =============================================================================
// Batches
// =============================================================================

struct BatchOperation {
    OpKind op;
    CallContext ctx;
    Address user{};         // Account acted on; mint recipient; new admin
    Asset from_asset;       // Mint asset; transfer/swap source
    Asset to_asset;
    I128 amount{0};         // Amount, amount_a, or LP amount
    I128 amount_b{0};
    I128 min_out{0};
    uint32_t value{0};      // Fee bps or schema version
    FeeRouting routing{FeeRouting::POOL};
};

enum class BatchMode : uint8_t {
    ATOMIC = 0,       // All commit or the pre-batch state is restored
    BEST_EFFORT = 1   // Each operation commits or aborts on its own
};

struct BatchResult {
    int32_t status;
    size_t committed;
    std::vector<OperationResult> results;
};

// =============================================================================
// OperationDispatcher
// =============================================================================
//
// Sole owner of the LedgerState. Every mutating call runs
//   Validating -> Computing -> Mutating -> Checking -> Committed | Aborted
// against a working copy of the committed state; the copy replaces the
// committed state only after every applicable invariant holds.

class OperationDispatcher {
public:
    explicit OperationDispatcher(LedgerConfig config = {},
                                 const IIdentityVerifier* verifier = nullptr);
    ~OperationDispatcher() = default;

    // Non-copyable
    OperationDispatcher(const OperationDispatcher&) = delete;
    OperationDispatcher& operator=(const OperationDispatcher&) = delete;

    // =========================================================================
    // Ledger Operations
    // =========================================================================

    OperationResult mint(const CallContext& ctx, const Address& to, const Asset& asset,
                         I128 amount);

    // In-account conversion: debit from_asset, credit to_asset less the
    // transfer fee
    OperationResult transfer(const CallContext& ctx, const Asset& from_asset,
                             const Asset& to_asset, const Address& user, I128 amount);

    OperationResult swap(const CallContext& ctx, const Address& user, const Asset& from_token,
                         const Asset& to_token, I128 amount, I128 min_out = 0);

    // =========================================================================
    // Liquidity
    // =========================================================================

    OperationResult add_liquidity(const CallContext& ctx, const Address& user,
                                  I128 amount_a, I128 amount_b);
    OperationResult remove_liquidity(const CallContext& ctx, const Address& user, I128 lp_amount);
    OperationResult burn_lp_tokens(const CallContext& ctx, const Address& user, I128 lp_amount);

    // =========================================================================
    // Administration
    // =========================================================================

    OperationResult admin_set_admin(const CallContext& ctx, const Address& new_admin);
    OperationResult pause_trading(const CallContext& ctx);
    // Also clears a halt left by an invariant violation
    OperationResult resume_trading(const CallContext& ctx);
    OperationResult migrate(const CallContext& ctx, uint32_t new_version);
    OperationResult set_swap_fee(const CallContext& ctx, uint32_t fee_bps);
    OperationResult set_transfer_fee(const CallContext& ctx, uint32_t fee_bps);
    OperationResult set_fee_routing(const CallContext& ctx, FeeRouting routing);

    // =========================================================================
    // Batches
    // =========================================================================

    OperationResult execute(const BatchOperation& op);
    BatchResult execute_batch(const std::vector<BatchOperation>& ops, BatchMode mode);

    // =========================================================================
    // Queries (last committed state)
    // =========================================================================

    I128 balance_of(const Address& user, const Asset& asset) const;
    std::optional<LPPosition> lp_position(const Address& user) const;
    I128 reserve_a() const { return state_.pool.reserve_a(); }
    I128 reserve_b() const { return state_.pool.reserve_b(); }
    const Metrics& metrics() const { return state_.metrics.metrics(); }
    const Address& admin() const { return state_.admin; }
    bool is_paused() const { return state_.paused; }
    bool is_halted() const { return state_.halted; }
    const LedgerState& state() const { return state_; }
    const LedgerConfig& config() const { return config_; }

    // Swap history, newest first
    std::vector<SwapRecord> user_transactions(const Address& user, size_t limit) const;

    // Zeroed stats for a user who never swapped
    TraderStats user_portfolio(const Address& user) const;

    // Leaderboard by swap volume, at most MAX_TOP_TRADERS entries
    static constexpr size_t MAX_TOP_TRADERS = 100;
    std::vector<std::pair<Address, TraderStats>> top_traders(size_t limit) const;

    std::vector<InvariantReport> audit() const;

    struct Stats {
        size_t total_users;
        size_t active_users;    // Users with at least one swap
        I128 reserve_a;
        I128 reserve_b;
        I128 lp_total_supply;
        I128 fee_accumulator;
        I128 total_minted;
        I128 total_volume;
        uint64_t trade_count;
        uint64_t failed_order_count;
        uint32_t version;
        bool paused;
        bool halted;
    };
    Stats get_stats() const;

    // =========================================================================
    // Persistence
    // =========================================================================

    // OK with the genesis state kept if the store is empty; INVALID_STATE if
    // the blob does not decode or fails the state-only invariants
    int32_t load(IStateStore& store);
    void store(IStateStore& store) const;

    void set_hooks(IDispatchHooks* hooks);

private:
    // Per-call scratch carried from Computing into Checking
    struct Transition {
        std::vector<std::pair<I128, I128>> fees;   // (amount, fee) for fee bounds
        std::optional<SwapQuote> quote;            // For the constant-product check
    };

    using Validator = std::function<int32_t(const LedgerState&)>;
    using Planner = std::function<int32_t(const LedgerState&, Transition&)>;
    using Mutator = std::function<int32_t(LedgerState&, const Transition&, OperationResult&)>;

    LedgerConfig config_;
    AuthorizationGate gate_;
    LedgerState state_;
    IDispatchHooks* hooks_;
    NullDispatchHooks null_hooks_;

    OperationResult run(OpKind op, const CallContext& ctx, Authority authority, uint32_t checks,
                        const Validator& validate, const Planner& plan, const Mutator& mutate);

    std::optional<InvariantReport> check(const LedgerState& before, const LedgerState& after,
                                         const CallContext& ctx, Authority authority,
                                         uint32_t checks, const Transition& transition) const;

    OperationResult reject(OpKind op, Phase at, int32_t status, std::string diagnostic = {}) const;
    void halt(OpKind op, const InvariantReport& report);

    int32_t require_admin(const LedgerState& state, const CallContext& ctx) const;
    int32_t require_user(const CallContext& ctx, const Address& user) const;
};

} // namespace swaptrade

#endif // SWAPTRADE_DISPATCHER_HPP
