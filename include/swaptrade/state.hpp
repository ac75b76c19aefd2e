#ifndef SWAPTRADE_STATE_HPP
#define SWAPTRADE_STATE_HPP

#include <map>
#include <deque>
#include <vector>

#include "types.hpp"
#include "ledger.hpp"
#include "pool.hpp"
#include "fee.hpp"
#include "metrics.hpp"

namespace swaptrade {

// =============================================================================
// Swap History Record
// =============================================================================

struct SwapRecord {
    uint64_t timestamp;
    Asset from_asset;
    Asset to_asset;
    I128 amount_in;
    I128 amount_out;
    I128 fee;
    I128 rate_e7;   // amount_out * 1e7 / amount_in
};

// =============================================================================
// Per-trader Statistics
// =============================================================================

// pnl is the running net swap flow, sum(amount_out) - sum(amount_in),
// across both pool assets
struct TraderStats {
    uint64_t trade_count{0};
    I128 swap_volume{0};
    I128 pnl{0};
};

// =============================================================================
// LedgerState - the whole contract state blob
// =============================================================================
//
// One explicit aggregate, owned by the OperationDispatcher. Copyable so a
// full snapshot can be taken before the Mutating phase and restored on abort.

struct LedgerState {
    Address admin{};
    bool paused{false};
    bool halted{false};

    BalanceLedger balances;
    LiquidityPool pool;
    MetricsTracker metrics;

    I128 fee_accumulator{0};
    I128 total_minted{0};

    // Fee configuration travels with the state
    uint32_t swap_fee_bps{fees::SWAP_FEE_BPS};
    uint32_t transfer_fee_bps{fees::TRANSFER_FEE_BPS};
    FeeRouting swap_fee_routing{FeeRouting::POOL};

    std::map<Address, std::deque<SwapRecord>> history;

    std::map<Address, TraderStats> traders;
    std::vector<Address> active_users;   // Append-only, in first-trade order
};

} // namespace swaptrade

#endif // SWAPTRADE_STATE_HPP
