#ifndef SWAPTRADE_CONFIG_HPP
#define SWAPTRADE_CONFIG_HPP

#include <string>
#include <string_view>

#include "types.hpp"
#include "fee.hpp"

namespace swaptrade {

// =============================================================================
// LedgerConfig
// =============================================================================
//
// JSON document, every key optional:
//   {
//     "admin": "0x...",              // 20-byte hex identity
//     "swap_fee_bps": 30,
//     "transfer_fee_bps": 0,
//     "swap_fee_routing": "pool",    // or "accumulator"
//     "asset_a": "XLM",
//     "asset_b": "USDC",
//     "history_limit": 100,
//     "max_batch_size": 100,
//     "log_level": "warn"
//   }

struct LedgerConfig {
    Address admin{};
    uint32_t swap_fee_bps{fees::SWAP_FEE_BPS};
    uint32_t transfer_fee_bps{fees::TRANSFER_FEE_BPS};
    FeeRouting swap_fee_routing{FeeRouting::POOL};
    Asset asset_a{NATIVE_XLM};
    Asset asset_b{USDC};
    size_t history_limit{100};
    size_t max_batch_size{100};
    std::string log_level{"warn"};

    // Throws std::runtime_error on unreadable files or invalid values
    static LedgerConfig from_file(std::string_view path);
    static LedgerConfig from_json(std::string_view content);

    LedgerConfig& with_admin(const Address& a) {
        admin = a;
        return *this;
    }

    LedgerConfig& with_swap_fee(uint32_t bps, FeeRouting routing = FeeRouting::POOL) {
        swap_fee_bps = bps;
        swap_fee_routing = routing;
        return *this;
    }

    LedgerConfig& with_transfer_fee(uint32_t bps) {
        transfer_fee_bps = bps;
        return *this;
    }

    LedgerConfig& with_limits(size_t history, size_t batch) {
        history_limit = history;
        max_batch_size = batch;
        return *this;
    }

    // Throws std::runtime_error describing the first invalid field
    void validate() const;
};

} // namespace swaptrade

#endif // SWAPTRADE_CONFIG_HPP
