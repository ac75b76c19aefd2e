#ifndef SWAPTRADE_CODEC_HPP
#define SWAPTRADE_CODEC_HPP

#include <string>
#include <string_view>
#include <vector>

#include "state.hpp"
#include "dispatcher.hpp"

namespace swaptrade {

// =============================================================================
// State Blob Codec (JSON)
// =============================================================================
//
// 128-bit amounts are written as decimal strings and identities as 0x-hex.
// Balances are replayed in user_index x asset_index order on decode so the
// append-only indexes come back in the order they were written.

std::string encode_state(const LedgerState& state);

// INVALID_STATE on malformed JSON, negative amounts or bad identities;
// `out` is untouched unless OK is returned
int32_t decode_state(std::string_view blob, LedgerState& out);

// =============================================================================
// Batch Files
// =============================================================================
//
// JSON array of operations:
//   [{"op": "mint", "user": "0x..", "asset": "XLM", "amount": "1000000"},
//    {"op": "swap", "user": "0x..", "from": "XLM", "to": "USDC",
//     "amount": "1000", "min_out": "990", "timestamp": 7}]
// "caller" defaults to `admin` for admin operations and to "user" otherwise.

int32_t decode_batch(std::string_view blob, const Address& admin,
                     std::vector<BatchOperation>& out);

} // namespace swaptrade

#endif // SWAPTRADE_CODEC_HPP
