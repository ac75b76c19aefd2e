#ifndef SWAPTRADE_FEE_HPP
#define SWAPTRADE_FEE_HPP

#include <optional>

#include "types.hpp"

namespace swaptrade {

// Fee rates in basis points (1 bps = 0.01%)
namespace fees {
constexpr uint32_t BPS_DENOMINATOR = 10000;
constexpr uint32_t SWAP_FEE_BPS = 30;       // 0.30% pool swap fee
constexpr uint32_t TRANSFER_FEE_BPS = 0;    // In-account conversions are free by default
constexpr uint32_t MAX_FEE_BPS = 100;       // 1.00% hard ceiling
}

// =============================================================================
// FeeEngine - bounded, monotonic fee function
// =============================================================================
//
// fee = floor(amount * fee_bps / 10000), with fee_bps <= MAX_FEE_BPS enforced
// by construction. Total for every amount: negative amounts price at zero and
// the product is taken through a 256-bit intermediate.

class FeeEngine {
public:
    FeeEngine() = default;

    // Returns nullopt if fee_bps exceeds MAX_FEE_BPS
    static std::optional<FeeEngine> create(uint32_t fee_bps);

    // Change the rate; FEE_CONFIGURATION_INVALID leaves the old rate in place
    int32_t configure(uint32_t fee_bps);

    uint32_t fee_bps() const { return fee_bps_; }

    I128 compute(I128 amount) const;

    // Ceiling every configured rate stays under
    static I128 max_fee(I128 amount);

private:
    uint32_t fee_bps_{fees::SWAP_FEE_BPS};
};

} // namespace swaptrade

#endif // SWAPTRADE_FEE_HPP
