// =============================================================================
// fee.cpp - FeeEngine
// =============================================================================

#include "swaptrade/fee.hpp"
#include "swaptrade/math.hpp"

namespace swaptrade {

namespace {

I128 bps_of(I128 amount, uint32_t bps) {
    if (amount <= 0 || bps == 0) return 0;
    I128 fee = 0;
    // bps <= denominator, so the quotient always fits
    if (!math::mul_div(amount, static_cast<I128>(bps), fees::BPS_DENOMINATOR, fee)) {
        return 0;
    }
    return fee;
}

} // anonymous namespace

std::optional<FeeEngine> FeeEngine::create(uint32_t fee_bps) {
    FeeEngine engine;
    if (engine.configure(fee_bps) != errors::OK) {
        return std::nullopt;
    }
    return engine;
}

int32_t FeeEngine::configure(uint32_t fee_bps) {
    if (fee_bps > fees::MAX_FEE_BPS) {
        return errors::FEE_CONFIGURATION_INVALID;
    }
    fee_bps_ = fee_bps;
    return errors::OK;
}

I128 FeeEngine::compute(I128 amount) const {
    return bps_of(amount, fee_bps_);
}

I128 FeeEngine::max_fee(I128 amount) {
    return bps_of(amount, fees::MAX_FEE_BPS);
}

} // namespace swaptrade
