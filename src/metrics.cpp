// =============================================================================
// metrics.cpp - MetricsTracker
// =============================================================================

#include "swaptrade/metrics.hpp"
#include <limits>

namespace swaptrade {

namespace {

bool saturating_increment(uint64_t& counter, uint64_t by) {
    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();
    if (counter > MAX - by) {
        counter = MAX;
        return false;
    }
    counter += by;
    return counter != MAX;
}

} // anonymous namespace

bool MetricsTracker::record_trade() {
    return saturating_increment(metrics_.trade_count, 1);
}

bool MetricsTracker::record_failure() {
    return saturating_increment(metrics_.failed_order_count, 1);
}

bool MetricsTracker::record_balance_updates(uint64_t count) {
    return saturating_increment(metrics_.balances_updated, count);
}

bool MetricsTracker::record_volume(I128 amount) {
    if (amount <= 0) return metrics_.total_volume != I128_MAX;
    if (metrics_.total_volume > I128_MAX - amount) {
        metrics_.total_volume = I128_MAX;
        return false;
    }
    metrics_.total_volume += amount;
    return metrics_.total_volume != I128_MAX;
}

int32_t MetricsTracker::observe_version(uint32_t new_version) {
    if (new_version < version_) {
        return errors::INVALID_MIGRATION;
    }
    version_ = new_version;
    return errors::OK;
}

int32_t MetricsTracker::observe_timestamp(uint64_t new_ts) {
    if (new_ts < timestamp_) {
        return errors::CLOCK_REGRESSION;
    }
    timestamp_ = new_ts;
    return errors::OK;
}

void MetricsTracker::restore(const Metrics& metrics, uint32_t version, uint64_t timestamp) {
    metrics_ = metrics;
    version_ = version;
    timestamp_ = timestamp;
}

} // namespace swaptrade
