#ifndef SWAPTRADE_METRICS_HPP
#define SWAPTRADE_METRICS_HPP

#include "types.hpp"

namespace swaptrade {

// Aggregate counters; all monotonically non-decreasing
struct Metrics {
    uint64_t trade_count;
    uint64_t failed_order_count;
    uint64_t balances_updated;
    I128 total_volume;
};

// =============================================================================
// MetricsTracker - saturating counters and version/clock watermarks
// =============================================================================

class MetricsTracker {
public:
    MetricsTracker() = default;

    // Counters stick at their maximum instead of wrapping.
    // Each returns false once the counter is saturated.
    bool record_trade();
    bool record_failure();
    bool record_balance_updates(uint64_t count);
    bool record_volume(I128 amount);

    // INVALID_MIGRATION if new_version < version()
    int32_t observe_version(uint32_t new_version);

    // CLOCK_REGRESSION if new_ts < timestamp()
    int32_t observe_timestamp(uint64_t new_ts);

    const Metrics& metrics() const { return metrics_; }
    uint32_t version() const { return version_; }
    uint64_t timestamp() const { return timestamp_; }

    // State blob decoding
    void restore(const Metrics& metrics, uint32_t version, uint64_t timestamp);

private:
    Metrics metrics_{0, 0, 0, 0};
    uint32_t version_{0};
    uint64_t timestamp_{0};
};

} // namespace swaptrade

#endif // SWAPTRADE_METRICS_HPP
