#pragma once
#include <array>
#include <cstdint>

#include "common/constants.hpp"

namespace rf {
namespace util {

/* Lightweight latency accumulators and per-lane counters.
 * Separated from arch to keep stats tooling out of the hardware path.
 */

struct QueueLatencyStats {
    std::uint64_t count = 0;  // number of completed items measured
    std::uint64_t total = 0;  // sum of wait cycles over all completed items
    std::uint64_t min   = 0;  // minimum single-item wait cycles observed (valid if count > 0)
    std::uint64_t max   = 0;  // maximum single-item wait cycles observed

    double mean() const {
        return count ? static_cast<double>(total) / static_cast<double>(count) : 0.0;
    }
};

struct LaneCounters {
    std::array<std::uint64_t, kMaxLanes> admissions{};   // blocks routed to each lane
    std::array<std::uint64_t, kMaxLanes> stall_ticks{};  // ticks each lane spent stalled
};

// Add one observation to a QueueLatencyStats.
inline void AccumulateQueueLatency(QueueLatencyStats& dst, std::uint64_t latency) {
    if (dst.count == 0 || latency < dst.min) dst.min = latency;
    dst.count += 1;
    dst.total += latency;
    if (latency > dst.max) dst.max = latency;
}

} // namespace util
} // namespace rf
