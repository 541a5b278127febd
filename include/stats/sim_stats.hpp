// All comments are in English.
#pragma once
#include <cstddef>
#include <cstdint>

#include "utils/latency_stats.hpp"

namespace rf {

// Aggregated outcome of one simulation run.
struct RunStats {
  std::uint64_t ticks      = 0;   // ticks executed (across resets)
  std::uint64_t admitted   = 0;   // producer-side transfers
  std::uint64_t released   = 0;   // consumer-side transfers
  std::uint64_t resets     = 0;
  std::uint64_t discarded  = 0;   // in-flight blocks dropped by resets

  std::uint64_t producer_stall_ticks = 0;  // valid && !ready on the input link
  std::uint64_t consumer_stall_ticks = 0;  // valid && !ready on the output link
  std::uint64_t idle_output_ticks    = 0;  // no block matched next_expected

  std::size_t max_reasm_occupancy = 0;
  std::size_t max_in_flight       = 0;

  // Hardware counters as read back at the end of the run.
  std::uint64_t hw_blocks_processed = 0;
  std::uint64_t hw_cycles_elapsed   = 0;

  util::LaneCounters      lanes{};
  util::QueueLatencyStats latency{};    // admission tick -> release tick
};

} // namespace rf
