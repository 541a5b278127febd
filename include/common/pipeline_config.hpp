// All comments are in English.
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "common/constants.hpp"

namespace rf {

// Construction-time parameters of one pipeline instance. Nothing here is
// mutable once a ClockCore has been built from it.
struct PipelineConfig {
  int         payload_bits = kDefaultPayloadBits;  // W_payload, 1..64
  std::size_t num_lanes    = kDefaultNumLanes;     // N, 1..kMaxLanes
  std::size_t lane_latency = kDefaultLaneLatency;  // K, 1..kMaxLaneLatency
  int         seq_bits     = kDefaultSeqBits;      // W1, 1..32
  int         counter_bits = kDefaultCounterBits;  // W2, 1..64

  // One key per stage; empty means "derive from kStageKeyGolden".
  std::vector<std::uint64_t> stage_keys;

  // Largest number of blocks that can be admitted but not yet released:
  // K slots per lane plus one reassembly slot per lane.
  std::uint64_t MaxInFlight() const {
    return static_cast<std::uint64_t>(num_lanes) *
           (static_cast<std::uint64_t>(lane_latency) + 1ULL);
  }

  // Throws std::invalid_argument describing the first bad field.
  void Validate() const;
};

} // namespace rf
