// All comments are in English.
#include "common/pipeline_config.hpp"

#include <stdexcept>
#include <string>

namespace rf {

void PipelineConfig::Validate() const {
  if (payload_bits < 1 || payload_bits > kMaxPayloadBits) {
    throw std::invalid_argument("PipelineConfig: payload_bits must be in [1, " +
                                std::to_string(kMaxPayloadBits) + "], got " +
                                std::to_string(payload_bits));
  }
  if (num_lanes < 1 || num_lanes > kMaxLanes) {
    throw std::invalid_argument("PipelineConfig: num_lanes must be in [1, " +
                                std::to_string(kMaxLanes) + "], got " +
                                std::to_string(num_lanes));
  }
  if (lane_latency < 1 || lane_latency > kMaxLaneLatency) {
    throw std::invalid_argument("PipelineConfig: lane_latency must be in [1, " +
                                std::to_string(kMaxLaneLatency) + "], got " +
                                std::to_string(lane_latency));
  }
  if (seq_bits < 1 || seq_bits > kMaxSeqBits) {
    throw std::invalid_argument("PipelineConfig: seq_bits must be in [1, " +
                                std::to_string(kMaxSeqBits) + "], got " +
                                std::to_string(seq_bits));
  }
  if (counter_bits < 1 || counter_bits > kMaxCounterBits) {
    throw std::invalid_argument("PipelineConfig: counter_bits must be in [1, " +
                                std::to_string(kMaxCounterBits) + "], got " +
                                std::to_string(counter_bits));
  }

  // Two blocks in flight must never share a sequence id, otherwise the
  // reassembler cannot tell them apart.
  const std::uint64_t id_space = 1ULL << seq_bits;
  if (MaxInFlight() > id_space) {
    throw std::invalid_argument("PipelineConfig: seq_bits=" + std::to_string(seq_bits) +
                                " gives " + std::to_string(id_space) +
                                " ids but up to " + std::to_string(MaxInFlight()) +
                                " blocks can be in flight (num_lanes * (lane_latency + 1)).");
  }

  if (!stage_keys.empty() && stage_keys.size() != lane_latency) {
    throw std::invalid_argument("PipelineConfig: stage_keys has " +
                                std::to_string(stage_keys.size()) +
                                " entries, expected lane_latency=" +
                                std::to_string(lane_latency));
  }
}

} // namespace rf
