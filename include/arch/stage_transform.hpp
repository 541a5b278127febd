#pragma once
// All comments are in English.

#include <array>
#include <cstddef>
#include <cstdint>

#include "common/constants.hpp"
#include "common/pipeline_config.hpp"

namespace rf {

/**
 * StageTransform
 *
 * Per-stage payload function applied inside a Lane: XOR with the stage key,
 * then rotate left within payload_bits. One instance is shared read-only by
 * all lanes, so a payload's result does not depend on the lane it took.
 */
class StageTransform {
public:
  StageTransform() = default;
  explicit StageTransform(const PipelineConfig& cfg);

  // Result of stage 'stage' on 'payload'. Throws std::out_of_range.
  std::uint64_t Apply(std::size_t stage, std::uint64_t payload) const;

  // All stages 0..num_stages-1 in order; the value a lane emits.
  std::uint64_t ApplyAll(std::uint64_t payload) const;

  std::size_t   num_stages()   const { return num_stages_; }
  int           payload_bits() const { return payload_bits_; }
  std::uint64_t key(std::size_t stage) const;
  unsigned      rotation(std::size_t stage) const;

private:
  int         payload_bits_ = kDefaultPayloadBits;
  std::size_t num_stages_   = 0;
  std::array<std::uint64_t, kMaxLaneLatency> keys_{};
};

} // namespace rf
