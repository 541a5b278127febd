// All comments are in English.
#include "arch/stage_transform.hpp"

#include <stdexcept>

#include "common/bit_width.hpp"

namespace rf {

StageTransform::StageTransform(const PipelineConfig& cfg)
  : payload_bits_(cfg.payload_bits),
    num_stages_(cfg.lane_latency)
{
  cfg.Validate();
  for (std::size_t s = 0; s < num_stages_; ++s) {
    const std::uint64_t raw = cfg.stage_keys.empty()
        ? kStageKeyGolden * static_cast<std::uint64_t>(s + 1)
        : cfg.stage_keys[s];
    keys_[s] = Truncate(raw, payload_bits_);
  }
}

std::uint64_t StageTransform::key(std::size_t stage) const {
  if (stage >= num_stages_) {
    throw std::out_of_range("StageTransform::key: stage index out of range.");
  }
  return keys_[stage];
}

unsigned StageTransform::rotation(std::size_t stage) const {
  const std::size_t w = static_cast<std::size_t>(payload_bits_);
  return static_cast<unsigned>(((stage % w) + 1) % w);
}

std::uint64_t StageTransform::Apply(std::size_t stage, std::uint64_t payload) const {
  if (stage >= num_stages_) {
    throw std::out_of_range("StageTransform::Apply: stage index out of range.");
  }
  const std::uint64_t mixed = Truncate(payload ^ keys_[stage], payload_bits_);
  return RotateLeft(mixed, rotation(stage), payload_bits_);
}

std::uint64_t StageTransform::ApplyAll(std::uint64_t payload) const {
  std::uint64_t v = Truncate(payload, payload_bits_);
  for (std::size_t s = 0; s < num_stages_; ++s) {
    v = Apply(s, v);
  }
  return v;
}

} // namespace rf
