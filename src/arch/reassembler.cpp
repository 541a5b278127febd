// All comments are in English.
#include "arch/reassembler.hpp"

#include <stdexcept>
#include <string>

#include "common/bit_width.hpp"

namespace rf {

void Reassembler::Configure(std::size_t num_lanes, int seq_bits) {
  if (num_lanes < 1 || num_lanes > kMaxLanes) {
    throw std::invalid_argument("Reassembler::Configure: num_lanes out of range.");
  }
  if (seq_bits < 1 || seq_bits > kMaxSeqBits) {
    throw std::invalid_argument("Reassembler::Configure: seq_bits out of range.");
  }
  num_lanes_ = num_lanes;
  seq_bits_  = seq_bits;
  Reset();
}

bool Reassembler::lane_ready(std::size_t lane) const {
  if (lane >= num_lanes_) {
    throw std::out_of_range("Reassembler::lane_ready: lane index out of range.");
  }
  return !slots_[lane].has_value();
}

LaneFlags Reassembler::lane_ready_flags() const {
  LaneFlags flags{};
  for (std::size_t i = 0; i < num_lanes_; ++i) {
    flags[i] = !slots_[i].has_value();
  }
  return flags;
}

std::optional<std::size_t> Reassembler::match_lane() const {
  std::optional<std::size_t> hit;
  for (std::size_t i = 0; i < num_lanes_; ++i) {
    const auto& s = slots_[i];
    if (!s.has_value() || s->seq != next_expected_) continue;
    if (hit.has_value()) {
      // Invariant: sequence ids in flight are unique.
      throw std::logic_error("Reassembler::match_lane: seq " + std::to_string(next_expected_) +
                             " buffered in lanes " + std::to_string(*hit) + " and " +
                             std::to_string(i) + ".");
    }
    hit = i;
  }
  return hit;
}

const Block& Reassembler::out_block() const {
  const auto hit = match_lane();
  if (!hit.has_value()) {
    throw std::logic_error("Reassembler::out_block: no block matches next_expected.");
  }
  return *slots_[*hit];
}

bool Reassembler::Evaluate(const LaneOutputs& lane_out, bool out_ready) {
  next_slots_         = slots_;
  next_next_expected_ = next_expected_;

  // Step 1: latch completions into empty slots. An occupied slot refuses
  // the lane, which is then holding via lane_ready(i) == false.
  for (std::size_t i = 0; i < num_lanes_; ++i) {
    if (lane_out[i].has_value() && !slots_[i].has_value()) {
      next_slots_[i] = lane_out[i];
    }
  }

  // Step 2: release the cursor match, if the consumer takes it.
  bool released = false;
  const auto hit = match_lane();
  if (hit.has_value() && out_ready) {
    next_slots_[*hit].reset();
    next_next_expected_ = static_cast<std::uint32_t>(IncrementWrap(next_expected_, seq_bits_));
    released = true;
  }

  evaluated_ = true;
  return released;
}

void Reassembler::Commit() {
  if (!evaluated_) {
    throw std::logic_error("Reassembler::Commit: Commit() without Evaluate() in this tick.");
  }
  slots_         = next_slots_;
  next_expected_ = next_next_expected_;
  evaluated_     = false;
}

void Reassembler::Reset() {
  next_expected_      = 0;
  next_next_expected_ = 0;
  for (auto& s : slots_) s.reset();
  for (auto& s : next_slots_) s.reset();
  evaluated_ = false;
}

std::size_t Reassembler::occupancy() const {
  std::size_t n = 0;
  for (std::size_t i = 0; i < num_lanes_; ++i) {
    if (slots_[i].has_value()) ++n;
  }
  return n;
}

const std::optional<Block>& Reassembler::slot(std::size_t lane) const {
  if (lane >= num_lanes_) {
    throw std::out_of_range("Reassembler::slot: lane index out of range.");
  }
  return slots_[lane];
}

} // namespace rf
