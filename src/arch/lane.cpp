// All comments are in English.
#include "arch/lane.hpp"

#include <stdexcept>
#include <string>

namespace rf {

void Lane::Configure(std::size_t lane_id, std::size_t latency, const StageTransform* xform) {
  if (!xform) {
    throw std::invalid_argument("Lane::Configure: transform pointer must not be null.");
  }
  if (latency < 1 || latency > kMaxLaneLatency) {
    throw std::invalid_argument("Lane::Configure: latency out of range: " + std::to_string(latency));
  }
  if (xform->num_stages() != latency) {
    throw std::invalid_argument("Lane::Configure: transform has " +
                                std::to_string(xform->num_stages()) +
                                " stages but lane latency is " + std::to_string(latency));
  }
  lane_id_ = lane_id;
  latency_ = latency;
  xform_   = xform;
  Reset();
}

const Block& Lane::out_block() const {
  const auto& tail = slots_[latency_ - 1];
  if (!tail.has_value()) {
    throw std::logic_error("Lane::out_block: output slot is empty (lane " +
                           std::to_string(lane_id_) + ").");
  }
  return *tail;
}

void Lane::Evaluate(const std::optional<Block>& admit, bool downstream_ready) {
  if (!xform_) {
    throw std::logic_error("Lane::Evaluate: lane not configured.");
  }

  last_stalled_ = Stalled(downstream_ready);
  if (last_stalled_) {
    if (admit.has_value()) {
      throw std::logic_error("Lane::Evaluate: admission while stalled (lane " +
                             std::to_string(lane_id_) + ").");
    }
    // Hold every slot.
    next_slots_ = slots_;
    evaluated_ = true;
    return;
  }

  // Shift from the tail so each slot reads the current value of its predecessor.
  for (std::size_t j = latency_ - 1; j > 0; --j) {
    const auto& prev = slots_[j - 1];
    if (prev.has_value()) {
      next_slots_[j] = Block{xform_->Apply(j, prev->payload), prev->seq};
    } else {
      next_slots_[j].reset();
    }
  }
  if (admit.has_value()) {
    next_slots_[0] = Block{xform_->Apply(0, admit->payload), admit->seq};
  } else {
    next_slots_[0].reset();
  }
  evaluated_ = true;
}

void Lane::Commit() {
  if (!evaluated_) {
    throw std::logic_error("Lane::Commit: Commit() without Evaluate() in this tick.");
  }
  for (std::size_t j = 0; j < latency_; ++j) {
    slots_[j] = next_slots_[j];
  }
  evaluated_ = false;
}

void Lane::Reset() {
  for (auto& s : slots_) s.reset();
  for (auto& s : next_slots_) s.reset();
  evaluated_    = false;
  last_stalled_ = false;
}

std::size_t Lane::occupancy() const {
  std::size_t n = 0;
  for (std::size_t j = 0; j < latency_; ++j) {
    if (slots_[j].has_value()) ++n;
  }
  return n;
}

const std::optional<Block>& Lane::slot(std::size_t i) const {
  if (i >= latency_) {
    throw std::out_of_range("Lane::slot: index out of range.");
  }
  return slots_[i];
}

} // namespace rf
