// All comments are in English.
#include "arch/dispatcher.hpp"

#include <stdexcept>

#include "common/bit_width.hpp"

namespace rf {

void Dispatcher::Configure(std::size_t num_lanes, int seq_bits, int payload_bits) {
  if (num_lanes < 1 || num_lanes > kMaxLanes) {
    throw std::invalid_argument("Dispatcher::Configure: num_lanes out of range.");
  }
  if (seq_bits < 1 || seq_bits > kMaxSeqBits) {
    throw std::invalid_argument("Dispatcher::Configure: seq_bits out of range.");
  }
  if (payload_bits < 1 || payload_bits > kMaxPayloadBits) {
    throw std::invalid_argument("Dispatcher::Configure: payload_bits out of range.");
  }
  num_lanes_    = num_lanes;
  seq_bits_     = seq_bits;
  payload_bits_ = payload_bits;
  Reset();
}

std::optional<Admission> Dispatcher::Evaluate(bool in_valid, std::uint64_t payload,
                                              const LaneFlags& lane_ready) {
  next_lane_sel_    = lane_sel_;
  next_seq_counter_ = seq_counter_;

  if (!in_valid || !in_ready(lane_ready)) {
    return std::nullopt;
  }

  Admission adm;
  adm.lane          = lane_sel_;
  adm.block.payload = Truncate(payload, payload_bits_);
  adm.block.seq     = seq_counter_;

  next_seq_counter_ = static_cast<std::uint32_t>(IncrementWrap(seq_counter_, seq_bits_));
  // True modulo: N need not be a power of two.
  next_lane_sel_    = (lane_sel_ + 1) % num_lanes_;
  return adm;
}

void Dispatcher::Commit() {
  lane_sel_    = next_lane_sel_;
  seq_counter_ = next_seq_counter_;
}

void Dispatcher::Reset() {
  lane_sel_         = 0;
  seq_counter_      = 0;
  next_lane_sel_    = 0;
  next_seq_counter_ = 0;
}

} // namespace rf
