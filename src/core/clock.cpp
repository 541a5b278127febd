// core/clock.cpp
#include "core/clock.hpp"

#include <stdexcept>

namespace rf {

ClockCore::ClockCore(const PipelineConfig& cfg)
  : cfg_(cfg)
  , xform_(cfg)      // validates cfg
{
  // S0
  dispatcher_.Configure(cfg_.num_lanes, cfg_.seq_bits, cfg_.payload_bits);
  // S1
  for (std::size_t i = 0; i < cfg_.num_lanes; ++i) {
    lanes_[i].Configure(i, cfg_.lane_latency, &xform_);
  }
  // S2
  reasm_.Configure(cfg_.num_lanes, cfg_.seq_bits);
  // S3
  counter_.Configure(cfg_.counter_bits);
}

const Lane& ClockCore::lane(std::size_t i) const {
  if (i >= cfg_.num_lanes) {
    throw std::out_of_range("ClockCore::lane: lane index out of range.");
  }
  return lanes_[i];
}

LaneFlags ClockCore::LaneReadyFlags(const LaneFlags& slot_ready) const {
  LaneFlags ready{};
  for (std::size_t i = 0; i < cfg_.num_lanes; ++i) {
    ready[i] = lanes_[i].in_ready(slot_ready[i]);
  }
  return ready;
}

bool ClockCore::in_ready() const {
  return dispatcher_.in_ready(LaneReadyFlags(reasm_.lane_ready_flags()));
}

TickOutputs ClockCore::Tick(const TickInputs& in) {
  TickOutputs out;
  out.tick = tick_;

  // ---------------------------
  // Phase 1 – combinational signals (right to left, state only)
  // ---------------------------
  const LaneFlags slot_ready = reasm_.lane_ready_flags();
  const LaneFlags lane_ready = LaneReadyFlags(slot_ready);
  out.in_ready = dispatcher_.in_ready(lane_ready);

  LaneOutputs lane_out{};
  for (std::size_t i = 0; i < cfg_.num_lanes; ++i) {
    if (lanes_[i].out_valid()) lane_out[i] = lanes_[i].out_block();
  }

  const auto match = reasm_.match_lane();
  out.out_valid = match.has_value();
  if (out.out_valid) out.out_block = reasm_.out_block();

  // ---------------------------
  // Phase 2 – evaluate next state against the snapshot
  // ---------------------------
  out.admitted = dispatcher_.Evaluate(in.in_valid, in.in_payload, lane_ready);

  for (std::size_t i = 0; i < cfg_.num_lanes; ++i) {
    std::optional<Block> admit;
    if (out.admitted.has_value() && out.admitted->lane == i) {
      admit = out.admitted->block;
    }
    lanes_[i].Evaluate(admit, slot_ready[i]);
  }

  out.released = reasm_.Evaluate(lane_out, in.out_ready);
  if (out.released) out.released_lane = match;

  counter_.Evaluate(out.released);

  // ---------------------------
  // Phase 3 – commit
  // ---------------------------
  dispatcher_.Commit();
  for (std::size_t i = 0; i < cfg_.num_lanes; ++i) {
    lanes_[i].Commit();
  }
  reasm_.Commit();
  counter_.Commit();

  ++tick_;
  return out;
}

void ClockCore::Reset() {
  dispatcher_.Reset();
  for (std::size_t i = 0; i < cfg_.num_lanes; ++i) {
    lanes_[i].Reset();
  }
  reasm_.Reset();
  counter_.Reset();
  tick_ = 0;
}

std::size_t ClockCore::InFlight() const {
  std::size_t n = reasm_.occupancy();
  for (std::size_t i = 0; i < cfg_.num_lanes; ++i) {
    n += lanes_[i].occupancy();
  }
  return n;
}

} // namespace rf
