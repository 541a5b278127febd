// All comments are in English.
#include "harness/scoreboard.hpp"

#include <sstream>

#include "common/bit_width.hpp"

namespace rf {

Scoreboard::Scoreboard(const StageTransform& xform, std::size_t num_lanes, int seq_bits)
  : xform_(xform), num_lanes_(num_lanes), seq_bits_(seq_bits) {}

void Scoreboard::Error(std::uint64_t tick, const std::string& msg) {
  errors_.push_back("tick " + std::to_string(tick) + ": " + msg);
}

void Scoreboard::OnAdmit(const Admission& a, std::uint64_t tick) {
  if (a.block.seq != next_admit_seq_) {
    std::ostringstream oss;
    oss << "admitted seq " << a.block.seq << ", expected " << next_admit_seq_;
    Error(tick, oss.str());
  }
  if (a.lane != next_admit_lane_) {
    std::ostringstream oss;
    oss << "admitted to lane " << a.lane << ", expected lane " << next_admit_lane_;
    Error(tick, oss.str());
  }

  Expected e;
  e.seq        = a.block.seq;
  e.payload    = xform_.ApplyAll(a.block.payload);
  e.admit_tick = tick;
  expected_.push_back(e);

  next_admit_seq_  = static_cast<std::uint32_t>(IncrementWrap(a.block.seq, seq_bits_));
  next_admit_lane_ = (a.lane + 1) % num_lanes_;
  ++admitted_;
}

void Scoreboard::OnRelease(const Block& b, std::uint64_t tick) {
  if (expected_.empty()) {
    std::ostringstream oss;
    oss << "released seq " << b.seq << " with nothing outstanding (duplicate or spurious)";
    Error(tick, oss.str());
    return;
  }
  const Expected e = expected_.front();
  expected_.pop_front();
  ++released_;

  if (b.seq != e.seq) {
    std::ostringstream oss;
    oss << "released seq " << b.seq << " out of order, expected " << e.seq;
    Error(tick, oss.str());
  }
  if (b.payload != e.payload) {
    std::ostringstream oss;
    oss << "seq " << b.seq << " payload 0x" << std::hex << b.payload
        << " != expected 0x" << e.payload;
    Error(tick, oss.str());
  }
  util::AccumulateQueueLatency(latency_, tick - e.admit_tick);
}

void Scoreboard::OnOccupancy(std::size_t reasm_occupancy, std::uint64_t tick) {
  if (reasm_occupancy > max_occupancy_) max_occupancy_ = reasm_occupancy;
  if (reasm_occupancy > num_lanes_) {
    Error(tick, "reassembler holds " + std::to_string(reasm_occupancy) +
                " blocks with only " + std::to_string(num_lanes_) + " lanes");
  }
}

void Scoreboard::OnReset() {
  expected_.clear();
  next_admit_seq_  = 0;
  next_admit_lane_ = 0;
}

} // namespace rf
