#pragma once
// All comments are in English.

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "common/block.hpp"
#include "arch/dispatcher.hpp"        // Admission
#include "arch/stage_transform.hpp"
#include "utils/latency_stats.hpp"

namespace rf {

/**
 * Scoreboard
 *
 * Reference model for the whole pipeline. Predicts every released block
 * from the admissions and checks:
 *   - round-robin lane choice and +1 sequence ids at admission;
 *   - release order equals admission order (no loss, no duplicates);
 *   - released payload equals StageTransform::ApplyAll(admitted payload);
 *   - reassembler occupancy never exceeds the lane count.
 * Mismatches are collected as messages; nothing throws.
 */
class Scoreboard {
public:
  Scoreboard(const StageTransform& xform, std::size_t num_lanes, int seq_bits);

  void OnAdmit(const Admission& a, std::uint64_t tick);
  void OnRelease(const Block& b, std::uint64_t tick);
  void OnOccupancy(std::size_t reasm_occupancy, std::uint64_t tick);

  // Synchronous reset: in-flight blocks are forgotten, numbering restarts.
  void OnReset();

  bool ok() const { return errors_.empty(); }
  const std::vector<std::string>& errors() const { return errors_; }

  std::size_t   outstanding()   const { return expected_.size(); }
  std::uint64_t admitted()      const { return admitted_; }
  std::uint64_t released()      const { return released_; }
  std::size_t   max_occupancy() const { return max_occupancy_; }
  const util::QueueLatencyStats& latency() const { return latency_; }

private:
  struct Expected {
    std::uint32_t seq     = 0;
    std::uint64_t payload = 0;   // after all stages
    std::uint64_t admit_tick = 0;
  };

  void Error(std::uint64_t tick, const std::string& msg);

  const StageTransform& xform_;
  std::size_t num_lanes_;
  int         seq_bits_;

  std::uint32_t next_admit_seq_  = 0;
  std::size_t   next_admit_lane_ = 0;
  std::deque<Expected> expected_;

  std::uint64_t admitted_ = 0;
  std::uint64_t released_ = 0;
  std::size_t   max_occupancy_ = 0;
  util::QueueLatencyStats latency_{};
  std::vector<std::string> errors_;
};

} // namespace rf
