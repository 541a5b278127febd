#pragma once
// All comments are in English.
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "common/constants.hpp"
#include "common/block.hpp"
#include "common/pipeline_config.hpp"
#include "arch/stage_transform.hpp"   // per-stage payload function
#include "arch/dispatcher.hpp"        // S0
#include "arch/lane.hpp"              // S1
#include "arch/reassembler.hpp"       // S2
#include "arch/stats_counter.hpp"     // S3

namespace rf {

// External inputs sampled in one tick.
struct TickInputs {
  bool          in_valid   = false;  // producer offers a block
  std::uint64_t in_payload = 0;
  bool          out_ready  = false;  // consumer accepts a block
};

// Handshake outcome of one tick on both links.
struct TickOutputs {
  std::uint64_t tick = 0;            // index of the tick just executed

  bool in_ready = false;             // ready presented to the producer
  std::optional<Admission> admitted; // set iff in_valid && in_ready

  bool  out_valid = false;           // valid presented to the consumer
  Block out_block{};                 // meaningful iff out_valid
  bool  released  = false;           // out_valid && out_ready
  std::optional<std::size_t> released_lane;
};

/**
 * ClockCore
 *
 * Wires producer -> Dispatcher -> Lane[0..N-1] -> Reassembler -> consumer,
 * plus the StatsCounter on the release event. Tick() is lock-step:
 *   1) every ready/valid signal is computed from the current state;
 *   2) every component Evaluate()s its next state against that snapshot;
 *   3) every component Commit()s.
 * No component observes another's next state within the same tick.
 */
class ClockCore final {
public:
  // Throws std::invalid_argument if cfg.Validate() fails.
  explicit ClockCore(const PipelineConfig& cfg);

  ClockCore(const ClockCore&) = delete;
  ClockCore& operator=(const ClockCore&) = delete;

  // ---- Combinational views of the boundary, valid before Tick() ----
  bool in_ready() const;
  bool out_valid() const { return reasm_.out_valid(); }
  const Block& out_block() const { return reasm_.out_block(); }

  // Pipeline: S0 -> S1 -> S2 -> S3
  TickOutputs Tick(const TickInputs& in);

  // Synchronous reset; in-flight blocks are discarded.
  void Reset();

  // ---- Components accessors ----
  const PipelineConfig& config()      const { return cfg_; }
  const StageTransform& transform()   const { return xform_; }
  const Dispatcher&     dispatcher()  const { return dispatcher_; }
  const Lane&           lane(std::size_t i) const;
  const Reassembler&    reassembler() const { return reasm_; }
  const StatsCounter&   counter()     const { return counter_; }

  std::size_t   num_lanes() const { return cfg_.num_lanes; }
  std::uint64_t tick()      const { return tick_; }

  // Blocks admitted but not yet released (lane slots + reassembly slots).
  std::size_t InFlight() const;

private:
  // Ready of each lane towards the dispatcher, from state only.
  LaneFlags LaneReadyFlags(const LaneFlags& slot_ready) const;

private:
  PipelineConfig cfg_;
  StageTransform xform_;

  // Components
  Dispatcher                       dispatcher_;
  std::array<Lane, kMaxLanes>      lanes_{};
  Reassembler                      reasm_;
  StatsCounter                     counter_;

  std::uint64_t tick_ = 0;
};

} // namespace rf
