#pragma once
// All comments are in English.

#include <array>
#include <cstddef>
#include <optional>

#include "common/constants.hpp"
#include "common/block.hpp"
#include "arch/stage_transform.hpp"

namespace rf {

/**
 * Lane
 *
 * Responsibility:
 *   - K-slot fixed-latency pipeline. Slot 0 captures Apply(0, admitted);
 *     slot j+1 captures Apply(j+1, slot j) on every non-stalled tick.
 *   - Slot K-1 is the output register; out_valid() reads it directly.
 *   - Stall: output valid and downstream not ready. While stalled every
 *     slot holds and in_ready() is false.
 *
 * Two-phase use per tick: Evaluate() computes next_slots_ from the current
 * slots only, Commit() makes them current.
 *
 * Wiring:
 *   - Non-owning pointer to the shared StageTransform.
 */
class Lane {
public:
  Lane() = default;

  // Must be called once before the first tick. Throws std::invalid_argument.
  void Configure(std::size_t lane_id, std::size_t latency, const StageTransform* xform);

  // ---- Combinational views (state only) ----
  bool out_valid() const { return slots_[latency_ - 1].has_value(); }
  const Block& out_block() const;
  bool Stalled(bool downstream_ready) const { return out_valid() && !downstream_ready; }
  bool in_ready(bool downstream_ready) const { return !Stalled(downstream_ready); }

  // ---- Sequential update ----
  // Throws std::logic_error if an admission arrives while stalled.
  void Evaluate(const std::optional<Block>& admit, bool downstream_ready);
  void Commit();
  void Reset();

  // Introspection
  std::size_t lane_id()  const { return lane_id_; }
  std::size_t latency()  const { return latency_; }
  std::size_t occupancy() const;
  const std::optional<Block>& slot(std::size_t i) const;
  bool last_stalled() const { return last_stalled_; }

private:
  std::size_t lane_id_ = 0;
  std::size_t latency_ = 1;
  const StageTransform* xform_ = nullptr;

  std::array<std::optional<Block>, kMaxLaneLatency> slots_{};
  std::array<std::optional<Block>, kMaxLaneLatency> next_slots_{};
  bool evaluated_    = false;
  bool last_stalled_ = false;  // stall decision of the most recent Evaluate()
};

} // namespace rf
