#pragma once
// All comments are in English.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "common/constants.hpp"
#include "common/block.hpp"
#include "arch/dispatcher.hpp"   // LaneFlags

namespace rf {

// Completed blocks presented by the lanes this tick, indexed by lane id.
using LaneOutputs = std::array<std::optional<Block>, kMaxLanes>;

/**
 * Reassembler
 *
 * Responsibility:
 *   - Hold at most one completed block per lane (one reassembly slot each).
 *     A lane may only deliver into an empty slot; lane_ready(i) is the
 *     backpressure signal back to lane i.
 *   - Present the slot whose seq equals next_expected to the consumer and
 *     release it on valid && ready, advancing next_expected (mod 2^seq_bits).
 *
 * Buffered blocks never exceed num_lanes. At most one release per tick.
 */
class Reassembler {
public:
  Reassembler() = default;

  // Throws std::invalid_argument.
  void Configure(std::size_t num_lanes, int seq_bits);

  // ---- Combinational views (state only) ----
  bool lane_ready(std::size_t lane) const;
  LaneFlags lane_ready_flags() const;

  // Lane whose slot holds next_expected, if any.
  // Throws std::logic_error if more than one slot matches.
  std::optional<std::size_t> match_lane() const;
  bool out_valid() const { return match_lane().has_value(); }
  const Block& out_block() const;

  // ---- Sequential update ----
  // Latches lane outputs into empty slots and performs at most one release.
  // Returns true iff a block was released to the consumer this tick.
  bool Evaluate(const LaneOutputs& lane_out, bool out_ready);
  void Commit();
  void Reset();

  // Introspection
  std::uint32_t next_expected() const { return next_expected_; }
  std::size_t   occupancy() const;
  std::size_t   num_lanes() const { return num_lanes_; }
  const std::optional<Block>& slot(std::size_t lane) const;

private:
  std::size_t num_lanes_ = 1;
  int         seq_bits_  = kDefaultSeqBits;

  std::uint32_t next_expected_ = 0;
  std::array<std::optional<Block>, kMaxLanes> slots_{};

  std::uint32_t next_next_expected_ = 0;
  std::array<std::optional<Block>, kMaxLanes> next_slots_{};
  bool evaluated_ = false;
};

} // namespace rf
