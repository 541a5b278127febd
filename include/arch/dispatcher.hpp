#pragma once
// All comments are in English.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "common/constants.hpp"
#include "common/block.hpp"

namespace rf {

// One ready/valid flag per lane, indexed by lane id.
using LaneFlags = std::array<bool, kMaxLanes>;

// A block routed to exactly one lane in one tick.
struct Admission {
  std::size_t lane = 0;
  Block       block{};
};

/**
 * Dispatcher
 *
 * Responsibility:
 *   - Round-robin admission: the producer is ready exactly when the
 *     currently selected lane is ready.
 *   - On a transfer, stamp seq_counter onto the block, route it to lane_sel,
 *     then advance seq_counter (mod 2^seq_bits) and lane_sel (mod N).
 *   - No transfer: neither pointer moves.
 */
class Dispatcher {
public:
  Dispatcher() = default;

  // Throws std::invalid_argument on bad lane count or width.
  void Configure(std::size_t num_lanes, int seq_bits, int payload_bits);

  // Ready towards the producer; never depends on the offered payload.
  bool in_ready(const LaneFlags& lane_ready) const { return lane_ready[lane_sel_]; }

  // Returns the admission performed this tick, if any.
  std::optional<Admission> Evaluate(bool in_valid, std::uint64_t payload,
                                    const LaneFlags& lane_ready);
  void Commit();
  void Reset();

  std::size_t   lane_sel()    const { return lane_sel_; }
  std::uint32_t seq_counter() const { return seq_counter_; }
  std::size_t   num_lanes()   const { return num_lanes_; }

private:
  std::size_t num_lanes_    = 1;
  int         seq_bits_     = kDefaultSeqBits;
  int         payload_bits_ = kDefaultPayloadBits;

  std::size_t   lane_sel_    = 0;
  std::uint32_t seq_counter_ = 0;

  std::size_t   next_lane_sel_    = 0;
  std::uint32_t next_seq_counter_ = 0;
};

} // namespace rf
