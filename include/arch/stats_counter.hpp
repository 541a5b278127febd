#pragma once
// All comments are in English.

#include <cstdint>

#include "common/constants.hpp"

namespace rf {

// Free-running cycle counter plus release-event counter, both counter_bits wide.
class StatsCounter {
public:
  StatsCounter() = default;

  void Configure(int counter_bits);

  // 'release_event' is the consumer-facing valid && ready of this tick.
  void Evaluate(bool release_event);
  void Commit();
  void Reset();

  std::uint64_t blocks_processed() const { return blocks_processed_; }
  std::uint64_t cycles_elapsed()   const { return cycles_elapsed_; }
  int           counter_bits()     const { return counter_bits_; }

private:
  int counter_bits_ = kDefaultCounterBits;

  std::uint64_t blocks_processed_ = 0;
  std::uint64_t cycles_elapsed_   = 0;
  std::uint64_t next_blocks_processed_ = 0;
  std::uint64_t next_cycles_elapsed_   = 0;
};

} // namespace rf
