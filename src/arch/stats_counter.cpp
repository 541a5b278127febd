// All comments are in English.
#include "arch/stats_counter.hpp"

#include <stdexcept>

#include "common/bit_width.hpp"

namespace rf {

void StatsCounter::Configure(int counter_bits) {
  if (counter_bits < 1 || counter_bits > kMaxCounterBits) {
    throw std::invalid_argument("StatsCounter::Configure: counter_bits out of range.");
  }
  counter_bits_ = counter_bits;
  Reset();
}

void StatsCounter::Evaluate(bool release_event) {
  next_cycles_elapsed_ = IncrementWrap(cycles_elapsed_, counter_bits_);
  next_blocks_processed_ = release_event
      ? IncrementWrap(blocks_processed_, counter_bits_)
      : blocks_processed_;
}

void StatsCounter::Commit() {
  cycles_elapsed_   = next_cycles_elapsed_;
  blocks_processed_ = next_blocks_processed_;
}

void StatsCounter::Reset() {
  blocks_processed_      = 0;
  cycles_elapsed_        = 0;
  next_blocks_processed_ = 0;
  next_cycles_elapsed_   = 0;
}

} // namespace rf
