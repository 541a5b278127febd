// All comments are in English.
#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "core/stream_iface.hpp"

namespace rf {

// A [start, start+length) range of ticks.
struct TickWindow {
  std::uint64_t start  = 0;
  std::uint64_t length = 0;
  bool Contains(std::uint64_t t) const { return t >= start && t - start < length; }
};

/**
 * PatternSource
 *
 * Seeded producer. Each tick without a pending payload it raises valid with
 * probability valid_rate and draws a fresh payload; a pending payload stays
 * on the link until accepted. Stops after 'num_blocks' acceptances.
 */
class PatternSource final : public StreamSource {
public:
  PatternSource(std::uint64_t num_blocks, double valid_rate,
                int payload_bits, std::uint32_t seed);

  std::optional<std::uint64_t> Offer(std::uint64_t tick) override;
  void OnAccepted(std::uint64_t tick) override;
  void Reset() override;

  std::uint64_t accepted()  const { return accepted_; }
  bool          exhausted() const { return accepted_ >= num_blocks_; }

private:
  std::uint64_t num_blocks_;
  double        valid_rate_;
  int           payload_bits_;

  std::mt19937_64 rng_;
  std::bernoulli_distribution valid_draw_;
  std::optional<std::uint64_t> pending_;
  std::uint64_t accepted_ = 0;
};

/**
 * PatternSink
 *
 * Seeded consumer. Ready with probability ready_rate, forced low inside any
 * of the stall windows. Keeps every received block in arrival order.
 */
class PatternSink final : public StreamSink {
public:
  PatternSink(double ready_rate, std::vector<TickWindow> stall_windows, std::uint32_t seed);

  bool Ready(std::uint64_t tick) override;
  void OnReceive(const Block& b, std::uint64_t tick) override;
  void Reset() override;

  const std::vector<Block>& received() const { return received_; }

private:
  double        ready_rate_;
  std::vector<TickWindow> stall_windows_;

  std::mt19937 rng_;
  std::bernoulli_distribution ready_draw_;
  std::vector<Block> received_;
};

} // namespace rf
