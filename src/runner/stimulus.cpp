// All comments are in English.
#include "runner/stimulus.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "common/bit_width.hpp"

namespace rf {

namespace {

void CheckRate(double r, const char* what) {
  if (!(r >= 0.0 && r <= 1.0)) {
    throw std::invalid_argument(std::string(what) + ": rate must be in [0, 1].");
  }
}

} // namespace

PatternSource::PatternSource(std::uint64_t num_blocks, double valid_rate,
                             int payload_bits, std::uint32_t seed)
  : num_blocks_(num_blocks),
    valid_rate_(valid_rate),
    payload_bits_(payload_bits),
    rng_(seed),
    valid_draw_(0.0)
{
  CheckRate(valid_rate_, "PatternSource");
  valid_draw_ = std::bernoulli_distribution(valid_rate_);
}

std::optional<std::uint64_t> PatternSource::Offer(std::uint64_t /*tick*/) {
  if (pending_.has_value()) return pending_;
  if (exhausted()) return std::nullopt;
  if (!valid_draw_(rng_)) return std::nullopt;
  pending_ = Truncate(rng_(), payload_bits_);
  return pending_;
}

void PatternSource::OnAccepted(std::uint64_t /*tick*/) {
  if (!pending_.has_value()) {
    throw std::logic_error("PatternSource::OnAccepted: no payload was offered.");
  }
  pending_.reset();
  ++accepted_;
}

void PatternSource::Reset() {
  // The stream restarts; blocks accepted before the reset stay counted.
  pending_.reset();
}

PatternSink::PatternSink(double ready_rate, std::vector<TickWindow> stall_windows,
                         std::uint32_t seed)
  : ready_rate_(ready_rate),
    stall_windows_(std::move(stall_windows)),
    rng_(seed),
    ready_draw_(0.0)
{
  CheckRate(ready_rate_, "PatternSink");
  ready_draw_ = std::bernoulli_distribution(ready_rate_);
}

bool PatternSink::Ready(std::uint64_t tick) {
  // Draw every tick so the ready sequence does not shift with the windows.
  const bool draw = ready_draw_(rng_);
  for (const auto& w : stall_windows_) {
    if (w.Contains(tick)) return false;
  }
  return draw;
}

void PatternSink::OnReceive(const Block& b, std::uint64_t /*tick*/) {
  received_.push_back(b);
}

void PatternSink::Reset() {
  // Received history is kept; the scoreboard handles the reset boundary.
}

} // namespace rf
