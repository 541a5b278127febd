#pragma once
// All comments are in English.

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "common/block.hpp"

namespace rf {

enum class LinkViolationKind {
  kValidRetracted,   // valid dropped before the held block was transferred
  kPayloadChanged,   // held block replaced while waiting for ready
  kReadyDependsOnData // ready seen by the transfer differs from ready sampled before data
};

const char* LinkViolationKindToString(LinkViolationKind k);

struct LinkViolation {
  std::uint64_t     tick = 0;
  LinkViolationKind kind = LinkViolationKind::kValidRetracted;
  std::string       detail;
};

/**
 * LinkMonitor
 *
 * Watches one valid/ready link tick by tick and records handshake
 * violations. It never throws on a violation; the harness decides.
 */
class LinkMonitor {
public:
  explicit LinkMonitor(std::string name) : name_(std::move(name)) {}

  // One observation per tick, after both sides have driven the link.
  void Observe(std::uint64_t tick, bool valid, bool ready, const Block& data);

  // 'ready_probe' was sampled before the source offered data this tick;
  // 'ready_seen' is the ready the transfer actually used.
  void ObserveReadyProbe(std::uint64_t tick, bool ready_probe, bool ready_seen);

  // A synchronous reset drops any hold obligation.
  void Reset();

  const std::string& name() const { return name_; }
  bool clean() const { return violations_.empty(); }
  const std::vector<LinkViolation>& violations() const { return violations_; }
  std::uint64_t transfers()   const { return transfers_; }
  std::uint64_t stall_ticks() const { return stall_ticks_; }

private:
  void Record(std::uint64_t tick, LinkViolationKind kind, const std::string& detail);

  std::string name_;
  bool  holding_ = false;  // previous tick ended with valid && !ready
  Block held_{};

  std::uint64_t transfers_   = 0;
  std::uint64_t stall_ticks_ = 0;
  std::vector<LinkViolation> violations_;
};

} // namespace rf
