// All comments are in English.
#include "harness/link_monitor.hpp"

#include <sstream>

namespace rf {

const char* LinkViolationKindToString(LinkViolationKind k) {
  switch (k) {
    case LinkViolationKind::kValidRetracted:     return "valid_retracted";
    case LinkViolationKind::kPayloadChanged:     return "payload_changed";
    case LinkViolationKind::kReadyDependsOnData: return "ready_depends_on_data";
    default:                                     return "unknown";
  }
}

void LinkMonitor::Record(std::uint64_t tick, LinkViolationKind kind, const std::string& detail) {
  LinkViolation v;
  v.tick   = tick;
  v.kind   = kind;
  v.detail = "[" + name_ + "] " + detail;
  violations_.push_back(std::move(v));
}

void LinkMonitor::Observe(std::uint64_t tick, bool valid, bool ready, const Block& data) {
  if (holding_) {
    if (!valid) {
      std::ostringstream oss;
      oss << "valid retracted at tick " << tick << " while seq=" << held_.seq
          << " payload=0x" << std::hex << held_.payload << " was pending";
      Record(tick, LinkViolationKind::kValidRetracted, oss.str());
    } else if (data != held_) {
      std::ostringstream oss;
      oss << "held block changed at tick " << tick << ": seq " << held_.seq << " -> " << data.seq
          << ", payload 0x" << std::hex << held_.payload << " -> 0x" << data.payload;
      Record(tick, LinkViolationKind::kPayloadChanged, oss.str());
    }
  }

  if (valid && ready) {
    ++transfers_;
    holding_ = false;
  } else if (valid) {
    ++stall_ticks_;
    holding_ = true;
    held_    = data;
  } else {
    holding_ = false;
  }
}

void LinkMonitor::ObserveReadyProbe(std::uint64_t tick, bool ready_probe, bool ready_seen) {
  if (ready_probe != ready_seen) {
    std::ostringstream oss;
    oss << "ready sampled as " << ready_probe << " before data but " << ready_seen
        << " at transfer, tick " << tick;
    Record(tick, LinkViolationKind::kReadyDependsOnData, oss.str());
  }
}

void LinkMonitor::Reset() {
  holding_ = false;
  held_    = Block{};
}

} // namespace rf
