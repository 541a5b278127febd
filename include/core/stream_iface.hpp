#pragma once
#include <cstdint>
#include <optional>

#include "common/block.hpp"

namespace rf {

// All comments are in English.
// Producer side of the input link. Offer() must not look at ready: the
// pipeline samples valid/payload and its own ready independently.
class StreamSource {
public:
  virtual ~StreamSource() = default;

  // Payload presented this tick, or nullopt for valid=0. Once a payload has
  // been offered it must be offered unchanged until OnAccepted().
  virtual std::optional<std::uint64_t> Offer(std::uint64_t tick) = 0;

  // Called after a tick in which valid && ready held.
  virtual void OnAccepted(std::uint64_t tick) = 0;

  // Synchronous reset together with the pipeline.
  virtual void Reset() = 0;
};

// Consumer side of the output link.
class StreamSink {
public:
  virtual ~StreamSink() = default;

  // Ready presented this tick; must not depend on the presented block.
  virtual bool Ready(std::uint64_t tick) = 0;

  // Called after a tick in which valid && ready held.
  virtual void OnReceive(const Block& b, std::uint64_t tick) = 0;

  virtual void Reset() = 0;
};

} // namespace rf
