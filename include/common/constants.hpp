// common/constants.hpp
#pragma once
// All comments are in English.

#include <cstddef>
#include <cstdint>

namespace rf {

// -----------------------------------------------------------------------------
// Structural capacities (fixed at compile time)
// -----------------------------------------------------------------------------
inline constexpr std::size_t kMaxLanes        = 32;   // Lane array / reassembly slots
inline constexpr std::size_t kMaxLaneLatency  = 64;   // pipeline slots per Lane

// -----------------------------------------------------------------------------
// Field widths
// -----------------------------------------------------------------------------
inline constexpr int kMaxPayloadBits = 64;
inline constexpr int kMaxSeqBits     = 32;
inline constexpr int kMaxCounterBits = 64;

// -----------------------------------------------------------------------------
// Defaults used when a config omits a field
// -----------------------------------------------------------------------------
inline constexpr int         kDefaultPayloadBits = 32;
inline constexpr std::size_t kDefaultNumLanes    = 4;
inline constexpr std::size_t kDefaultLaneLatency = 8;
inline constexpr int         kDefaultSeqBits     = 8;
inline constexpr int         kDefaultCounterBits = 32;

// Seed for deriving stage keys when none are configured.
inline constexpr std::uint64_t kStageKeyGolden = 0x9E3779B97F4A7C15ULL;

// -----------------------------------------------------------------------------
// Sanity checks
// -----------------------------------------------------------------------------
static_assert(kMaxLanes > 0,       "kMaxLanes must be positive");
static_assert(kMaxLaneLatency > 0, "kMaxLaneLatency must be positive");
static_assert(kDefaultNumLanes <= kMaxLanes,          "default lane count exceeds kMaxLanes");
static_assert(kDefaultLaneLatency <= kMaxLaneLatency, "default latency exceeds kMaxLaneLatency");
static_assert(kDefaultSeqBits <= kMaxSeqBits,         "default seq width exceeds kMaxSeqBits");

} // namespace rf
