#pragma once
// All comments are in English.

#include <cstdint>

namespace rf {

// All-ones mask of the low 'bits' bits; bits in [1, 64].
inline constexpr std::uint64_t MaskOf(int bits) {
  return (bits >= 64) ? ~0ULL : ((1ULL << bits) - 1ULL);
}

inline constexpr std::uint64_t Truncate(std::uint64_t v, int bits) {
  return v & MaskOf(bits);
}

// (v + 1) mod 2^bits.
inline constexpr std::uint64_t IncrementWrap(std::uint64_t v, int bits) {
  return (v + 1ULL) & MaskOf(bits);
}

// Left rotate inside a 'bits'-wide word; amount is reduced modulo 'bits'.
inline constexpr std::uint64_t RotateLeft(std::uint64_t v, unsigned amount, int bits) {
  const unsigned w = static_cast<unsigned>(bits);
  const unsigned r = amount % w;
  const std::uint64_t x = v & MaskOf(bits);
  if (r == 0) return x;
  return ((x << r) | (x >> (w - r))) & MaskOf(bits);
}

// Forward distance from 'from' to 'to' modulo 2^bits.
inline constexpr std::uint64_t WrapDistance(std::uint64_t from, std::uint64_t to, int bits) {
  return (to - from) & MaskOf(bits);
}

} // namespace rf
