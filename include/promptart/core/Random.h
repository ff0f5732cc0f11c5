#pragma once

#include "promptart/core/Types.h"

#include <type_traits>
#include <utility>

namespace promptart::core {

// SplitMix64: small 64-bit-state PRNG. Deterministic across platforms, which is
// what reproducible artwork needs. Not suitable for crypto.
class SplitMix64 {
public:
  explicit SplitMix64(u64 seed = 0) : state_(seed) {}

  void reseed(u64 seed) {
    state_ = seed;
    draws_ = 0;
  }

  u64 nextU64() {
    ++draws_;
    u64 z = (state_ += 0x9E3779B97F4A7C15ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
  }

  u32 nextU32() { return static_cast<u32>(nextU64() >> 32); }

  // [0,1) from the top 53 bits.
  double nextDouble() {
    constexpr double inv = 1.0 / static_cast<double>(1ull << 53);
    return static_cast<double>(nextU64() >> 11) * inv;
  }

  // Inclusive range for integers.
  template <class Int, std::enable_if_t<std::is_integral_v<Int>, int> = 0>
  Int range(Int minInclusive, Int maxInclusive) {
    if (maxInclusive < minInclusive) std::swap(minInclusive, maxInclusive);
    const u64 span = static_cast<u64>(static_cast<i64>(maxInclusive) - static_cast<i64>(minInclusive)) + 1ull;
    return static_cast<Int>(static_cast<i64>(minInclusive) + static_cast<i64>(nextU64() % span));
  }

  // [min,max) for floating point.
  template <class Float, std::enable_if_t<std::is_floating_point_v<Float>, int> = 0>
  Float range(Float minInclusive, Float maxExclusive) {
    if (maxExclusive < minInclusive) std::swap(minInclusive, maxExclusive);
    return static_cast<Float>(minInclusive + (maxExclusive - minInclusive) * nextDouble());
  }

  bool chance(double p) { return nextDouble() < p; }

  // Number of 64-bit values drawn since construction/reseed.
  u64 draws() const { return draws_; }

private:
  u64 state_{0};
  u64 draws_{0};
};

} // namespace promptart::core
