#pragma once

#include "promptart/core/Types.h"

#include <cstddef>
#include <string_view>

namespace promptart::core {

// Incremental 64-bit FNV-1a builder for regression signatures (rendered pixels,
// token lists). Integers are fed in explicit little-endian order and strings are
// length-prefixed, so signatures are stable across runs and platforms.
// Not cryptographic.
class StableHash64 {
public:
  static constexpr u64 kOffsetBasis = 14695981039346656037ull;
  static constexpr u64 kPrime       = 1099511628211ull;

  explicit StableHash64(u64 seed = kOffsetBasis) : h_(seed) {}

  void reset(u64 seed = kOffsetBasis) { h_ = seed; }
  u64 value() const { return h_; }

  void addByte(u8 b) {
    h_ ^= static_cast<u64>(b);
    h_ *= kPrime;
  }

  void addBytes(const void* data, std::size_t size) {
    if (!data || size == 0) return;
    const auto* p = static_cast<const u8*>(data);
    for (std::size_t i = 0; i < size; ++i) addByte(p[i]);
  }

  void addU32(u32 v) {
    for (int i = 0; i < 4; ++i) addByte(static_cast<u8>((v >> (8 * i)) & 0xFFu));
  }

  void addU64(u64 v) {
    for (int i = 0; i < 8; ++i) addByte(static_cast<u8>((v >> (8 * i)) & 0xFFull));
  }

  void addInt(int v) { addU64(static_cast<u64>(static_cast<i64>(v))); }

  // Length prefix keeps ["ab","c"] and ["a","bc"] apart.
  void addString(std::string_view s) {
    addU64(static_cast<u64>(s.size()));
    addBytes(s.data(), s.size());
  }

private:
  u64 h_{kOffsetBasis};
};

} // namespace promptart::core
