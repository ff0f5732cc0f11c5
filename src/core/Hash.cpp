#include "promptart/core/Hash.h"

#include <cstring>

namespace promptart::core {

namespace {

constexpr u32 kRoundConstants[64] = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u,
};

inline u32 rotr(u32 x, u32 n) { return (x >> n) | (x << (32u - n)); }
inline u32 ch(u32 x, u32 y, u32 z) { return (x & y) ^ (~x & z); }
inline u32 maj(u32 x, u32 y, u32 z) { return (x & y) ^ (x & z) ^ (y & z); }
inline u32 bigSigma0(u32 x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
inline u32 bigSigma1(u32 x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }
inline u32 smallSigma0(u32 x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
inline u32 smallSigma1(u32 x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }

void compressBlock(u32 state[8], const u8 block[64]) {
  u32 w[64];
  for (int i = 0; i < 16; ++i) {
    w[i] = ((u32)block[i * 4 + 0] << 24) |
           ((u32)block[i * 4 + 1] << 16) |
           ((u32)block[i * 4 + 2] << 8) |
           ((u32)block[i * 4 + 3]);
  }
  for (int i = 16; i < 64; ++i) {
    w[i] = smallSigma1(w[i - 2]) + w[i - 7] + smallSigma0(w[i - 15]) + w[i - 16];
  }

  u32 a = state[0], b = state[1], c = state[2], d = state[3];
  u32 e = state[4], f = state[5], g = state[6], h = state[7];

  for (int i = 0; i < 64; ++i) {
    const u32 t1 = h + bigSigma1(e) + ch(e, f, g) + kRoundConstants[i] + w[i];
    const u32 t2 = bigSigma0(a) + maj(a, b, c);
    h = g;
    g = f;
    f = e;
    e = d + t1;
    d = c;
    c = b;
    b = a;
    a = t1 + t2;
  }

  state[0] += a; state[1] += b; state[2] += c; state[3] += d;
  state[4] += e; state[5] += f; state[6] += g; state[7] += h;
}

} // namespace

Sha256Digest sha256(const void* data, std::size_t size) {
  u32 state[8] = {
      0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
      0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
  };

  const auto* bytes = static_cast<const u8*>(data);
  std::size_t offset = 0;
  while (size - offset >= 64) {
    compressBlock(state, bytes + offset);
    offset += 64;
  }

  // Final block(s): remaining bytes, 0x80, zero padding, 64-bit big-endian bit length.
  u8 tail[128]{};
  const std::size_t rem = size - offset;
  if (rem > 0) std::memcpy(tail, bytes + offset, rem);
  tail[rem] = 0x80u;
  const std::size_t tailLen = (rem + 1 + 8 <= 64) ? 64 : 128;

  const u64 bitLen = static_cast<u64>(size) * 8ull;
  for (int i = 0; i < 8; ++i) {
    tail[tailLen - 1 - i] = static_cast<u8>((bitLen >> (8 * i)) & 0xFFu);
  }

  compressBlock(state, tail);
  if (tailLen == 128) compressBlock(state, tail + 64);

  Sha256Digest out{};
  for (int i = 0; i < 8; ++i) {
    out[i * 4 + 0] = static_cast<u8>(state[i] >> 24);
    out[i * 4 + 1] = static_cast<u8>(state[i] >> 16);
    out[i * 4 + 2] = static_cast<u8>(state[i] >> 8);
    out[i * 4 + 3] = static_cast<u8>(state[i]);
  }
  return out;
}

Sha256Digest sha256(std::string_view text) { return sha256(text.data(), text.size()); }

std::string toHex(const u8* bytes, std::size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.resize(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out[i * 2 + 0] = kDigits[(bytes[i] >> 4) & 0xFu];
    out[i * 2 + 1] = kDigits[bytes[i] & 0xFu];
  }
  return out;
}

std::string sha256Hex(std::string_view text) {
  const Sha256Digest d = sha256(text);
  return toHex(d.data(), d.size());
}

} // namespace promptart::core
