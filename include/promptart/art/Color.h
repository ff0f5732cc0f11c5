#pragma once

#include "promptart/core/Clamp.h"
#include "promptart/core/Types.h"

#include <cmath>

namespace promptart::art {

struct Rgb {
  core::u8 r{0};
  core::u8 g{0};
  core::u8 b{0};

  friend constexpr bool operator==(const Rgb& a, const Rgb& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
  }
  friend constexpr bool operator!=(const Rgb& a, const Rgb& b) { return !(a == b); }
};

inline core::u8 toChannel(double v) {
  return core::clampCast<core::u8>(std::lround(v), 0L, 255L);
}

// t=0 -> a, t=1 -> b, rounded per channel.
inline Rgb lerp(const Rgb& a, const Rgb& b, double t) {
  return {toChannel(a.r * (1.0 - t) + b.r * t),
          toChannel(a.g * (1.0 - t) + b.g * t),
          toChannel(a.b * (1.0 - t) + b.b * t)};
}

// Move toward white by `amount` in [0,1].
inline Rgb lighten(const Rgb& c, double amount) { return lerp(c, Rgb{255, 255, 255}, amount); }

// Move toward black by `amount` in [0,1].
inline Rgb darken(const Rgb& c, double amount) { return lerp(c, Rgb{0, 0, 0}, amount); }

// Per-channel offset, saturating at 0/255.
inline Rgb offset(const Rgb& c, int dr, int dg, int db) {
  return {core::clampCast<core::u8>((int)c.r + dr, 0, 255),
          core::clampCast<core::u8>((int)c.g + dg, 0, 255),
          core::clampCast<core::u8>((int)c.b + db, 0, 255)};
}

} // namespace promptart::art
