#pragma once

#include "promptart/art/Canvas.h"
#include "promptart/art/Palette.h"
#include "promptart/art/Prompt.h"
#include "promptart/core/Random.h"
#include "promptart/core/Types.h"

namespace promptart::art {

enum class CelestialKind : core::u8 {
  Sun = 0,
  Moon
};

struct AtmosphereInfo {
  CelestialKind celestial{CelestialKind::Sun};
  int discX{0};
  int discY{0};
  int discRadius{0};
  int particleCount{0};
};

// Moon when the prompt mentions night, moon or dark; otherwise sun.
CelestialKind selectCelestialKind(const TokenSet& tokens);

// 120 when the prompt mentions night, moon or stars; otherwise 60.
int particleCountFor(const TokenSet& tokens);

// Draws the celestial disc (accent colour, soft halo) and the particle field
// (secondary colour). RNG draws, in order:
//   disc x [120,860], disc y, disc radius
//     moon: y [90,250],  radius [55,90]
//     sun:  y [120,340], radius [80,150]
//   per particle: x [0,w-1], y [0, 55% of h], radius [1,3], alpha [100,220]
AtmosphereInfo drawAtmosphere(Canvas& canvas, const Palette& pal, const TokenSet& tokens, core::SplitMix64& rng);

const char* celestialKindName(CelestialKind kind);

} // namespace promptart::art
