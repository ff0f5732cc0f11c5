#pragma once

#include "promptart/art/Canvas.h"
#include "promptart/art/Palette.h"
#include "promptart/art/Prompt.h"
#include "promptart/core/Random.h"
#include "promptart/core/Types.h"

namespace promptart::art {

// Mid-ground scene style. Exactly one is drawn per image.
enum class SceneMotif : core::u8 {
  Urban = 0,   // skyline with lit windows
  Marine,      // layered sea bands
  Terrain      // overlapping mountains
};

struct MotifInfo {
  SceneMotif motif{SceneMotif::Terrain};
  int elements{0};    // buildings, bands or mountains
  int litWindows{0};  // urban only
};

// Urban words (city, urban, building, street, neon) are checked first, then
// marine words (ocean, sea, water, beach, coast); anything else is terrain.
// Independent of the palette choice: "city at night" gets the night palette
// with an urban skyline.
SceneMotif selectSceneMotif(const TokenSet& tokens);

MotifInfo drawSceneMotif(Canvas& canvas, SceneMotif motif, const Palette& pal, core::SplitMix64& rng);

const char* sceneMotifName(SceneMotif motif);

} // namespace promptart::art
