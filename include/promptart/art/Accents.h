#pragma once

#include "promptart/art/Canvas.h"
#include "promptart/art/Palette.h"
#include "promptart/art/Prompt.h"
#include "promptart/core/Random.h"
#include "promptart/core/Types.h"

namespace promptart::art {

// Foreground detail overlay. Exactly one is drawn per image.
enum class AccentStyle : core::u8 {
  Trees = 0,
  Geometric,
  Strokes
};

struct AccentInfo {
  AccentStyle style{AccentStyle::Strokes};
  int count{0};
  int ellipses{0}; // geometric only; the rest are rectangles
};

// forest, nature, botanical, tree, leaf, green -> Trees
// abstract, geometric, minimalist              -> Geometric
// otherwise                                    -> Strokes
AccentStyle selectAccentStyle(const TokenSet& tokens);

// RNG draws per element:
//   tree:   x [20,w-20], trunk height [40,90], crown radius [22,48]
//   shape:  x, y, width [40,180], height [40,180], alpha [60,150], ellipse-or-rect
//   stroke: x, y (lower 55%), length [30,120], slope [0.3,1.2), width [2,5], alpha [80,180]
AccentInfo drawAccents(Canvas& canvas, AccentStyle style, const Palette& pal, core::SplitMix64& rng);

const char* accentStyleName(AccentStyle style);

} // namespace promptart::art
