#pragma once

#include "promptart/art/Color.h"
#include "promptart/art/Prompt.h"
#include "promptart/core/Types.h"

namespace promptart::art {

enum class PaletteKind : core::u8 {
  Night = 0,
  Ocean,
  Forest,
  Urban,
  Default
};

inline constexpr int kPaletteCount = 5;

struct Palette {
  PaletteKind kind{PaletteKind::Default};
  Rgb bgTop{};
  Rgb bgBottom{};
  Rgb primary{};
  Rgb secondary{};
  Rgb accent{};
  Rgb ground{};
};

// The constant record for a kind.
const Palette& palette(PaletteKind kind);

// Keyword groups in priority order; the first group that intersects the tokens wins:
//   night, moon, dark, stars, galaxy          -> Night
//   ocean, sea, water, beach, coast           -> Ocean
//   forest, nature, botanical, tree, leaf, green -> Forest
//   city, urban, street, building, neon       -> Urban
//   otherwise                                 -> Default
PaletteKind selectPaletteKind(const TokenSet& tokens);
const Palette& selectPalette(const TokenSet& tokens);

const char* paletteKindName(PaletteKind kind);

} // namespace promptart::art
