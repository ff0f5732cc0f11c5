#include "promptart/art/Palette.h"

#include "test_harness.h"

#include <string>

int test_palette() {
  int failures = 0;

  using namespace promptart::art;

  auto kindOf = [](const char* prompt) { return selectPaletteKind(extractTokens(prompt)); };

  // Every kind has its own record.
  for (int i = 0; i < kPaletteCount; ++i) {
    const auto kind = static_cast<PaletteKind>(i);
    CHECK(palette(kind).kind == kind);
    CHECK(std::string(paletteKindName(kind)) != "?");
  }
  CHECK(palette(PaletteKind::Night).bgTop != palette(PaletteKind::Ocean).bgTop);

  CHECK(kindOf("a quiet night under the stars") == PaletteKind::Night);
  CHECK(kindOf("waves on the beach") == PaletteKind::Ocean);
  CHECK(kindOf("a botanical garden") == PaletteKind::Forest);
  CHECK(kindOf("neon signs") == PaletteKind::Urban);
  CHECK(kindOf("a warm afternoon") == PaletteKind::Default);
  CHECK(kindOf("") == PaletteKind::Default);
  CHECK(kindOf("NIGHT") == PaletteKind::Night);
  CHECK(kindOf("nightfall") == PaletteKind::Default);

  // Priority: night > ocean > forest > urban.
  CHECK(kindOf("night by the ocean") == PaletteKind::Night);
  CHECK(kindOf("ocean and forest") == PaletteKind::Ocean);
  CHECK(kindOf("green city") == PaletteKind::Forest);
  CHECK(kindOf("dark green city by the sea") == PaletteKind::Night);

  CHECK(&selectPalette(extractTokens("moon")) == &palette(PaletteKind::Night));
  CHECK(std::string(paletteKindName(PaletteKind::Urban)) == "urban");

  return failures;
}
