#pragma once

#include "promptart/art/Accents.h"
#include "promptart/art/Atmosphere.h"
#include "promptart/art/Canvas.h"
#include "promptart/art/Palette.h"
#include "promptart/art/PostProcess.h"
#include "promptart/art/Prompt.h"
#include "promptart/art/SceneMotif.h"
#include "promptart/core/Types.h"

#include <string_view>

namespace promptart::art {

struct SceneOptions {
  double blurSigma{kDefaultBlurSigma};
};

// What a prompt resolves to. The layer choices are made independently, so a
// prompt can mix e.g. the night palette with an urban skyline.
struct SceneSummary {
  core::u32 seed{0};
  TokenSet tokens;
  PaletteKind palette{PaletteKind::Default};
  CelestialKind celestial{CelestialKind::Sun};
  int particleCount{0};
  SceneMotif motif{SceneMotif::Terrain};
  AccentStyle accent{AccentStyle::Strokes};
};

struct SceneResult {
  Canvas canvas{kCanvasSize, kCanvasSize};
  SceneSummary summary;
  AtmosphereInfo atmosphere;
  MotifInfo motif;
  AccentInfo accents;
  core::u64 rngDraws{0};
};

// Seed, tokens and every layer choice, without drawing.
SceneSummary describeScene(std::string_view prompt);

// Full pipeline up to (not including) PNG encoding:
// background -> atmosphere -> scene motif -> accents -> blur, all layers
// sharing one RNG stream seeded from the prompt.
SceneResult renderScene(std::string_view prompt, const SceneOptions& opt = {});

// Stable 64-bit hash of the canvas size and pixels.
core::u64 canvasSignature(const Canvas& canvas);

} // namespace promptart::art
