#include "promptart/art/SceneRenderer.h"

#include "promptart/art/Background.h"
#include "promptart/core/Log.h"
#include "promptart/core/Random.h"
#include "promptart/core/StableHash.h"

#include <sstream>

namespace promptart::art {

SceneSummary describeScene(std::string_view prompt) {
  SceneSummary s;
  s.seed = deriveSeed(prompt);
  s.tokens = extractTokens(prompt);
  s.palette = selectPaletteKind(s.tokens);
  s.celestial = selectCelestialKind(s.tokens);
  s.particleCount = particleCountFor(s.tokens);
  s.motif = selectSceneMotif(s.tokens);
  s.accent = selectAccentStyle(s.tokens);
  return s;
}

SceneResult renderScene(std::string_view prompt, const SceneOptions& opt) {
  SceneResult out;
  out.summary = describeScene(prompt);
  const SceneSummary& s = out.summary;

  {
    std::ostringstream oss;
    oss << "scene: seed=" << s.seed
        << " palette=" << paletteKindName(s.palette)
        << " celestial=" << celestialKindName(s.celestial)
        << " particles=" << s.particleCount
        << " motif=" << sceneMotifName(s.motif)
        << " accent=" << accentStyleName(s.accent)
        << " tokens=[" << joinTokens(s.tokens) << "]";
    core::log(core::LogLevel::Debug, oss.str());
  }

  const Palette& pal = palette(s.palette);
  core::SplitMix64 rng(s.seed);

  // Layer order fixes the draw sequence; keep it.
  drawBackground(out.canvas, pal.bgTop, pal.bgBottom);
  out.atmosphere = drawAtmosphere(out.canvas, pal, s.tokens, rng);
  out.motif = drawSceneMotif(out.canvas, s.motif, pal, rng);
  out.accents = drawAccents(out.canvas, s.accent, pal, rng);
  gaussianBlur(out.canvas, opt.blurSigma);

  out.rngDraws = rng.draws();
  return out;
}

core::u64 canvasSignature(const Canvas& canvas) {
  core::StableHash64 h;
  h.addInt(canvas.width());
  h.addInt(canvas.height());
  h.addBytes(canvas.pixels().data(), canvas.pixels().size());
  return h.value();
}

} // namespace promptart::art
