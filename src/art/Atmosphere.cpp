#include "promptart/art/Atmosphere.h"

#include <array>
#include <string_view>

namespace promptart::art {

namespace {

constexpr std::array<std::string_view, 3> kMoonWords{"night", "moon", "dark"};
constexpr std::array<std::string_view, 3> kStarfieldWords{"night", "moon", "stars"};

constexpr int kDenseParticles = 120;
constexpr int kSparseParticles = 60;

// Fraction of the canvas height the particle band covers, from the top.
constexpr double kParticleBand = 0.55;

void drawHalo(Canvas& canvas, int cx, int cy, int r, Rgb color) {
  // Two faint rings outside the disc; no RNG draws.
  const int r1 = r + r / 3;
  const int r2 = r + r / 6;
  canvas.fillEllipse(cx - r1, cy - r1, cx + r1, cy + r1, color, 28);
  canvas.fillEllipse(cx - r2, cy - r2, cx + r2, cy + r2, color, 40);
}

} // namespace

CelestialKind selectCelestialKind(const TokenSet& tokens) {
  return hasAnyToken(tokens, kMoonWords) ? CelestialKind::Moon : CelestialKind::Sun;
}

int particleCountFor(const TokenSet& tokens) {
  return hasAnyToken(tokens, kStarfieldWords) ? kDenseParticles : kSparseParticles;
}

AtmosphereInfo drawAtmosphere(Canvas& canvas, const Palette& pal, const TokenSet& tokens, core::SplitMix64& rng) {
  AtmosphereInfo info;
  info.celestial = selectCelestialKind(tokens);
  // Resolved up front: the count decides how many draws the later layers see.
  info.particleCount = particleCountFor(tokens);

  info.discX = rng.range(120, 860);
  if (info.celestial == CelestialKind::Moon) {
    info.discY = rng.range(90, 250);
    info.discRadius = rng.range(55, 90);
  } else {
    info.discY = rng.range(120, 340);
    info.discRadius = rng.range(80, 150);
  }

  const int cx = info.discX;
  const int cy = info.discY;
  const int r = info.discRadius;
  drawHalo(canvas, cx, cy, r, pal.accent);
  canvas.fillEllipse(cx - r, cy - r, cx + r, cy + r, pal.accent);

  const int maxX = canvas.width() - 1;
  const int maxY = (int)(canvas.height() * kParticleBand);
  for (int i = 0; i < info.particleCount; ++i) {
    const int x = rng.range(0, maxX);
    const int y = rng.range(0, maxY);
    const int pr = rng.range(1, 3);
    const int alpha = rng.range(100, 220);
    canvas.fillEllipse(x - pr, y - pr, x + pr, y + pr, pal.secondary, (core::u8)alpha);
  }

  return info;
}

const char* celestialKindName(CelestialKind kind) {
  switch (kind) {
    case CelestialKind::Sun: return "sun";
    case CelestialKind::Moon: return "moon";
  }
  return "?";
}

} // namespace promptart::art
