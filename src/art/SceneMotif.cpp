#include "promptart/art/SceneMotif.h"

#include <algorithm>
#include <array>
#include <string_view>
#include <vector>

namespace promptart::art {

namespace {

constexpr std::array<std::string_view, 5> kUrbanWords{"city", "urban", "building", "street", "neon"};
constexpr std::array<std::string_view, 5> kMarineWords{"ocean", "sea", "water", "beach", "coast"};

constexpr double kWindowLitChance = 0.35;
constexpr int kWindowW = 10;
constexpr int kWindowH = 14;
constexpr int kWindowStepX = 22;
constexpr int kWindowStepY = 30;

constexpr int kSeaBands = 7;
constexpr int kSeaVertexSpacing = 64;
constexpr int kSeaJitter = 14;

constexpr int kMountainLayers = 4;

// Buildings stand on the bottom edge, left to right, until the width is covered.
// Per building: width, height, one chance() per window cell, gap.
MotifInfo drawSkyline(Canvas& canvas, const Palette& pal, core::SplitMix64& rng) {
  MotifInfo info;
  info.motif = SceneMotif::Urban;

  const int w = canvas.width();
  const int h = canvas.height();

  int x = 0;
  while (x < w) {
    const int bw = rng.range(60, 140);
    const int bh = rng.range(180, 460);
    const int top = h - bh;

    const int shade = (info.elements % 3) * 10;
    canvas.fillRect(x, top, x + bw - 1, h - 1, offset(pal.ground, shade, shade, shade));

    for (int wy = top + 16; wy + kWindowH <= h - 20; wy += kWindowStepY) {
      for (int wx = x + 10; wx + kWindowW <= x + bw - 10; wx += kWindowStepX) {
        if (!rng.chance(kWindowLitChance)) continue;
        canvas.fillRect(wx, wy, wx + kWindowW - 1, wy + kWindowH - 1, pal.accent, 220);
        ++info.litWindows;
      }
    }

    const int gap = rng.range(2, 10);
    x += bw + gap;
    ++info.elements;
  }
  return info;
}

// Bands start at 58% of the height and step down by 6%; each is a jittered
// polyline closed along the bottom edge.
MotifInfo drawSeaBands(Canvas& canvas, const Palette& pal, core::SplitMix64& rng) {
  MotifInfo info;
  info.motif = SceneMotif::Marine;

  const int w = canvas.width();
  const int h = canvas.height();
  const int firstY = (int)(h * 0.58);
  const int spacing = (int)(h * 0.06);

  std::vector<PointF> poly;
  for (int i = 0; i < kSeaBands; ++i) {
    const int baseY = firstY + i * spacing;

    poly.clear();
    for (int x = 0;; x += kSeaVertexSpacing) {
      const int vx = std::min(x, w);
      const int vy = baseY + rng.range(-kSeaJitter, kSeaJitter);
      poly.push_back({(float)vx, (float)vy});
      if (vx >= w) break;
    }
    poly.push_back({(float)w, (float)h});
    poly.push_back({0.0f, (float)h});

    canvas.fillPolygon(poly, offset(pal.ground, 0, 8 * i, 12 * i), 235);
    ++info.elements;
  }
  return info;
}

// Per layer: peak x, height (grows with the layer index), half-width.
// Each layer is the ground colour lightened a further 10%.
MotifInfo drawMountains(Canvas& canvas, const Palette& pal, core::SplitMix64& rng) {
  MotifInfo info;
  info.motif = SceneMotif::Terrain;

  const int w = canvas.width();
  const int h = canvas.height();

  for (int i = 0; i < kMountainLayers; ++i) {
    const int peakX = rng.range(0, w - 1);
    const int peakH = rng.range(220, 320) + 60 * i;
    const int halfW = rng.range(300, 520);

    const PointF tri[3] = {
        {(float)(peakX - halfW), (float)h},
        {(float)peakX, (float)(h - peakH)},
        {(float)(peakX + halfW), (float)h},
    };
    canvas.fillPolygon(tri, lighten(pal.ground, 0.10 * i));
    ++info.elements;
  }
  return info;
}

} // namespace

SceneMotif selectSceneMotif(const TokenSet& tokens) {
  if (hasAnyToken(tokens, kUrbanWords)) return SceneMotif::Urban;
  if (hasAnyToken(tokens, kMarineWords)) return SceneMotif::Marine;
  return SceneMotif::Terrain;
}

MotifInfo drawSceneMotif(Canvas& canvas, SceneMotif motif, const Palette& pal, core::SplitMix64& rng) {
  switch (motif) {
    case SceneMotif::Urban: return drawSkyline(canvas, pal, rng);
    case SceneMotif::Marine: return drawSeaBands(canvas, pal, rng);
    case SceneMotif::Terrain: break;
  }
  return drawMountains(canvas, pal, rng);
}

const char* sceneMotifName(SceneMotif motif) {
  switch (motif) {
    case SceneMotif::Urban: return "urban";
    case SceneMotif::Marine: return "marine";
    case SceneMotif::Terrain: return "terrain";
  }
  return "?";
}

} // namespace promptart::art
