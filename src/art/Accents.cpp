#include "promptart/art/Accents.h"

#include <array>
#include <string_view>

namespace promptart::art {

namespace {

constexpr std::array<std::string_view, 6> kTreeWords{"forest", "nature", "botanical", "tree", "leaf", "green"};
constexpr std::array<std::string_view, 3> kGeometricWords{"abstract", "geometric", "minimalist"};

constexpr int kTreeCount = 18;
constexpr int kShapeCount = 36;
constexpr int kStrokeCount = 30;

constexpr int kTrunkHalfWidth = 4;

AccentInfo drawTrees(Canvas& canvas, const Palette& pal, core::SplitMix64& rng) {
  AccentInfo info;
  info.style = AccentStyle::Trees;

  const int w = canvas.width();
  const int base = canvas.height() - 1;
  const Rgb trunk = darken(pal.ground, 0.45);

  for (int i = 0; i < kTreeCount; ++i) {
    const int x = rng.range(20, w - 20);
    const int trunkH = rng.range(40, 90);
    const int crownR = rng.range(22, 48);

    const int top = base - trunkH;
    canvas.fillRect(x - kTrunkHalfWidth, top, x + kTrunkHalfWidth - 1, base, trunk);

    // Crown is taller than wide and sits on the trunk top.
    const int crownRy = crownR + crownR / 3;
    canvas.fillEllipse(x - crownR, top - crownRy, x + crownR, top + crownRy / 2, pal.secondary, 235);
    ++info.count;
  }
  return info;
}

AccentInfo drawGeometric(Canvas& canvas, const Palette& pal, core::SplitMix64& rng) {
  AccentInfo info;
  info.style = AccentStyle::Geometric;

  const int w = canvas.width();
  const int h = canvas.height();

  for (int i = 0; i < kShapeCount; ++i) {
    const int x = rng.range(0, w - 1);
    const int y = rng.range(0, h - 1);
    const int sw = rng.range(40, 180);
    const int sh = rng.range(40, 180);
    const int alpha = rng.range(60, 150);
    const bool ellipse = rng.chance(0.5);

    if (ellipse) {
      canvas.fillEllipse(x, y, x + sw - 1, y + sh - 1, pal.accent, (core::u8)alpha);
      ++info.ellipses;
    } else {
      canvas.fillRect(x, y, x + sw - 1, y + sh - 1, pal.accent, (core::u8)alpha);
    }
    ++info.count;
  }
  return info;
}

// Segments rise to the right from their start point.
AccentInfo drawStrokes(Canvas& canvas, const Palette& pal, core::SplitMix64& rng) {
  AccentInfo info;
  info.style = AccentStyle::Strokes;

  const int w = canvas.width();
  const int h = canvas.height();
  const int minY = (int)(h * 0.45);

  for (int i = 0; i < kStrokeCount; ++i) {
    const int x = rng.range(0, w - 1);
    const int y = rng.range(minY, h - 1);
    const int len = rng.range(30, 120);
    const double slope = rng.range(0.3, 1.2);
    const int width = rng.range(2, 5);
    const int alpha = rng.range(80, 180);

    const float x1 = (float)x + (float)len;
    const float y1 = (float)y - (float)(len * slope);
    canvas.drawLine((float)x, (float)y, x1, y1, (float)width, pal.accent, (core::u8)alpha);
    ++info.count;
  }
  return info;
}

} // namespace

AccentStyle selectAccentStyle(const TokenSet& tokens) {
  if (hasAnyToken(tokens, kTreeWords)) return AccentStyle::Trees;
  if (hasAnyToken(tokens, kGeometricWords)) return AccentStyle::Geometric;
  return AccentStyle::Strokes;
}

AccentInfo drawAccents(Canvas& canvas, AccentStyle style, const Palette& pal, core::SplitMix64& rng) {
  switch (style) {
    case AccentStyle::Trees: return drawTrees(canvas, pal, rng);
    case AccentStyle::Geometric: return drawGeometric(canvas, pal, rng);
    case AccentStyle::Strokes: break;
  }
  return drawStrokes(canvas, pal, rng);
}

const char* accentStyleName(AccentStyle style) {
  switch (style) {
    case AccentStyle::Trees: return "trees";
    case AccentStyle::Geometric: return "geometric";
    case AccentStyle::Strokes: return "strokes";
  }
  return "?";
}

} // namespace promptart::art
