#include "promptart/art/PostProcess.h"

#include "promptart/core/Clamp.h"

#include <cmath>

namespace promptart::art {

std::vector<float> gaussianKernel(double sigma) {
  if (!(sigma > 0.0)) return {1.0f};

  const int radius = (int)std::ceil(3.0 * sigma);
  std::vector<float> k((std::size_t)(2 * radius + 1));

  double sum = 0.0;
  for (int i = -radius; i <= radius; ++i) {
    const double v = std::exp(-(double)(i * i) / (2.0 * sigma * sigma));
    k[(std::size_t)(i + radius)] = (float)v;
    sum += v;
  }
  for (float& v : k) v = (float)(v / sum);
  return k;
}

void gaussianBlur(Canvas& canvas, double sigma) {
  const std::vector<float> k = gaussianKernel(sigma);
  if (k.size() <= 1) return;

  const int radius = (int)(k.size() / 2);
  const int w = canvas.width();
  const int h = canvas.height();
  std::vector<core::u8>& px = canvas.pixels();
  std::vector<core::u8> tmp(px.size());

  auto at = [w](int x, int y) { return ((std::size_t)y * (std::size_t)w + (std::size_t)x) * 3; };

  // Horizontal pass: px -> tmp.
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      float acc[3] = {0.0f, 0.0f, 0.0f};
      for (int i = -radius; i <= radius; ++i) {
        const int sx = core::clamp(x + i, 0, w - 1);
        const std::size_t s = at(sx, y);
        const float wt = k[(std::size_t)(i + radius)];
        acc[0] += wt * px[s + 0];
        acc[1] += wt * px[s + 1];
        acc[2] += wt * px[s + 2];
      }
      const std::size_t d = at(x, y);
      for (int c = 0; c < 3; ++c) tmp[d + c] = core::clampCast<core::u8>(std::lround(acc[c]), 0L, 255L);
    }
  }

  // Vertical pass: tmp -> px.
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      float acc[3] = {0.0f, 0.0f, 0.0f};
      for (int i = -radius; i <= radius; ++i) {
        const int sy = core::clamp(y + i, 0, h - 1);
        const std::size_t s = at(x, sy);
        const float wt = k[(std::size_t)(i + radius)];
        acc[0] += wt * tmp[s + 0];
        acc[1] += wt * tmp[s + 1];
        acc[2] += wt * tmp[s + 2];
      }
      const std::size_t d = at(x, y);
      for (int c = 0; c < 3; ++c) px[d + c] = core::clampCast<core::u8>(std::lround(acc[c]), 0L, 255L);
    }
  }
}

} // namespace promptart::art
