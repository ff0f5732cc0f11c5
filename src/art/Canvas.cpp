#include "promptart/art/Canvas.h"

#include "promptart/core/Assert.h"

#include <algorithm>
#include <cmath>

namespace promptart::art {

static inline core::u8 blendChannel(core::u8 dst, core::u8 src, core::u8 alpha) {
  const int a = alpha;
  return (core::u8)((src * a + dst * (255 - a) + 127) / 255);
}

Canvas::Canvas(int w, int h, Rgb fill) : w_(w), h_(h) {
  PROMPTART_ASSERT_MSG(w > 0 && h > 0, "Canvas dimensions must be positive");
  rgb_.resize((std::size_t)w * (std::size_t)h * 3);
  this->fill(fill);
}

Rgb Canvas::pixel(int x, int y) const {
  if (!inside(x, y)) return {};
  const std::size_t i = ((std::size_t)y * (std::size_t)w_ + (std::size_t)x) * 3;
  return {rgb_[i + 0], rgb_[i + 1], rgb_[i + 2]};
}

void Canvas::setPixel(int x, int y, Rgb c) {
  if (!inside(x, y)) return;
  const std::size_t i = ((std::size_t)y * (std::size_t)w_ + (std::size_t)x) * 3;
  rgb_[i + 0] = c.r;
  rgb_[i + 1] = c.g;
  rgb_[i + 2] = c.b;
}

void Canvas::blendPixel(int x, int y, Rgb c, core::u8 alpha) {
  if (!inside(x, y) || alpha == 0) return;
  if (alpha == 255) {
    setPixel(x, y, c);
    return;
  }
  const std::size_t i = ((std::size_t)y * (std::size_t)w_ + (std::size_t)x) * 3;
  rgb_[i + 0] = blendChannel(rgb_[i + 0], c.r, alpha);
  rgb_[i + 1] = blendChannel(rgb_[i + 1], c.g, alpha);
  rgb_[i + 2] = blendChannel(rgb_[i + 2], c.b, alpha);
}

void Canvas::fill(Rgb c) {
  for (int y = 0; y < h_; ++y) fillRow(y, c);
}

void Canvas::fillRow(int y, Rgb c) {
  if (y < 0 || y >= h_) return;
  core::u8* row = rgb_.data() + (std::size_t)y * (std::size_t)w_ * 3;
  for (int x = 0; x < w_; ++x) {
    row[x * 3 + 0] = c.r;
    row[x * 3 + 1] = c.g;
    row[x * 3 + 2] = c.b;
  }
}

void Canvas::blendSpan(int y, int x0, int x1, Rgb c, core::u8 alpha) {
  if (y < 0 || y >= h_) return;
  x0 = std::max(x0, 0);
  x1 = std::min(x1, w_ - 1);
  for (int x = x0; x <= x1; ++x) blendPixel(x, y, c, alpha);
}

void Canvas::fillRect(int x0, int y0, int x1, int y1, Rgb c, core::u8 alpha) {
  if (x1 < x0) std::swap(x0, x1);
  if (y1 < y0) std::swap(y0, y1);
  y0 = std::max(y0, 0);
  y1 = std::min(y1, h_ - 1);
  for (int y = y0; y <= y1; ++y) blendSpan(y, x0, x1, c, alpha);
}

void Canvas::fillEllipse(int x0, int y0, int x1, int y1, Rgb c, core::u8 alpha) {
  if (x1 < x0) std::swap(x0, x1);
  if (y1 < y0) std::swap(y0, y1);

  const double cx = 0.5 * (x0 + x1);
  const double cy = 0.5 * (y0 + y1);
  // Half a pixel of slack so the box edges are covered.
  const double rx = 0.5 * (x1 - x0) + 0.5;
  const double ry = 0.5 * (y1 - y0) + 0.5;

  const int yStart = std::max(y0, 0);
  const int yEnd = std::min(y1, h_ - 1);
  for (int y = yStart; y <= yEnd; ++y) {
    const double dy = (y - cy) / ry;
    const double k = 1.0 - dy * dy;
    if (k < 0.0) continue;
    const double half = rx * std::sqrt(k);
    const int xa = (int)std::ceil(cx - half);
    const int xb = (int)std::floor(cx + half);
    blendSpan(y, std::max(xa, x0), std::min(xb, x1), c, alpha);
  }
}

void Canvas::fillPolygon(std::span<const PointF> points, Rgb c, core::u8 alpha) {
  if (points.size() < 3) return;

  float minY = points[0].y;
  float maxY = points[0].y;
  for (const PointF& p : points) {
    minY = std::min(minY, p.y);
    maxY = std::max(maxY, p.y);
  }

  const int yStart = std::max(0, (int)std::floor(minY));
  const int yEnd = std::min(h_ - 1, (int)std::ceil(maxY));

  std::vector<float> xs;
  xs.reserve(points.size());

  for (int y = yStart; y <= yEnd; ++y) {
    const float sy = (float)y + 0.5f;
    xs.clear();

    for (std::size_t i = 0; i < points.size(); ++i) {
      const PointF& a = points[i];
      const PointF& b = points[(i + 1) % points.size()];
      // Half-open rule so shared vertices are counted once.
      if ((a.y <= sy && b.y > sy) || (b.y <= sy && a.y > sy)) {
        const float t = (sy - a.y) / (b.y - a.y);
        xs.push_back(a.x + t * (b.x - a.x));
      }
    }

    std::sort(xs.begin(), xs.end());
    for (std::size_t i = 0; i + 1 < xs.size(); i += 2) {
      const int xa = (int)std::ceil(xs[i] - 0.5f);
      const int xb = (int)std::floor(xs[i + 1] - 0.5f);
      if (xb >= xa) blendSpan(y, xa, xb, c, alpha);
    }
  }
}

void Canvas::drawLine(float x0, float y0, float x1, float y1, float width, Rgb c, core::u8 alpha) {
  const float dx = x1 - x0;
  const float dy = y1 - y0;
  const float len = std::sqrt(dx * dx + dy * dy);
  if (len <= 0.0f || width <= 0.0f) return;

  const float nx = -dy / len * (0.5f * width);
  const float ny = dx / len * (0.5f * width);

  const PointF quad[4] = {
      {x0 + nx, y0 + ny},
      {x1 + nx, y1 + ny},
      {x1 - nx, y1 - ny},
      {x0 - nx, y0 - ny},
  };
  fillPolygon(quad, c, alpha);
}

} // namespace promptart::art
