#pragma once

#include "promptart/art/Color.h"
#include "promptart/core/Types.h"

#include <span>
#include <vector>

namespace promptart::art {

// Generated images are square 1024x1024.
inline constexpr int kCanvasSize = 1024;

struct PointF {
  float x{0.0f};
  float y{0.0f};
};

// RGB8 raster, row-major, 3 bytes per pixel, origin top-left.
//
// All drawing calls clip to the canvas. Translucent fills blend each covered
// pixel exactly once: out = (src*a + dst*(255-a)) / 255, rounded.
class Canvas {
public:
  Canvas(int w, int h, Rgb fill = {});

  int width() const { return w_; }
  int height() const { return h_; }

  const std::vector<core::u8>& pixels() const { return rgb_; }
  std::vector<core::u8>& pixels() { return rgb_; }

  Rgb pixel(int x, int y) const;
  void setPixel(int x, int y, Rgb c);
  void blendPixel(int x, int y, Rgb c, core::u8 alpha);

  void fill(Rgb c);
  void fillRow(int y, Rgb c);

  // Inclusive corners, any order.
  void fillRect(int x0, int y0, int x1, int y1, Rgb c, core::u8 alpha = 255);

  // Ellipse inscribed in the inclusive bounding box.
  void fillEllipse(int x0, int y0, int x1, int y1, Rgb c, core::u8 alpha = 255);

  // Even-odd scanline fill sampled at pixel centres.
  void fillPolygon(std::span<const PointF> points, Rgb c, core::u8 alpha = 255);

  // Segment of the given width with butt ends.
  void drawLine(float x0, float y0, float x1, float y1, float width, Rgb c, core::u8 alpha = 255);

private:
  bool inside(int x, int y) const { return x >= 0 && y >= 0 && x < w_ && y < h_; }
  void blendSpan(int y, int x0, int x1, Rgb c, core::u8 alpha);

  int w_{0};
  int h_{0};
  std::vector<core::u8> rgb_;
};

} // namespace promptart::art
