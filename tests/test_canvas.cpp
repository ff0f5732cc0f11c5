#include "promptart/art/Background.h"
#include "promptart/art/Canvas.h"

#include "test_harness.h"

namespace {

int countPixels(const promptart::art::Canvas& c, promptart::art::Rgb color) {
  int n = 0;
  for (int y = 0; y < c.height(); ++y) {
    for (int x = 0; x < c.width(); ++x) {
      if (c.pixel(x, y) == color) ++n;
    }
  }
  return n;
}

} // namespace

int test_canvas() {
  int failures = 0;

  using namespace promptart::art;

  const Rgb black{0, 0, 0};
  const Rgb white{255, 255, 255};
  const Rgb red{255, 0, 0};

  {
    Canvas c(8, 4, Rgb{1, 2, 3});
    CHECK(c.width() == 8);
    CHECK(c.height() == 4);
    CHECK(c.pixels().size() == 8u * 4u * 3u);
    CHECK(c.pixel(7, 3) == (Rgb{1, 2, 3}));

    c.setPixel(2, 1, red);
    CHECK(c.pixel(2, 1) == red);

    // Out of bounds is ignored / reads as black.
    c.setPixel(-1, 0, red);
    c.setPixel(8, 0, red);
    CHECK(c.pixel(100, 100) == black);
    CHECK(countPixels(c, red) == 1);
  }

  // Alpha blending rounds to nearest.
  {
    Canvas c(2, 1, black);
    c.blendPixel(0, 0, white, 128);
    CHECK(c.pixel(0, 0) == (Rgb{128, 128, 128}));
    c.blendPixel(1, 0, white, 0);
    CHECK(c.pixel(1, 0) == black);
    c.blendPixel(1, 0, white, 255);
    CHECK(c.pixel(1, 0) == white);
  }

  // Inclusive rectangle, any corner order, clipped.
  {
    Canvas c(10, 10, black);
    c.fillRect(5, 6, 2, 3, red);
    CHECK(countPixels(c, red) == 4 * 4);
    CHECK(c.pixel(2, 3) == red);
    CHECK(c.pixel(5, 6) == red);

    c.fillRect(-100, -100, 100, 100, white);
    CHECK(countPixels(c, white) == 100);
  }

  // Translucent fills touch each pixel once.
  {
    Canvas c(6, 6, black);
    c.fillEllipse(0, 0, 5, 5, white, 128);
    int mid = 0;
    for (int y = 0; y < 6; ++y) {
      for (int x = 0; x < 6; ++x) {
        const Rgb p = c.pixel(x, y);
        CHECK(p == black || p == (Rgb{128, 128, 128}));
        if (p != black) ++mid;
      }
    }
    CHECK(mid > 0);
  }

  // Ellipse stays inside its bounding box and covers the centre.
  {
    Canvas c(32, 32, black);
    c.fillEllipse(5, 5, 15, 15, red);
    CHECK(c.pixel(10, 10) == red);
    CHECK(c.pixel(10, 5) == red);
    CHECK(c.pixel(5, 5) == black);
    CHECK(c.pixel(4, 10) == black);
    CHECK(c.pixel(16, 10) == black);

    Canvas one(3, 3, black);
    one.fillEllipse(1, 1, 1, 1, red);
    CHECK(countPixels(one, red) == 1);
  }

  // Polygon: axis-aligned square sampled at pixel centres.
  {
    Canvas c(10, 10, black);
    const PointF sq[4] = {{2, 2}, {6, 2}, {6, 6}, {2, 6}};
    c.fillPolygon(sq, red);
    CHECK(countPixels(c, red) == 16);
    CHECK(c.pixel(2, 2) == red);
    CHECK(c.pixel(5, 5) == red);
    CHECK(c.pixel(6, 6) == black);

    const PointF degenerate[2] = {{0, 0}, {9, 9}};
    c.fillPolygon(degenerate, white);
    CHECK(countPixels(c, white) == 0);
  }

  // Thick line covers its midpoint, zero length draws nothing.
  {
    Canvas c(40, 40, black);
    c.drawLine(5.0f, 30.0f, 35.0f, 10.0f, 4.0f, red);
    CHECK(c.pixel(20, 20) == red);
    CHECK(c.pixel(2, 2) == black);

    Canvas d(10, 10, black);
    d.drawLine(5.0f, 5.0f, 5.0f, 5.0f, 3.0f, red);
    CHECK(countPixels(d, red) == 0);
  }

  // Gradient background: exact end rows, monotone in between.
  {
    const Rgb top{12, 18, 44};
    const Rgb bottom{46, 38, 92};
    Canvas c(kCanvasSize, kCanvasSize);
    drawBackground(c, top, bottom);
    CHECK(c.pixel(0, 0) == top);
    CHECK(c.pixel(kCanvasSize - 1, 0) == top);
    CHECK(c.pixel(0, kCanvasSize - 1) == bottom);
    CHECK(c.pixel(kCanvasSize - 1, kCanvasSize - 1) == bottom);

    int prevB = -1;
    for (int y = 0; y < kCanvasSize; ++y) {
      const Rgb p = c.pixel(0, y);
      CHECK(p == c.pixel(kCanvasSize / 2, y));
      CHECK((int)p.b >= prevB);
      prevB = p.b;
    }

    CHECK(gradientRowColor(0, 1, top, bottom) == top);
    CHECK(gradientRowColor(1, 3, Rgb{0, 0, 0}, Rgb{200, 100, 51}) == (Rgb{100, 50, 26}));
  }

  return failures;
}
