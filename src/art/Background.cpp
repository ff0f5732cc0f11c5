#include "promptart/art/Background.h"

namespace promptart::art {

Rgb gradientRowColor(int y, int height, Rgb top, Rgb bottom) {
  const double t = (height <= 1) ? 0.0 : (double)y / (double)(height - 1);
  return lerp(top, bottom, t);
}

void drawBackground(Canvas& canvas, Rgb top, Rgb bottom) {
  const int h = canvas.height();
  for (int y = 0; y < h; ++y) canvas.fillRow(y, gradientRowColor(y, h, top, bottom));
}

} // namespace promptart::art
