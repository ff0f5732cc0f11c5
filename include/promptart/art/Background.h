#pragma once

#include "promptart/art/Canvas.h"
#include "promptart/art/Color.h"

namespace promptart::art {

// Colour of row `y` in a vertical gradient of `height` rows:
// t = y / (height - 1) (t = 0 for a single row), channel = round(top*(1-t) + bottom*t).
Rgb gradientRowColor(int y, int height, Rgb top, Rgb bottom);

// Fills every row of the canvas with its gradient colour. Uses no randomness.
void drawBackground(Canvas& canvas, Rgb top, Rgb bottom);

} // namespace promptart::art
