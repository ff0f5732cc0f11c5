#pragma once

#include "promptart/art/Canvas.h"
#include "promptart/art/Color.h"
#include "promptart/core/Types.h"

#include <array>
#include <string_view>

namespace promptart::art {

// Built-in 5x7 pixel font covering printable ASCII. Lowercase letters use the
// uppercase shapes; any other character (including each non-ASCII UTF-8
// sequence) is drawn as a box.
inline constexpr int kGlyphW = 5;
inline constexpr int kGlyphH = 7;

// Rows top to bottom; bit 4 is the leftmost column.
using GlyphRows = std::array<core::u8, kGlyphH>;

const GlyphRows& glyphFor(char c);

// Horizontal advance per character at the given scale (glyph + 1 column gap).
inline int glyphAdvance(int scale) { return (kGlyphW + 1) * scale; }

// Draws one line with its top-left corner at (x, y). Returns the x after the last glyph.
int drawText(Canvas& canvas, int x, int y, std::string_view text, Rgb color, int scale);

} // namespace promptart::art
