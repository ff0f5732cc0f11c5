#pragma once

#include "promptart/art/Canvas.h"
#include "promptart/art/Color.h"

#include <string>
#include <string_view>
#include <vector>

namespace promptart::art {

// Text card used when no scene synthesis is wanted: the prompt, word-wrapped,
// in dark ink on a paper-coloured canvas.
struct PlaceholderOptions {
  int maxChars{500};     // prompt characters (code points) kept before wrapping
  int wrapWidth{52};     // characters per line
  int scale{3};          // font pixel scale
  int margin{40};        // top-left text origin
  int lineSpacing{6};    // extra pixels between lines
  Rgb paper{242, 240, 234};
  Rgb ink{24, 24, 24};
};

// Greedy whitespace word wrap. A word longer than `width` gets its own line.
// Width counts characters, not UTF-8 bytes. Words split on ASCII whitespace and
// on the Unicode space characters (NBSP, U+2000..U+200A, U+3000, ...).
std::vector<std::string> wrapText(std::string_view text, int width);

// Keeps the first maxChars code points; never splits a UTF-8 sequence.
std::string_view truncateUtf8(std::string_view text, std::size_t maxChars);

// Byte length of the whitespace character starting at text[i], 0 if none.
std::size_t whitespaceLength(std::string_view text, std::size_t i);

Canvas renderPlaceholder(std::string_view prompt, const PlaceholderOptions& opt = {});

} // namespace promptart::art
