#include "promptart/art/PlaceholderRenderer.h"

#include "promptart/art/BitmapFont.h"

namespace promptart::art {

static std::size_t utf8Length(std::string_view s) {
  std::size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0u) != 0x80u) ++n;
  }
  return n;
}

std::string_view truncateUtf8(std::string_view text, std::size_t maxChars) {
  std::size_t chars = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if ((((unsigned char)text[i]) & 0xC0u) == 0x80u) continue;
    if (chars == maxChars) return text.substr(0, i);
    ++chars;
  }
  return text;
}

std::size_t whitespaceLength(std::string_view text, std::size_t i) {
  const auto at = [&](std::size_t k) -> unsigned {
    return i + k < text.size() ? (unsigned char)text[i + k] : 0u;
  };
  const unsigned c0 = at(0);
  if (c0 == ' ' || (c0 >= 0x09 && c0 <= 0x0D) || (c0 >= 0x1C && c0 <= 0x1F)) return 1;
  if (c0 == 0xC2 && (at(1) == 0x85 || at(1) == 0xA0)) return 2;                 // NEL, NBSP
  if (c0 == 0xE1 && at(1) == 0x9A && at(2) == 0x80) return 3;                   // U+1680
  if (c0 == 0xE2 && at(1) == 0x80) {
    const unsigned c2 = at(2);
    if ((c2 >= 0x80 && c2 <= 0x8A) || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF) return 3; // U+2000..200A, 2028, 2029, 202F
  }
  if (c0 == 0xE2 && at(1) == 0x81 && at(2) == 0x9F) return 3;                   // U+205F
  if (c0 == 0xE3 && at(1) == 0x80 && at(2) == 0x80) return 3;                   // U+3000
  return 0;
}

std::vector<std::string> wrapText(std::string_view text, int width) {
  std::vector<std::string> lines;
  std::string current;

  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size()) {
      const std::size_t n = whitespaceLength(text, i);
      if (n == 0) break;
      i += n;
    }
    if (i >= text.size()) break;
    const std::size_t start = i;
    while (i < text.size() && whitespaceLength(text, i) == 0) ++i;
    const std::string_view word = text.substr(start, i - start);

    if (current.empty()) {
      current.assign(word);
      continue;
    }
    if (utf8Length(current) + 1 + utf8Length(word) <= (std::size_t)width) {
      current += ' ';
      current += word;
    } else {
      lines.push_back(std::move(current));
      current.assign(word);
    }
  }

  if (!current.empty()) lines.push_back(std::move(current));
  return lines;
}

Canvas renderPlaceholder(std::string_view prompt, const PlaceholderOptions& opt) {
  Canvas canvas(kCanvasSize, kCanvasSize, opt.paper);

  const std::size_t maxChars = opt.maxChars > 0 ? (std::size_t)opt.maxChars : 0;
  const std::vector<std::string> lines = wrapText(truncateUtf8(prompt, maxChars), opt.wrapWidth);

  const int lineHeight = kGlyphH * opt.scale + opt.lineSpacing;
  int y = opt.margin;
  for (const std::string& line : lines) {
    if (y >= canvas.height()) break;
    drawText(canvas, opt.margin, y, line, opt.ink, opt.scale);
    y += lineHeight;
  }
  return canvas;
}

} // namespace promptart::art
