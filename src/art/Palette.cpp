#include "promptart/art/Palette.h"

#include <array>
#include <string_view>

namespace promptart::art {

namespace {

constexpr std::array<std::string_view, 5> kNightWords{"night", "moon", "dark", "stars", "galaxy"};
constexpr std::array<std::string_view, 5> kOceanWords{"ocean", "sea", "water", "beach", "coast"};
constexpr std::array<std::string_view, 6> kForestWords{"forest", "nature", "botanical", "tree", "leaf", "green"};
constexpr std::array<std::string_view, 5> kUrbanWords{"city", "urban", "street", "building", "neon"};

// Indexed by PaletteKind.
const std::array<Palette, kPaletteCount> kPalettes{{
    {PaletteKind::Night,
     {12, 18, 44}, {46, 38, 92}, {70, 80, 140}, {232, 234, 255}, {250, 244, 210}, {22, 26, 50}},
    {PaletteKind::Ocean,
     {126, 196, 236}, {22, 92, 152}, {40, 120, 180}, {248, 250, 255}, {255, 214, 140}, {16, 82, 128}},
    {PaletteKind::Forest,
     {176, 218, 184}, {64, 112, 72}, {70, 130, 80}, {126, 184, 112}, {250, 222, 150}, {34, 68, 40}},
    {PaletteKind::Urban,
     {58, 48, 92}, {232, 122, 112}, {92, 80, 122}, {255, 202, 232}, {255, 222, 120}, {34, 30, 50}},
    {PaletteKind::Default,
     {255, 204, 152}, {240, 122, 92}, {202, 112, 90}, {255, 242, 222}, {255, 250, 200}, {112, 62, 60}},
}};

} // namespace

const Palette& palette(PaletteKind kind) {
  const auto idx = static_cast<std::size_t>(kind);
  return kPalettes[idx < kPalettes.size() ? idx : static_cast<std::size_t>(PaletteKind::Default)];
}

PaletteKind selectPaletteKind(const TokenSet& tokens) {
  if (hasAnyToken(tokens, kNightWords)) return PaletteKind::Night;
  if (hasAnyToken(tokens, kOceanWords)) return PaletteKind::Ocean;
  if (hasAnyToken(tokens, kForestWords)) return PaletteKind::Forest;
  if (hasAnyToken(tokens, kUrbanWords)) return PaletteKind::Urban;
  return PaletteKind::Default;
}

const Palette& selectPalette(const TokenSet& tokens) { return palette(selectPaletteKind(tokens)); }

const char* paletteKindName(PaletteKind kind) {
  switch (kind) {
    case PaletteKind::Night: return "night";
    case PaletteKind::Ocean: return "ocean";
    case PaletteKind::Forest: return "forest";
    case PaletteKind::Urban: return "urban";
    case PaletteKind::Default: return "default";
  }
  return "?";
}

} // namespace promptart::art
