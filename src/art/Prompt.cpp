#include "promptart/art/Prompt.h"

#include "promptart/core/Hash.h"

namespace promptart::art {

static bool isAsciiAlnum(unsigned char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static char asciiLower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? (char)(c - 'A' + 'a') : (char)c;
}

core::u32 deriveSeed(std::string_view prompt) {
  // The first 8 hex digits are exactly the first four digest bytes, big-endian.
  const core::Sha256Digest d = core::sha256(prompt);
  return ((core::u32)d[0] << 24) | ((core::u32)d[1] << 16) | ((core::u32)d[2] << 8) | (core::u32)d[3];
}

TokenSet extractTokens(std::string_view prompt) {
  TokenSet tokens;
  std::string cur;
  for (unsigned char c : prompt) {
    if (isAsciiAlnum(c)) {
      cur.push_back(asciiLower(c));
      continue;
    }
    if (!cur.empty()) {
      tokens.insert(std::move(cur));
      cur.clear();
    }
  }
  if (!cur.empty()) tokens.insert(std::move(cur));
  return tokens;
}

bool hasAnyToken(const TokenSet& tokens, std::span<const std::string_view> group) {
  for (std::string_view word : group) {
    if (tokens.find(word) != tokens.end()) return true;
  }
  return false;
}

std::string joinTokens(const TokenSet& tokens, std::string_view separator) {
  std::string out;
  for (const std::string& t : tokens) {
    if (!out.empty()) out += separator;
    out += t;
  }
  return out;
}

} // namespace promptart::art
