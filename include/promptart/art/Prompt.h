#pragma once

#include "promptart/core/Types.h"

#include <functional>
#include <set>
#include <span>
#include <string>
#include <string_view>

namespace promptart::art {

// Lowercase alphanumeric words of a prompt. Ordered so logs and signatures are stable.
using TokenSet = std::set<std::string, std::less<>>;

// First 8 hex digits of SHA-256(prompt bytes), read as a base-16 integer.
// Same prompt -> same seed, on every platform.
core::u32 deriveSeed(std::string_view prompt);

// Maximal runs of [A-Za-z0-9], lowercased. Every other byte (punctuation,
// whitespace, any UTF-8 multibyte sequence) separates words and is dropped.
TokenSet extractTokens(std::string_view prompt);

// True if any keyword of the group is in the set.
bool hasAnyToken(const TokenSet& tokens, std::span<const std::string_view> group);

// "a, b, c" (sorted).
std::string joinTokens(const TokenSet& tokens, std::string_view separator = ", ");

} // namespace promptart::art
