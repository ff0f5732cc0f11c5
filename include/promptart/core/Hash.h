#pragma once

#include "promptart/core/Types.h"

#include <array>
#include <string>
#include <string_view>

namespace promptart::core {

using Sha256Digest = std::array<u8, 32>;

// SHA-256 (FIPS 180-4) over raw bytes.
Sha256Digest sha256(const void* data, std::size_t size);
Sha256Digest sha256(std::string_view text);

// Lowercase hex, two characters per byte.
std::string toHex(const u8* bytes, std::size_t size);

// 64 lowercase hex characters.
std::string sha256Hex(std::string_view text);

} // namespace promptart::core
