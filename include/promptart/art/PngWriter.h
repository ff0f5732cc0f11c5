#pragma once

#include "promptart/art/Canvas.h"
#include "promptart/core/Types.h"

#include <string>
#include <vector>

namespace promptart::art {

// Lossless RGB8 PNG of the canvas, in memory.
bool encodePng(const Canvas& canvas, std::vector<core::u8>& outBytes, std::string* outError = nullptr);

// Writes `bytes` to a temporary file unique to this call and renames it over
// `path`, so concurrent writers of one path each leave a complete file. On failure the
// temporary file is removed and `path` is left untouched.
bool writeFileAtomic(const std::string& path, const std::vector<core::u8>& bytes, std::string* outError = nullptr);

} // namespace promptart::art
