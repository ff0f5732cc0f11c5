#pragma once

#include "promptart/art/ImageGenerator.h"
#include "promptart/core/CVar.h"

#include <string>

namespace promptart::art {

// Defines the art.* variables (and log.level) on `registry`:
//   art.generator               scene|placeholder
//   art.output_dir              directory for generated PNGs
//   art.blur_sigma              final blur strength, 0 disables
//   art.placeholder.max_chars   prompt characters kept on the text card
//   art.placeholder.wrap        text card line width in characters
// Safe to call repeatedly.
void installArtCVars(core::CVarRegistry& registry);

// Reads the art.* variables. Unknown generator names and out-of-range numbers
// are rejected; `out` is only written on success.
bool loadGeneratorConfig(const core::CVarRegistry& registry, GeneratorConfig& out,
                         std::string* outError = nullptr);

} // namespace promptart::art
