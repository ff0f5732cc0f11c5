#include "promptart/art/GeneratorConfig.h"

#include <utility>

namespace promptart::art {

void installArtCVars(core::CVarRegistry& registry) {
  using namespace promptart::core;

  installDefaultCVars(registry);

  const GeneratorConfig def;
  registry.defineString("art.generator", generatorKindName(def.kind), CVar_Archive,
                        "Image generator: scene|placeholder");
  registry.defineString("art.output_dir", def.outputDir, CVar_Archive,
                        "Directory generated images are written to");
  registry.defineFloat("art.blur_sigma", def.blurSigma, CVar_Archive,
                       "Gaussian blur sigma applied to scenes (0 = off)");
  registry.defineInt("art.placeholder.max_chars", def.placeholderMaxChars, CVar_Archive,
                     "Prompt characters shown on the placeholder card");
  registry.defineInt("art.placeholder.wrap", def.placeholderWrap, CVar_Archive,
                     "Placeholder line width in characters");
}

bool loadGeneratorConfig(const core::CVarRegistry& registry, GeneratorConfig& out,
                         std::string* outError) {
  GeneratorConfig cfg;

  const std::string kindName = registry.getString("art.generator", generatorKindName(cfg.kind));
  if (!parseGeneratorKind(kindName, cfg.kind)) {
    if (outError) *outError = "art.generator: unknown generator '" + kindName + "' (expected scene|placeholder)";
    return false;
  }

  cfg.outputDir = registry.getString("art.output_dir", cfg.outputDir);
  if (cfg.outputDir.empty()) {
    if (outError) *outError = "art.output_dir: must not be empty";
    return false;
  }

  cfg.blurSigma = registry.getFloat("art.blur_sigma", cfg.blurSigma);
  if (!(cfg.blurSigma >= 0.0) || cfg.blurSigma > 64.0) {
    if (outError) *outError = "art.blur_sigma: expected a value in [0, 64]";
    return false;
  }

  const auto maxChars = registry.getInt("art.placeholder.max_chars", cfg.placeholderMaxChars);
  const auto wrap = registry.getInt("art.placeholder.wrap", cfg.placeholderWrap);
  if (maxChars < 0 || maxChars > 100000) {
    if (outError) *outError = "art.placeholder.max_chars: expected a value in [0, 100000]";
    return false;
  }
  if (wrap < 1 || wrap > 1000) {
    if (outError) *outError = "art.placeholder.wrap: expected a value in [1, 1000]";
    return false;
  }
  cfg.placeholderMaxChars = (int)maxChars;
  cfg.placeholderWrap = (int)wrap;

  out = std::move(cfg);
  return true;
}

} // namespace promptart::art
