#pragma once

#include "promptart/art/PlaceholderRenderer.h"
#include "promptart/art/SceneRenderer.h"
#include "promptart/core/Types.h"

#include <ctime>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace promptart::art {

enum class GeneratorKind : core::u8 {
  Scene       = 0,
  Placeholder = 1
};

const char* generatorKindName(GeneratorKind kind);

// Accepts "scene" / "placeholder" (any case).
bool parseGeneratorKind(std::string_view text, GeneratorKind& out);

struct GeneratorConfig {
  GeneratorKind kind{GeneratorKind::Scene};
  std::string outputDir{"data/images"};
  double blurSigma{kDefaultBlurSigma};
  int placeholderMaxChars{500};
  int placeholderWrap{52};
};

// Seconds since the epoch. Replaceable so tests get fixed file names.
using ClockFn = std::time_t (*)();

// "saying_{id}_{YYYYMMDDHHMMSS}.png", UTC.
std::string outputFileName(core::i64 id, std::time_t when);

// Creates `dir` (and parents) unless it already exists as a directory.
bool prepareOutputDirectory(const std::string& dir, std::string* outError = nullptr);

// Draws the finished image for a prompt.
using RenderFn = std::function<Canvas(std::string_view prompt)>;

// Turns a prompt into a PNG on disk.
//
// The image itself comes from the render strategy chosen at construction
// (sceneGenerator(), placeholderGenerator(), or makeImageGenerator() from
// configuration); directory handling, encoding and naming are shared.
// generate() returns the written path, or an empty string with outError set.
// Nothing is written unless the whole image encoded successfully. The
// strategy and settings are immutable after construction.
class ImageGenerator {
public:
  ImageGenerator(std::string name, std::string outputDir, RenderFn render);

  ImageGenerator(ImageGenerator&&) = default;
  ImageGenerator& operator=(ImageGenerator&&) = default;
  ImageGenerator(const ImageGenerator&) = delete;
  ImageGenerator& operator=(const ImageGenerator&) = delete;

  const std::string& name() const { return name_; }

  // One-time output directory creation. generate() also creates it lazily.
  bool prepare(std::string* outError = nullptr) const;

  std::string generate(core::i64 id, std::string_view prompt, std::string* outError = nullptr) const;

  const std::string& outputDir() const { return outputDir_; }

  void setClock(ClockFn clock) { clock_ = clock ? clock : &systemTime; }

private:
  static std::time_t systemTime() { return std::time(nullptr); }

  std::string name_;
  std::string outputDir_;
  RenderFn render_;
  ClockFn clock_{&systemTime};
};

// Layered scene synthesis (renderScene).
ImageGenerator sceneGenerator(std::string outputDir, SceneOptions opt = {});

// Prompt text card (renderPlaceholder).
ImageGenerator placeholderGenerator(std::string outputDir, PlaceholderOptions opt = {});

std::unique_ptr<ImageGenerator> makeImageGenerator(const GeneratorConfig& config);

} // namespace promptart::art
