#include "promptart/art/ImageGenerator.h"

#include "promptart/art/PngWriter.h"
#include "promptart/core/Log.h"

#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace promptart::art {

const char* generatorKindName(GeneratorKind kind) {
  switch (kind) {
    case GeneratorKind::Scene: return "scene";
    case GeneratorKind::Placeholder: return "placeholder";
  }
  return "scene";
}

bool parseGeneratorKind(std::string_view text, GeneratorKind& out) {
  std::string s;
  s.reserve(text.size());
  for (unsigned char ch : text) s.push_back((char)std::tolower(ch));

  if (s == "scene") {
    out = GeneratorKind::Scene;
    return true;
  }
  if (s == "placeholder") {
    out = GeneratorKind::Placeholder;
    return true;
  }
  return false;
}

std::string outputFileName(core::i64 id, std::time_t when) {
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &when);
#else
  gmtime_r(&when, &tm);
#endif

  std::ostringstream oss;
  oss << "saying_" << id << '_' << std::put_time(&tm, "%Y%m%d%H%M%S") << ".png";
  return oss.str();
}

bool prepareOutputDirectory(const std::string& dir, std::string* outError) {
  namespace fs = std::filesystem;

  if (dir.empty()) {
    if (outError) *outError = "Output directory is empty";
    return false;
  }

  std::error_code ec;
  if (fs::is_directory(dir, ec)) return true;

  if (fs::exists(dir, ec)) {
    if (outError) *outError = "Output path exists and is not a directory: " + dir;
    return false;
  }

  fs::create_directories(dir, ec);
  if (ec || !fs::is_directory(dir, ec)) {
    if (outError) *outError = "Failed to create directory: " + dir;
    return false;
  }

  PROMPTART_LOG_DEBUG("created output directory " + dir);
  return true;
}

ImageGenerator::ImageGenerator(std::string name, std::string outputDir, RenderFn render)
  : name_(std::move(name)), outputDir_(std::move(outputDir)), render_(std::move(render)) {}

bool ImageGenerator::prepare(std::string* outError) const {
  std::string err;
  if (!prepareOutputDirectory(outputDir_, &err)) {
    PROMPTART_LOG_ERROR(err);
    if (outError) *outError = err;
    return false;
  }
  return true;
}

std::string ImageGenerator::generate(core::i64 id, std::string_view prompt, std::string* outError) const {
  auto fail = [&](const std::string& msg) -> std::string {
    PROMPTART_LOG_ERROR(name_ + " generator: " + msg);
    if (outError) *outError = msg;
    return {};
  };

  std::string err;
  if (!prepareOutputDirectory(outputDir_, &err)) return fail(err);

  if (!render_) return fail("no render strategy");
  const Canvas canvas = render_(prompt);

  std::vector<core::u8> png;
  if (!encodePng(canvas, png, &err)) return fail(err);

  const std::filesystem::path path = std::filesystem::path(outputDir_) / outputFileName(id, clock_());
  if (!writeFileAtomic(path.string(), png, &err)) return fail(err);

  PROMPTART_LOG_INFO("wrote " + path.string() + " (" + std::to_string(png.size()) + " bytes)");
  return path.string();
}

ImageGenerator sceneGenerator(std::string outputDir, SceneOptions opt) {
  return ImageGenerator("scene", std::move(outputDir),
                        [opt](std::string_view prompt) { return renderScene(prompt, opt).canvas; });
}

ImageGenerator placeholderGenerator(std::string outputDir, PlaceholderOptions opt) {
  return ImageGenerator("placeholder", std::move(outputDir),
                        [opt](std::string_view prompt) { return renderPlaceholder(prompt, opt); });
}

std::unique_ptr<ImageGenerator> makeImageGenerator(const GeneratorConfig& config) {
  switch (config.kind) {
    case GeneratorKind::Placeholder: {
      PlaceholderOptions opt;
      opt.maxChars = config.placeholderMaxChars;
      opt.wrapWidth = config.placeholderWrap;
      return std::make_unique<ImageGenerator>(placeholderGenerator(config.outputDir, opt));
    }
    case GeneratorKind::Scene:
      break;
  }

  SceneOptions opt;
  opt.blurSigma = config.blurSigma;
  return std::make_unique<ImageGenerator>(sceneGenerator(config.outputDir, opt));
}

} // namespace promptart::art
