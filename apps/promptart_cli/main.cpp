#include "promptart/art/GeneratorConfig.h"
#include "promptart/art/ImageGenerator.h"
#include "promptart/art/PlaceholderRenderer.h"
#include "promptart/art/SceneRenderer.h"
#include "promptart/core/Args.h"
#include "promptart/core/CVar.h"
#include "promptart/core/Log.h"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace promptart;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void printHelp() {
  std::cout << "promptart_cli - render a prompt into a PNG\n\n"
            << "Usage:\n"
            << "  promptart_cli --id <n> [options] <prompt words...>\n"
            << "  promptart_cli --describe [options] <prompt words...>\n\n"
            << "Options:\n"
            << "  --id <n>               Identifier used in the file name (required unless --describe)\n"
            << "  --prompt <text>        Prompt text (default: positional words joined by spaces)\n"
            << "  --out <dir>            Output directory (art.output_dir, default: data/images)\n"
            << "  --generator <kind>     scene | placeholder (art.generator, default: scene)\n"
            << "  --config <path>        Load settings from a key = value file\n"
            << "  --set <key=value>      Override one setting; may be repeated\n"
            << "  --describe             Print seed, tokens and layer choices; write nothing\n"
            << "  --log-level <lvl>      trace | debug | info | warn | error | off\n"
            << "  --list-settings        Print all settings with their current values\n"
            << "  --help, -h             Show this help\n\n"
            << "Exit codes: 0 ok, 1 generation failed, 2 usage or configuration error.\n";
}

std::string joinWords(const std::vector<std::string>& words) {
  std::string out;
  for (const auto& w : words) {
    if (!out.empty()) out += ' ';
    out += w;
  }
  return out;
}

void printSettings(const core::CVarRegistry& reg) {
  for (const core::CVar* v : reg.list()) {
    std::cout << std::left << std::setw(28) << v->name << " = "
              << core::CVarRegistry::valueToString(*v)
              << "  (" << core::CVarRegistry::typeName(v->type) << ")";
    if (!v->help.empty()) std::cout << "  " << v->help;
    std::cout << "\n";
  }
}

void describe(const std::string& prompt, const art::GeneratorConfig& cfg) {
  std::cout << "prompt:     \"" << prompt << "\"\n"
            << "generator:  " << art::generatorKindName(cfg.kind) << "\n";

  if (cfg.kind == art::GeneratorKind::Placeholder) {
    art::PlaceholderOptions opt;
    opt.maxChars = cfg.placeholderMaxChars;
    opt.wrapWidth = cfg.placeholderWrap;
    const auto lines = art::wrapText(art::truncateUtf8(prompt, (std::size_t)opt.maxChars), opt.wrapWidth);
    const art::Canvas canvas = art::renderPlaceholder(prompt, opt);
    std::cout << "lines:      " << lines.size() << "\n"
              << "signature:  0x" << std::hex << std::setw(16) << std::setfill('0')
              << art::canvasSignature(canvas) << std::dec << std::setfill(' ') << "\n";
    return;
  }

  art::SceneOptions opt;
  opt.blurSigma = cfg.blurSigma;
  const art::SceneResult r = art::renderScene(prompt, opt);
  const art::SceneSummary& s = r.summary;

  std::cout << "seed:       0x" << std::hex << std::setw(8) << std::setfill('0') << s.seed
            << std::dec << std::setfill(' ') << " (" << s.seed << ")\n"
            << "tokens:     " << art::joinTokens(s.tokens) << "\n"
            << "palette:    " << art::paletteKindName(s.palette) << "\n"
            << "celestial:  " << art::celestialKindName(s.celestial)
            << " at (" << r.atmosphere.discX << ", " << r.atmosphere.discY << ") r=" << r.atmosphere.discRadius << "\n"
            << "particles:  " << s.particleCount << "\n"
            << "motif:      " << art::sceneMotifName(s.motif) << " (" << r.motif.elements << " elements";
  if (s.motif == art::SceneMotif::Urban) std::cout << ", " << r.motif.litWindows << " lit windows";
  std::cout << ")\n"
            << "accent:     " << art::accentStyleName(s.accent) << " (" << r.accents.count << ")\n"
            << "rng draws:  " << r.rngDraws << "\n"
            << "signature:  0x" << std::hex << std::setw(16) << std::setfill('0')
            << art::canvasSignature(r.canvas) << std::dec << std::setfill(' ') << "\n";
}

} // namespace

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  core::Args args;
  args.setArity("describe", 0);
  args.setArity("help", 0);
  args.setArity("list-settings", 0);
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return kExitOk;
  }

  core::CVarRegistry& reg = core::cvars();
  art::installArtCVars(reg);

  std::string configPath;
  if (args.getString("config", configPath)) {
    std::string err;
    if (!reg.loadFile(configPath, &err)) {
      PROMPTART_LOG_ERROR("config " + configPath + ": " + err);
      return kExitUsage;
    }
  }

  for (const auto& assignment : args.values("set")) {
    std::string err;
    if (!reg.applyAssignment(assignment, &err)) {
      PROMPTART_LOG_ERROR("--set " + assignment + ": " + err);
      return kExitUsage;
    }
  }

  // Dedicated options win over config files and --set.
  struct Override {
    const char* option;
    const char* cvar;
  };
  const Override overrides[] = {
    {"out", "art.output_dir"},
    {"generator", "art.generator"},
    {"log-level", "log.level"},
  };
  for (const Override& o : overrides) {
    std::string v;
    if (!args.getString(o.option, v)) continue;
    std::string err;
    if (!reg.setFromString(o.cvar, v, &err)) {
      PROMPTART_LOG_ERROR(std::string("--") + o.option + ": " + err);
      return kExitUsage;
    }
  }

  {
    core::LogLevel lvl = core::LogLevel::Info;
    const std::string name = reg.getString("log.level", "info");
    if (!core::parseLogLevel(name, lvl)) {
      PROMPTART_LOG_ERROR("log.level: unknown level '" + name + "'");
      return kExitUsage;
    }
  }

  if (args.hasFlag("list-settings")) {
    printSettings(reg);
    return kExitOk;
  }

  art::GeneratorConfig cfg;
  {
    std::string err;
    if (!art::loadGeneratorConfig(reg, cfg, &err)) {
      PROMPTART_LOG_ERROR(err);
      return kExitUsage;
    }
  }

  std::string prompt;
  if (!args.getString("prompt", prompt)) {
    if (args.positional().empty() && !args.hasFlag("prompt")) {
      std::cerr << "No prompt given.\n\n";
      printHelp();
      return kExitUsage;
    }
    prompt = joinWords(args.positional());
  }

  if (args.hasFlag("describe")) {
    describe(prompt, cfg);
    return kExitOk;
  }

  long long id = 0;
  if (!args.getI64("id", id)) {
    std::cerr << (args.has("id") ? "--id must be an integer.\n" : "--id is required.\n");
    return kExitUsage;
  }

  auto generator = art::makeImageGenerator(cfg);

  std::string err;
  if (!generator->prepare(&err)) return kExitFailure;

  const std::string path = generator->generate((core::i64)id, prompt, &err);
  if (path.empty()) return kExitFailure;

  std::cout << path << "\n";
  return kExitOk;
}
