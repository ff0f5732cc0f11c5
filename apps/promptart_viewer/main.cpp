#include "PreviewTexture.h"

#include "promptart/art/GeneratorConfig.h"
#include "promptart/art/ImageGenerator.h"
#include "promptart/art/Palette.h"
#include "promptart/art/SceneRenderer.h"
#include "promptart/core/Args.h"
#include "promptart/core/CVar.h"
#include "promptart/core/Log.h"

#include <SDL.h>
#include <SDL_opengl.h>

#include <imgui.h>
#include <backends/imgui_impl_opengl3.h>
#include <backends/imgui_impl_sdl2.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <mutex>
#include <string>

using namespace promptart;

namespace {

struct LogLine {
  core::LogLevel level;
  std::string text;
};

// Recent log lines for the status panel; fed by a log sink.
struct LogBuffer {
  std::mutex mutex;
  std::deque<LogLine> lines;
};

void logToBuffer(core::LogLevel level, std::string_view timestamp, std::string_view message, void* user) {
  auto* buf = static_cast<LogBuffer*>(user);
  std::lock_guard<std::mutex> lock(buf->mutex);
  buf->lines.push_back({level, std::string(timestamp) + " " + std::string(message)});
  while (buf->lines.size() > 64) buf->lines.pop_front();
}

ImVec4 toImColor(art::Rgb c) {
  return ImVec4(c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, 1.0f);
}

void paletteSwatches(const art::Palette& pal) {
  const struct {
    const char* label;
    art::Rgb color;
  } swatches[] = {
    {"bg top", pal.bgTop},
    {"bg bottom", pal.bgBottom},
    {"primary", pal.primary},
    {"secondary", pal.secondary},
    {"accent", pal.accent},
    {"ground", pal.ground},
  };

  for (std::size_t i = 0; i < std::size(swatches); ++i) {
    if (i > 0) ImGui::SameLine();
    ImGui::ColorButton(swatches[i].label, toImColor(swatches[i].color),
                       ImGuiColorEditFlags_NoAlpha, ImVec2(36, 36));
  }
}

} // namespace

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  core::Args args(argc, argv);

  core::CVarRegistry& reg = core::cvars();
  art::installArtCVars(reg);

  std::string configPath;
  if (args.getString("config", configPath)) {
    std::string err;
    if (!reg.loadFile(configPath, &err)) {
      PROMPTART_LOG_ERROR("config " + configPath + ": " + err);
      return 2;
    }
  }

  art::GeneratorConfig cfg;
  {
    std::string err;
    if (!art::loadGeneratorConfig(reg, cfg, &err)) {
      PROMPTART_LOG_ERROR(err);
      return 2;
    }
  }

  LogBuffer logBuffer;
  const core::LogSink sink{&logToBuffer, &logBuffer};
  core::addLogSink(sink);

#ifdef _WIN32
  SDL_SetMainReady();
#endif

  if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
    PROMPTART_LOG_ERROR(std::string("SDL_Init failed: ") + SDL_GetError());
    core::removeLogSink(sink);
    return 1;
  }

  // GL 3.3 core
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

  SDL_Window* window = SDL_CreateWindow(
      "promptart viewer",
      SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
      1280, 800,
      SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE);

  if (!window) {
    PROMPTART_LOG_ERROR(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
    SDL_Quit();
    core::removeLogSink(sink);
    return 1;
  }

  SDL_GLContext glContext = SDL_GL_CreateContext(window);
  if (!glContext) {
    PROMPTART_LOG_ERROR(std::string("SDL_GL_CreateContext failed: ") + SDL_GetError());
    SDL_DestroyWindow(window);
    SDL_Quit();
    core::removeLogSink(sink);
    return 1;
  }
  SDL_GL_MakeCurrent(window, glContext);
  SDL_GL_SetSwapInterval(1);

  PROMPTART_LOG_INFO(std::string("OpenGL: ") + reinterpret_cast<const char*>(glGetString(GL_VERSION)));

  { // Scope GL objects so they are destroyed before SDL_GL_DeleteContext

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO& io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
  io.IniFilename = nullptr;
  ImGui::StyleColorsDark();

  ImGui_ImplSDL2_InitForOpenGL(window, glContext);
  ImGui_ImplOpenGL3_Init("#version 330 core");

  std::array<char, 2048> promptBuf{};
  {
    const std::string initial = args.positional().empty() ? std::string("a quiet night under the stars and moon")
                                                          : args.positional().front();
    std::snprintf(promptBuf.data(), promptBuf.size(), "%s", initial.c_str());
  }
  core::i64 id = 1;
  int generatorIndex = (int)cfg.kind;
  float blurSigma = (float)cfg.blurSigma;
  bool autoRender = true;
  bool dirty = true;

  viewer::PreviewTexture preview;
  art::SceneResult scene;
  std::string lastSaved;

  bool running = true;
  while (running) {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
      ImGui_ImplSDL2_ProcessEvent(&event);
      if (event.type == SDL_QUIT) running = false;
      if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_CLOSE &&
          event.window.windowID == SDL_GetWindowID(window)) {
        running = false;
      }
    }

    if (dirty) {
      art::SceneOptions opt;
      opt.blurSigma = blurSigma;
      scene = art::renderScene(promptBuf.data(), opt);
      preview.upload(scene.canvas);
      dirty = false;
    }

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(420, 760), ImGuiCond_FirstUseEver);
    ImGui::Begin("Prompt");

    const bool edited = ImGui::InputTextMultiline("##prompt", promptBuf.data(), promptBuf.size(),
                                                  ImVec2(-1.0f, ImGui::GetTextLineHeight() * 5));
    if (edited && autoRender) dirty = true;

    ImGui::Checkbox("Render while typing", &autoRender);
    ImGui::SameLine();
    if (ImGui::Button("Render")) dirty = true;

    if (ImGui::SliderFloat("Blur sigma", &blurSigma, 0.0f, 4.0f, "%.2f")) dirty = true;

    ImGui::Separator();

    const art::SceneSummary& s = scene.summary;
    ImGui::Text("Seed      0x%08x", (unsigned)s.seed);
    ImGui::TextWrapped("Tokens    %s", art::joinTokens(s.tokens).c_str());
    ImGui::Text("Palette   %s", art::paletteKindName(s.palette));
    paletteSwatches(art::palette(s.palette));
    ImGui::Text("Celestial %s (r=%d)", art::celestialKindName(s.celestial), scene.atmosphere.discRadius);
    ImGui::Text("Particles %d", s.particleCount);
    ImGui::Text("Motif     %s (%d)", art::sceneMotifName(s.motif), scene.motif.elements);
    ImGui::Text("Accent    %s (%d)", art::accentStyleName(s.accent), scene.accents.count);
    ImGui::Text("RNG draws %llu", (unsigned long long)scene.rngDraws);

    ImGui::Separator();

    const char* generatorNames[] = {"scene", "placeholder"};
    ImGui::Combo("Generator", &generatorIndex, generatorNames, IM_ARRAYSIZE(generatorNames));
    ImGui::InputScalar("Id", ImGuiDataType_S64, &id);
    ImGui::TextDisabled("Output: %s", cfg.outputDir.c_str());

    if (ImGui::Button("Save PNG")) {
      art::GeneratorConfig saveCfg = cfg;
      saveCfg.kind = (art::GeneratorKind)generatorIndex;
      saveCfg.blurSigma = blurSigma;
      auto generator = art::makeImageGenerator(saveCfg);
      std::string err;
      const std::string path = generator->generate(id, promptBuf.data(), &err);
      lastSaved = path.empty() ? ("failed: " + err) : path;
    }
    if (!lastSaved.empty()) ImGui::TextWrapped("%s", lastSaved.c_str());

    ImGui::Separator();
    ImGui::BeginChild("log", ImVec2(0, 0), true);
    {
      std::lock_guard<std::mutex> lock(logBuffer.mutex);
      for (const LogLine& l : logBuffer.lines) {
        if (l.level >= core::LogLevel::Error) {
          ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.4f, 1.0f), "%s", l.text.c_str());
        } else {
          ImGui::TextUnformatted(l.text.c_str());
        }
      }
    }
    ImGui::EndChild();

    ImGui::End();

    ImGui::SetNextWindowPos(ImVec2(440, 10), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(820, 780), ImGuiCond_FirstUseEver);
    ImGui::Begin("Preview");
    if (preview.valid()) {
      const ImVec2 avail = ImGui::GetContentRegionAvail();
      const float side = std::max(64.0f, std::min(avail.x, avail.y));
      ImGui::Image((ImTextureID)(std::intptr_t)preview.handle(), ImVec2(side, side));
    }
    ImGui::End();

    ImGui::Render();

    int w = 0, h = 0;
    SDL_GL_GetDrawableSize(window, &w, &h);
    glViewport(0, 0, w, h);
    glClearColor(0.06f, 0.06f, 0.07f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    SDL_GL_SwapWindow(window);
  }

  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplSDL2_Shutdown();
  ImGui::DestroyContext();

  } // GL objects scope

  core::removeLogSink(sink);

  SDL_GL_DeleteContext(glContext);
  SDL_DestroyWindow(window);
  SDL_Quit();
  return 0;
}
