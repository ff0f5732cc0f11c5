#include "promptart/art/ImageGenerator.h"
#include "promptart/core/Log.h"

#include "test_harness.h"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

// 2023-11-14 22:13:20 UTC
std::time_t fixedClock() { return 1700000000; }

std::vector<unsigned char> readAll(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::vector<unsigned char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

bool hasPngSignature(const std::vector<unsigned char>& bytes) {
  static const unsigned char sig[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
  if (bytes.size() < 8) return false;
  for (int i = 0; i < 8; ++i) {
    if (bytes[(std::size_t)i] != sig[i]) return false;
  }
  return true;
}

bool endsWithIend(const std::vector<unsigned char>& bytes) {
  static const unsigned char tail[8] = {'I', 'E', 'N', 'D', 0xae, 0x42, 0x60, 0x82};
  if (bytes.size() < 8) return false;
  for (std::size_t i = 0; i < 8; ++i) {
    if (bytes[bytes.size() - 8 + i] != tail[i]) return false;
  }
  return true;
}

std::size_t countEntries(const fs::path& dir) {
  std::error_code ec;
  std::size_t n = 0;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) ++n;
  return n;
}

} // namespace

int test_image_generator() {
  int failures = 0;

  using namespace promptart;
  using namespace promptart::art;

  const core::LogLevel prevLevel = core::getLogLevel();
  core::setLogLevel(core::LogLevel::Off);

  CHECK(outputFileName(7, fixedClock()) == "saying_7_20231114221320.png");
  CHECK(outputFileName(-3, 0) == "saying_-3_19700101000000.png");

  std::error_code ec;
  const fs::path root = fs::temp_directory_path(ec) / "promptart_test_image_generator";
  fs::remove_all(root, ec);

  // prepare() creates nested directories and is repeatable.
  {
    const fs::path dir = root / "nested" / "images";
    std::string err;
    CHECK(prepareOutputDirectory(dir.string(), &err));
    CHECK(fs::is_directory(dir));
    CHECK(prepareOutputDirectory(dir.string(), &err));
    CHECK(!prepareOutputDirectory("", &err));
  }

  // Scene generator: file name, PNG bytes, lazy directory creation, no temp file left.
  {
    const fs::path dir = root / "scene";
    ImageGenerator gen = sceneGenerator(dir.string());
    gen.setClock(&fixedClock);
    CHECK(std::string(gen.name()) == "scene");

    std::string err;
    const std::string path = gen.generate(7, "a quiet night under the stars and moon", &err);
    CHECK(!path.empty());
    CHECK(err.empty());
    CHECK(fs::path(path) == dir / "saying_7_20231114221320.png");
    CHECK(fs::exists(path));
    CHECK(countEntries(dir) == 1);
    CHECK(hasPngSignature(readAll(path)));

    // Same prompt and id in another directory: byte-identical output.
    ImageGenerator other = sceneGenerator((root / "scene_again").string());
    other.setClock(&fixedClock);
    CHECK(other.prepare(&err));
    const std::string again = other.generate(7, "a quiet night under the stars and moon", &err);
    CHECK(!again.empty());
    CHECK(readAll(path) == readAll(again));

    // Same id within the same second overwrites.
    const std::string overwritten = gen.generate(7, "something else entirely", &err);
    CHECK(overwritten == path);
    CHECK(countEntries(dir) == 1);
    CHECK(readAll(path) != readAll(again));
  }

  // Placeholder generator writes a PNG too.
  {
    const fs::path dir = root / "placeholder";
    ImageGenerator gen = placeholderGenerator(dir.string());
    gen.setClock(&fixedClock);
    std::string err;
    const std::string path = gen.generate(12, "Unicode \xe2\x9c\x93 prompt", &err);
    CHECK(!path.empty());
    CHECK(fs::path(path).filename() == "saying_12_20231114221320.png");
    CHECK(hasPngSignature(readAll(path)));
  }

  // Unwritable location: a regular file where the directory should be.
  {
    const fs::path blocker = root / "blocker";
    {
      std::ofstream f(blocker);
      f << "not a directory";
    }

    ImageGenerator gen = sceneGenerator((blocker / "images").string());
    gen.setClock(&fixedClock);
    std::string err;
    CHECK(!gen.prepare(&err));
    CHECK(!err.empty());

    err.clear();
    const std::string path = gen.generate(1, "anything", &err);
    CHECK(path.empty());
    CHECK(!err.empty());
    CHECK(!fs::exists(blocker / "images" / "saying_1_20231114221320.png"));

    ImageGenerator onFile = sceneGenerator(blocker.string());
    err.clear();
    CHECK(onFile.generate(1, "anything", &err).empty());
    CHECK(err.find("not a directory") != std::string::npos);
  }

  // Generators hold no per-call state: concurrent-style reuse gives the same bytes.
  {
    const fs::path dir = root / "reuse";
    ImageGenerator gen = sceneGenerator(dir.string());
    gen.setClock(&fixedClock);
    std::string err;
    const std::string p1 = gen.generate(100, "forest path", &err);
    const std::vector<unsigned char> first = readAll(p1);
    const std::string p2 = gen.generate(100, "forest path", &err);
    CHECK(p1 == p2);
    CHECK(first == readAll(p2));
  }

  // The render strategy is swappable without subclassing.
  {
    const fs::path dir = root / "custom";
    ImageGenerator gen("flat", dir.string(), [](std::string_view) { return Canvas(8, 8, Rgb{10, 20, 30}); });
    gen.setClock(&fixedClock);
    std::string err;
    const std::string path = gen.generate(5, "ignored", &err);
    CHECK(gen.name() == "flat");
    CHECK(!path.empty());
    CHECK(hasPngSignature(readAll(path)));

    ImageGenerator empty("none", dir.string(), RenderFn{});
    CHECK(empty.generate(6, "x", &err).empty());
    CHECK(!err.empty());
  }

  // Two calls racing on the same id and second: both succeed, the survivor is a
  // complete PNG and no temporary file is left behind.
  {
    const fs::path dir = root / "race";
    const ImageGenerator gen = placeholderGenerator(dir.string());
    CHECK(gen.prepare());

    for (int round = 0; round < 8; ++round) {
      ImageGenerator a = sceneGenerator(dir.string());
      ImageGenerator b = placeholderGenerator(dir.string());
      a.setClock(&fixedClock);
      b.setClock(&fixedClock);

      std::string errA;
      std::string errB;
      std::string pathA;
      std::string pathB;
      std::thread ta([&] { pathA = a.generate(77, "city lights at night", &errA); });
      std::thread tb([&] { pathB = b.generate(77, "city lights at night", &errB); });
      ta.join();
      tb.join();

      CHECK(!pathA.empty() && errA.empty());
      CHECK(!pathB.empty() && errB.empty());
      CHECK(pathA == pathB);

      const std::vector<unsigned char> bytes = readAll(pathA);
      CHECK(hasPngSignature(bytes));
      CHECK(endsWithIend(bytes));
      CHECK(countEntries(dir) == 1);
    }
  }

  fs::remove_all(root, ec);
  core::setLogLevel(prevLevel);
  return failures;
}
