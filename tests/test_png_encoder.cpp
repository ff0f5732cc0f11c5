#include <catch2/catch_test_macros.hpp>

#include "promptart/art/PngWriter.h"
#include "promptart/art/SceneRenderer.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace promptart;

static std::uint32_t readBE32(const std::vector<core::u8>& b, std::size_t at) {
  return ((std::uint32_t)b[at] << 24) | ((std::uint32_t)b[at + 1] << 16) |
         ((std::uint32_t)b[at + 2] << 8) | (std::uint32_t)b[at + 3];
}

TEST_CASE("PNG encoding produces an 8-bit RGB image of the canvas size") {
  art::Canvas canvas(37, 21, art::Rgb{10, 200, 30});
  canvas.fillRect(3, 3, 10, 10, art::Rgb{255, 0, 0});

  std::vector<core::u8> png;
  std::string err;
  REQUIRE(art::encodePng(canvas, png, &err));
  REQUIRE(err.empty());
  REQUIRE(png.size() > 33);

  const core::u8 sig[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
  for (std::size_t i = 0; i < 8; ++i) REQUIRE(png[i] == sig[i]);

  // First chunk is IHDR: width, height, bit depth, colour type.
  REQUIRE(std::string(png.begin() + 12, png.begin() + 16) == "IHDR");
  REQUIRE(readBE32(png, 16) == 37u);
  REQUIRE(readBE32(png, 20) == 21u);
  REQUIRE(png[24] == 8);
  REQUIRE(png[25] == 2);

  // Ends with IEND.
  REQUIRE(std::string(png.end() - 8, png.end() - 4) == "IEND");
}

TEST_CASE("PNG encoding is deterministic for a rendered scene") {
  const art::SceneResult scene = art::renderScene("a quiet night under the stars and moon");

  std::vector<core::u8> a;
  std::vector<core::u8> b;
  REQUIRE(art::encodePng(scene.canvas, a));
  REQUIRE(art::encodePng(scene.canvas, b));
  REQUIRE(a == b);
  REQUIRE(readBE32(a, 16) == (std::uint32_t)art::kCanvasSize);
}

TEST_CASE("Atomic write replaces the target and leaves no temporary file") {
  namespace fs = std::filesystem;

  std::error_code ec;
  const fs::path dir = fs::temp_directory_path(ec) / "promptart_test_png_writer";
  fs::remove_all(dir, ec);
  fs::create_directories(dir, ec);
  REQUIRE(!ec);

  const fs::path target = dir / "out.png";
  const std::vector<core::u8> first{1, 2, 3};
  const std::vector<core::u8> second{4, 5, 6, 7};

  std::string err;
  REQUIRE(art::writeFileAtomic(target.string(), first, &err));
  REQUIRE(art::writeFileAtomic(target.string(), second, &err));
  std::size_t entries = 0;
  for (const auto& entry : fs::directory_iterator(dir)) {
    REQUIRE(entry.path().filename() == "out.png");
    ++entries;
  }
  REQUIRE(entries == 1);

  std::ifstream in(target, std::ios::binary);
  const std::vector<char> got((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  REQUIRE(got.size() == second.size());
  REQUIRE(got[3] == 7);

  // Missing parent directory: error, nothing created.
  const fs::path missing = dir / "no_such_dir" / "x.png";
  REQUIRE_FALSE(art::writeFileAtomic(missing.string(), first, &err));
  REQUIRE_FALSE(err.empty());
  REQUIRE_FALSE(fs::exists(missing));

  in.close();
  fs::remove_all(dir, ec);
}
