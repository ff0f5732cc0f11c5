#include "promptart/art/PngWriter.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <system_error>
#include <thread>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STBIW_ASSERT(x) ((void)0)
#include <stb_image_write.h>

namespace promptart::art {

static void appendToVector(void* context, void* data, int size) {
  auto* out = static_cast<std::vector<core::u8>*>(context);
  const auto* bytes = static_cast<const core::u8*>(data);
  out->insert(out->end(), bytes, bytes + size);
}

bool encodePng(const Canvas& canvas, std::vector<core::u8>& outBytes, std::string* outError) {
  outBytes.clear();
  const int stride = canvas.width() * 3;
  const int ok = stbi_write_png_to_func(&appendToVector, &outBytes,
                                        canvas.width(), canvas.height(), 3,
                                        canvas.pixels().data(), stride);
  if (!ok || outBytes.empty()) {
    outBytes.clear();
    if (outError) *outError = "PNG encoding failed";
    return false;
  }
  return true;
}

// "<path>.<thread>.<n>.tmp": unique per call, so concurrent writers of the same
// path never share a temporary file.
static std::string temporaryPathFor(const std::string& path) {
  static std::atomic<unsigned long long> counter{0};
  const std::size_t thread = std::hash<std::thread::id>{}(std::this_thread::get_id());
  return path + "." + std::to_string(thread % 1000000u) + "." +
         std::to_string(counter.fetch_add(1, std::memory_order_relaxed)) + ".tmp";
}

bool writeFileAtomic(const std::string& path, const std::vector<core::u8>& bytes, std::string* outError) {
  namespace fs = std::filesystem;

  const std::string tmpPath = temporaryPathFor(path);
  {
    std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
    if (!out) {
      if (outError) *outError = "Failed to open for writing: " + tmpPath;
      return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
    out.flush();
    if (!out) {
      out.close();
      std::error_code rmEc;
      fs::remove(tmpPath, rmEc);
      if (outError) *outError = "Failed to write: " + tmpPath;
      return false;
    }
  }

  std::error_code ec;
  fs::rename(tmpPath, path, ec);
  if (ec) {
    std::error_code rmEc;
    fs::remove(tmpPath, rmEc);
    if (outError) *outError = "Failed to move " + tmpPath + " to " + path + ": " + ec.message();
    return false;
  }
  return true;
}

} // namespace promptart::art
