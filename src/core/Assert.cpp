#include "promptart/core/Assert.h"
#include "promptart/core/Log.h"

#include <cstdlib>
#include <string>

namespace promptart::core {

namespace {

// "src/art/Canvas.cpp" -> "Canvas.cpp"; keeps log lines short for out-of-tree builds.
std::string_view baseName(std::string_view path) {
  const std::size_t slash = path.find_last_of("/\\");
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace

[[noreturn]] void panic(std::string_view message, const char* file, int line) {
  std::string text = "fatal: ";
  text += message;
  text += " at ";
  text += baseName(file ? file : "?");
  text += ':';
  text += std::to_string(line);
  log(LogLevel::Error, text);
  std::abort();
}

} // namespace promptart::core
