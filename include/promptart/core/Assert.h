#pragma once

#include <string_view>

namespace promptart::core {

// Logs "fatal: <message> at <file>:<line>" at Error level and aborts.
// Reserved for broken invariants; recoverable failures return false + outError.
[[noreturn]] void panic(std::string_view message, const char* file, int line);

} // namespace promptart::core

#define PROMPTART_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      ::promptart::core::panic("Assertion failed: " #expr, __FILE__, __LINE__); \
    } \
  } while (0)

#define PROMPTART_ASSERT_MSG(expr, msg) \
  do { \
    if (!(expr)) { \
      ::promptart::core::panic(std::string_view(msg), __FILE__, __LINE__); \
    } \
  } while (0)
