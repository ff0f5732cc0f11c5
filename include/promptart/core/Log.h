#pragma once

#include <string_view>

namespace promptart::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Lowercase name, as accepted by parseLogLevel().
std::string_view toString(LogLevel level);

// Accepts "trace", "debug", "info", "warn"/"warning", "error", "off" (any case).
bool parseLogLevel(std::string_view text, LogLevel& out);

// Callback sink for log messages, invoked after the line has been written to stderr.
// The timestamp and message views are only valid for the duration of the callback.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

// Sinks obey the current level filter. Registering the same sink twice delivers twice.
void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// Writes "YYYY-MM-DDTHH:MM:SS.mmmZ LEVEL message" (UTC) to stderr, then
// forwards to sinks.
void log(LogLevel level, std::string_view message);

} // namespace promptart::core

#define PROMPTART_LOG_TRACE(msg) ::promptart::core::log(::promptart::core::LogLevel::Trace, (msg))
#define PROMPTART_LOG_DEBUG(msg) ::promptart::core::log(::promptart::core::LogLevel::Debug, (msg))
#define PROMPTART_LOG_INFO(msg)  ::promptart::core::log(::promptart::core::LogLevel::Info,  (msg))
#define PROMPTART_LOG_WARN(msg)  ::promptart::core::log(::promptart::core::LogLevel::Warn,  (msg))
#define PROMPTART_LOG_ERROR(msg) ::promptart::core::log(::promptart::core::LogLevel::Error, (msg))
