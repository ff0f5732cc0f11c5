#include "promptart/core/Log.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace promptart::core {

namespace {

struct LevelName {
  LogLevel level;
  std::string_view name;
};

constexpr std::array<LevelName, 6> kLevelNames{{
  {LogLevel::Trace, "trace"},
  {LogLevel::Debug, "debug"},
  {LogLevel::Info, "info"},
  {LogLevel::Warn, "warn"},
  {LogLevel::Error, "error"},
  {LogLevel::Off, "off"},
}};

struct LogState {
  std::atomic<LogLevel> level{LogLevel::Info};
  std::mutex mutex; // guards sinks and stderr
  std::vector<LogSink> sinks;
};

LogState& state() {
  static LogState s;
  return s;
}

// UTC, matching the timestamps in generated file names.
std::string utcTimestamp() {
  using clock = std::chrono::system_clock;
  const clock::time_point now = clock::now();
  const std::time_t secs = clock::to_time_t(now);
  const long long ms =
    std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &secs);
#else
  gmtime_r(&secs, &tm);
#endif

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
  return buf;
}

} // namespace

void setLogLevel(LogLevel level) { state().level.store(level, std::memory_order_relaxed); }
LogLevel getLogLevel() { return state().level.load(std::memory_order_relaxed); }

std::string_view toString(LogLevel level) {
  for (const LevelName& n : kLevelNames) {
    if (n.level == level) return n.name;
  }
  return "?";
}

bool parseLogLevel(std::string_view text, LogLevel& out) {
  std::string key;
  for (const unsigned char c : text) {
    if (!std::isspace(c)) key.push_back((char)std::tolower(c));
  }
  if (key == "warning") key = "warn";
  if (key == "none") key = "off";

  for (const LevelName& n : kLevelNames) {
    if (n.name == key) {
      out = n.level;
      return true;
    }
  }
  return false;
}

void addLogSink(LogSink sink) {
  if (!sink.fn) return;
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.sinks.push_back(sink);
}

void removeLogSink(LogSink sink) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.sinks.erase(std::remove_if(s.sinks.begin(), s.sinks.end(),
                               [&](const LogSink& x) { return x.fn == sink.fn && x.user == sink.user; }),
                s.sinks.end());
}

void log(LogLevel level, std::string_view message) {
  const LogLevel threshold = getLogLevel();
  if (threshold == LogLevel::Off || level < threshold) return;

  const std::string ts = utcTimestamp();
  std::string tag(toString(level));
  std::transform(tag.begin(), tag.end(), tag.begin(), [](unsigned char c) { return (char)std::toupper(c); });
  tag.resize(5, ' ');

  // Sinks run unlocked so a sink may log.
  std::vector<LogSink> sinks;
  {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    std::cerr << ts << ' ' << tag << ' ' << message << '\n';
    sinks = s.sinks;
  }

  for (const LogSink& sink : sinks) sink.fn(level, ts, message, sink.user);
}

} // namespace promptart::core
