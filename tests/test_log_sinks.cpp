#include "promptart/core/Log.h"
#include "test_harness.h"

#include <atomic>
#include <string>

using namespace promptart;

static void testSink(core::LogLevel /*level*/, std::string_view /*ts*/, std::string_view /*msg*/, void* user) {
  auto* count = reinterpret_cast<std::atomic<int>*>(user);
  if (count) count->fetch_add(1, std::memory_order_relaxed);
}

struct Captured {
  core::LogLevel level{core::LogLevel::Off};
  std::string message;
};

static void captureSink(core::LogLevel level, std::string_view /*ts*/, std::string_view msg, void* user) {
  auto* c = static_cast<Captured*>(user);
  c->level = level;
  c->message = std::string(msg);
}

int test_log_sinks() {
  int failures = 0;

  const core::LogLevel prev = core::getLogLevel();
  core::setLogLevel(core::LogLevel::Trace);

  std::atomic<int> count{0};
  const core::LogSink sink{&testSink, &count};

  core::addLogSink(sink);
  core::log(core::LogLevel::Info, "hello");
  CHECK(count.load(std::memory_order_relaxed) == 1);

  // Removing should stop callbacks.
  core::removeLogSink(sink);
  core::log(core::LogLevel::Info, "world");
  CHECK(count.load(std::memory_order_relaxed) == 1);

  // Respect log-level filtering.
  core::addLogSink(sink);
  core::setLogLevel(core::LogLevel::Warn);
  PROMPTART_LOG_INFO("filtered");
  CHECK(count.load(std::memory_order_relaxed) == 1);
  PROMPTART_LOG_WARN("passes");
  CHECK(count.load(std::memory_order_relaxed) == 2);
  core::setLogLevel(core::LogLevel::Off);
  core::log(core::LogLevel::Error, "should_not_fire");
  CHECK(count.load(std::memory_order_relaxed) == 2);
  core::removeLogSink(sink);

  // Sinks see the level and the raw message.
  {
    core::setLogLevel(core::LogLevel::Trace);
    Captured cap;
    const core::LogSink capture{&captureSink, &cap};
    core::addLogSink(capture);
    PROMPTART_LOG_ERROR("disk full");
    core::removeLogSink(capture);
    CHECK(cap.level == core::LogLevel::Error);
    CHECK(cap.message == "disk full");
  }

  // Level names.
  {
    core::LogLevel lvl = core::LogLevel::Info;
    CHECK(core::parseLogLevel("DEBUG", lvl) && lvl == core::LogLevel::Debug);
    CHECK(core::parseLogLevel("warning", lvl) && lvl == core::LogLevel::Warn);
    CHECK(core::parseLogLevel("off", lvl) && lvl == core::LogLevel::Off);
    CHECK(!core::parseLogLevel("loud", lvl));
    CHECK(lvl == core::LogLevel::Off);
    CHECK(!core::toString(core::LogLevel::Error).empty());
  }

  // Restore.
  core::setLogLevel(prev);
  return failures;
}
