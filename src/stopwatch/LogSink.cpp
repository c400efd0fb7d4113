#include "LogSink.hpp"
#include "Clock.hpp"

#include <base/Log.hpp>

using namespace stopwatch;

BaseLogSink::BaseLogSink(const Clock& clock) : clock(clock) {}

BaseLogSink& BaseLogSink::instance() {
  static BaseLogSink sink{SystemClock::instance()};
  return sink;
}

std::string BaseLogSink::prefixed(std::string_view message) const {
  return base::format("{} {}", clock.now().to_log_stamp(), message);
}

void BaseLogSink::write(std::string_view message) {
  log_info("{}", prefixed(message));
}
