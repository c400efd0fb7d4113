#include "Clock.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <string_view>

#include <base/Platform.hpp>

using namespace stopwatch;

static std::tm to_local_time(const Instant& instant) {
  const auto seconds = std::time_t(instant.unix_nanoseconds() / Duration::second);

  std::tm local{};
#ifdef PLATFORM_WINDOWS
  localtime_s(&local, &seconds);
#else
  localtime_r(&seconds, &local);
#endif

  return local;
}

std::string Instant::to_stamp() const {
  static constexpr std::array<std::string_view, 12> months{
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec",
  };

  if (is_zero()) {
    return "Jan  1 00:00:00";
  }

  const auto local = to_local_time(*this);
  return fmt::format("{} {:>2} {:02}:{:02}:{:02}", months[size_t(local.tm_mon)], local.tm_mday,
                     local.tm_hour, local.tm_min, local.tm_sec);
}

std::string Instant::to_log_stamp() const {
  const auto local = to_local_time(*this);
  return fmt::format("{:04}/{:02}/{:02} {:02}:{:02}:{:02}", local.tm_year + 1900, local.tm_mon + 1,
                     local.tm_mday, local.tm_hour, local.tm_min, local.tm_sec);
}

SystemClock& SystemClock::instance() {
  static SystemClock clock;
  return clock;
}

Instant SystemClock::now() const {
  const auto now_timepoint = std::chrono::system_clock::now();

  return Instant::from_unix_nanoseconds(
    std::chrono::duration_cast<std::chrono::nanoseconds>(now_timepoint.time_since_epoch()).count());
}
