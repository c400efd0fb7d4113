#pragma once
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "ParseError.hpp"

namespace stopwatch {

// Signed span of time with nanosecond resolution.
class Duration {
  int64_t nano{};

  constexpr explicit Duration(int64_t nanoseconds) : nano(nanoseconds) {}

 public:
  static constexpr int64_t nanosecond = 1;
  static constexpr int64_t microsecond = 1'000 * nanosecond;
  static constexpr int64_t millisecond = 1'000 * microsecond;
  static constexpr int64_t second = 1'000 * millisecond;
  static constexpr int64_t minute = 60 * second;
  static constexpr int64_t hour = 60 * minute;

  constexpr Duration() = default;

  static constexpr Duration zero() { return Duration{}; }

  static constexpr Duration from_nanoseconds(int64_t ns) { return Duration{ns}; }
  static constexpr Duration from_microseconds(int64_t us) { return Duration{us * microsecond}; }
  static constexpr Duration from_milliseconds(int64_t ms) { return Duration{ms * millisecond}; }
  static constexpr Duration from_seconds(double s) { return Duration{int64_t(s * double(second))}; }
  static constexpr Duration from_minutes(int64_t m) { return Duration{m * minute}; }
  static constexpr Duration from_hours(int64_t h) { return Duration{h * hour}; }

  // Parses a duration string such as "300ms", "-1.5h" or "2h45m".
  // A sign is optional; every number needs a unit ("ns", "us", "µs", "ms",
  // "s", "m", "h") except for a lone "0".
  [[nodiscard]] static ParseError parse(std::string_view text, Duration& value);

  constexpr int64_t nanoseconds() const { return nano; }
  constexpr int64_t microseconds() const { return nano / microsecond; }
  constexpr int64_t milliseconds() const { return nano / millisecond; }
  constexpr double seconds() const { return double(nano) / double(second); }

  constexpr bool is_zero() const { return nano == 0; }

  // Canonical text form, e.g. "72h3m0.5s", "1.5ms" or "0s".
  std::string to_string() const;

  constexpr Duration operator+(const Duration& other) const { return Duration(nano + other.nano); }
  constexpr Duration operator-(const Duration& other) const { return Duration(nano - other.nano); }
  constexpr Duration operator-() const { return Duration(-nano); }
  constexpr Duration operator*(int64_t scale) const { return Duration(nano * scale); }
  constexpr Duration operator/(int64_t scale) const { return Duration(nano / scale); }

  constexpr Duration& operator+=(const Duration& other) {
    nano += other.nano;
    return *this;
  }

  constexpr Duration& operator-=(const Duration& other) {
    nano -= other.nano;
    return *this;
  }

  constexpr auto operator<=>(const Duration& other) const = default;
};

}  // namespace stopwatch

template <>
struct fmt::formatter<stopwatch::Duration> : formatter<std::string_view> {
  auto format(const stopwatch::Duration& duration, format_context& ctx) const {
    return formatter<string_view>::format(duration.to_string(), ctx);
  }
};
