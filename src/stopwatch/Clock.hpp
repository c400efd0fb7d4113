#pragma once
#include <compare>
#include <cstdint>
#include <limits>
#include <string>

#include <base/ClassTraits.hpp>

#include <fmt/format.h>

#include "Duration.hpp"

namespace stopwatch {

namespace detail {

constexpr bool checked_add(int64_t a, int64_t b, int64_t& result) {
  constexpr auto max = std::numeric_limits<int64_t>::max();
  constexpr auto min = std::numeric_limits<int64_t>::min();

  if ((b > 0 && a > max - b) || (b < 0 && a < min - b)) {
    result = b > 0 ? max : min;
    return false;
  }

  result = a + b;
  return true;
}

constexpr bool checked_sub(int64_t a, int64_t b, int64_t& result) {
  constexpr auto max = std::numeric_limits<int64_t>::max();
  constexpr auto min = std::numeric_limits<int64_t>::min();

  if ((b < 0 && a > max + b) || (b > 0 && a < min + b)) {
    result = b < 0 ? max : min;
    return false;
  }

  result = a - b;
  return true;
}

}  // namespace detail

// Wall-clock point in time, stored as nanoseconds since the Unix epoch.
// A default constructed Instant is the zero sentinel.
class Instant {
  int64_t nano{};

  constexpr explicit Instant(int64_t nanoseconds) : nano(nanoseconds) {}

 public:
  constexpr Instant() = default;

  static constexpr Instant from_unix_nanoseconds(int64_t ns) { return Instant{ns}; }

  constexpr int64_t unix_nanoseconds() const { return nano; }
  constexpr bool is_zero() const { return nano == 0; }

  // Local time in the "Jan _2 15:04:05" layout. The zero instant always
  // prints as "Jan  1 00:00:00".
  std::string to_stamp() const;

  // Local time in the "2006/01/02 15:04:05" layout used for log prefixes.
  std::string to_log_stamp() const;

  // Arithmetic saturates at the representable range.
  constexpr Duration operator-(const Instant& other) const {
    int64_t result{};
    detail::checked_sub(nano, other.nano, result);
    return Duration::from_nanoseconds(result);
  }
  constexpr Instant operator+(const Duration& duration) const {
    int64_t result{};
    detail::checked_add(nano, duration.nanoseconds(), result);
    return Instant(result);
  }
  constexpr Instant operator-(const Duration& duration) const {
    int64_t result{};
    detail::checked_sub(nano, duration.nanoseconds(), result);
    return Instant(result);
  }

  constexpr Instant& operator+=(const Duration& duration) {
    detail::checked_add(nano, duration.nanoseconds(), nano);
    return *this;
  }

  // Returns false if the result doesn't fit.
  constexpr bool checked_sub(const Duration& duration, Instant& result) const {
    int64_t value{};
    if (!detail::checked_sub(nano, duration.nanoseconds(), value)) {
      return false;
    }
    result = Instant(value);
    return true;
  }

  constexpr auto operator<=>(const Instant& other) const = default;
};

class Clock {
 public:
  virtual ~Clock() = default;

  virtual Instant now() const = 0;
};

class SystemClock : public Clock {
 public:
  CLASS_NON_COPYABLE_NON_MOVABLE(SystemClock)

  SystemClock() = default;

  static SystemClock& instance();

  Instant now() const override;
};

}  // namespace stopwatch

template <>
struct fmt::formatter<stopwatch::Instant> : formatter<std::string_view> {
  auto format(const stopwatch::Instant& instant, format_context& ctx) const {
    return formatter<string_view>::format(instant.to_stamp(), ctx);
  }
};
