#include "Duration.hpp"

#include <array>
#include <iterator>

using namespace stopwatch;

constexpr static uint64_t max_magnitude = uint64_t(1) << 63;

struct DurationUnit {
  std::string_view name;
  uint64_t nanoseconds;
};

// "µs" is accepted both as U+00B5 (micro sign) and U+03BC (Greek mu).
constexpr static std::array<DurationUnit, 8> units{{
  {"ns", uint64_t(Duration::nanosecond)},
  {"us", uint64_t(Duration::microsecond)},
  {"\xc2\xb5s", uint64_t(Duration::microsecond)},
  {"\xce\xbcs", uint64_t(Duration::microsecond)},
  {"ms", uint64_t(Duration::millisecond)},
  {"s", uint64_t(Duration::second)},
  {"m", uint64_t(Duration::minute)},
  {"h", uint64_t(Duration::hour)},
}};

static bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

static const DurationUnit* find_unit(std::string_view name) {
  for (const auto& unit : units) {
    if (unit.name == name) {
      return &unit;
    }
  }
  return nullptr;
}

// Consumes leading digits. Returns false if the value overflows 2^63.
static bool consume_integer(std::string_view& s, uint64_t& value) {
  value = 0;

  size_t i = 0;
  for (; i < s.size() && is_digit(s[i]); ++i) {
    if (value > max_magnitude / 10) {
      return false;
    }
    value = value * 10 + uint64_t(s[i] - '0');
    if (value > max_magnitude) {
      return false;
    }
  }

  s.remove_prefix(i);
  return true;
}

// Consumes leading fraction digits. Digits that no longer fit are dropped
// instead of failing, they are below nanosecond precision anyway.
static void consume_fraction(std::string_view& s, uint64_t& value, double& scale) {
  value = 0;
  scale = 1.0;

  bool overflow = false;

  size_t i = 0;
  for (; i < s.size() && is_digit(s[i]); ++i) {
    if (overflow) {
      continue;
    }
    if (value > (max_magnitude - 1) / 10) {
      overflow = true;
      continue;
    }

    const auto next = value * 10 + uint64_t(s[i] - '0');
    if (next > max_magnitude) {
      overflow = true;
      continue;
    }

    value = next;
    scale *= 10.0;
  }

  s.remove_prefix(i);
}

// Appends `value / 10^precision` with its fractional part, trailing zeros
// (and the dot, if nothing is left) omitted.
static void append_with_fraction(std::string& out, uint64_t value, int precision) {
  uint64_t divisor = 1;
  for (int i = 0; i < precision; ++i) {
    divisor *= 10;
  }

  auto fraction = value % divisor;
  fmt::format_to(std::back_inserter(out), "{}", value / divisor);

  if (fraction != 0) {
    int digits = precision;
    while (fraction % 10 == 0) {
      fraction /= 10;
      digits--;
    }
    fmt::format_to(std::back_inserter(out), ".{:0{}}", fraction, digits);
  }
}

ParseError Duration::parse(std::string_view text, Duration& value) {
  const auto fail = [text](ParseError::Reason reason) {
    return ParseError{.reason = reason, .input = std::string(text)};
  };

  value = {};

  auto s = text;
  bool negative = false;

  if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
    negative = s[0] == '-';
    s.remove_prefix(1);
  }

  // Special case: a lone zero needs no unit.
  if (s == "0") {
    return {};
  }
  if (s.empty()) {
    return fail(text.empty() ? ParseError::Reason::Empty : ParseError::Reason::InvalidSyntax);
  }

  uint64_t total = 0;

  while (!s.empty()) {
    if (!(s[0] == '.' || is_digit(s[0]))) {
      return fail(ParseError::Reason::InvalidSyntax);
    }

    uint64_t integer = 0;
    const auto before_integer = s.size();
    if (!consume_integer(s, integer)) {
      return fail(ParseError::Reason::Overflow);
    }
    const bool has_integer = before_integer != s.size();

    uint64_t fraction = 0;
    double scale = 1.0;
    bool has_fraction = false;

    if (!s.empty() && s[0] == '.') {
      s.remove_prefix(1);

      const auto before_fraction = s.size();
      consume_fraction(s, fraction, scale);
      has_fraction = before_fraction != s.size();
    }

    // ".s" or "." alone.
    if (!has_integer && !has_fraction) {
      return fail(ParseError::Reason::InvalidSyntax);
    }

    size_t unit_length = 0;
    while (unit_length < s.size() && s[unit_length] != '.' && !is_digit(s[unit_length])) {
      unit_length++;
    }
    if (unit_length == 0) {
      return fail(ParseError::Reason::MissingUnit);
    }

    const auto unit_name = s.substr(0, unit_length);
    const auto unit = find_unit(unit_name);
    if (!unit) {
      auto error = fail(ParseError::Reason::UnknownUnit);
      error.unit = std::string(unit_name);
      return error;
    }
    s.remove_prefix(unit_length);

    if (integer > max_magnitude / unit->nanoseconds) {
      return fail(ParseError::Reason::Overflow);
    }
    integer *= unit->nanoseconds;

    if (fraction > 0) {
      integer += uint64_t(double(fraction) * (double(unit->nanoseconds) / scale));
      if (integer > max_magnitude) {
        return fail(ParseError::Reason::Overflow);
      }
    }

    total += integer;
    if (total > max_magnitude) {
      return fail(ParseError::Reason::Overflow);
    }
  }

  if (negative) {
    value = Duration(int64_t(0 - total));
    return {};
  }

  if (total > max_magnitude - 1) {
    return fail(ParseError::Reason::Overflow);
  }

  value = Duration(int64_t(total));
  return {};
}

std::string Duration::to_string() const {
  if (nano == 0) {
    return "0s";
  }

  std::string out;

  const bool negative = nano < 0;
  auto magnitude = uint64_t(nano);
  if (negative) {
    magnitude = 0 - magnitude;
    out.push_back('-');
  }

  if (magnitude < uint64_t(second)) {
    // Below one second a single unit is used, with a fractional part.
    if (magnitude < uint64_t(microsecond)) {
      append_with_fraction(out, magnitude, 0);
      out += "ns";
    } else if (magnitude < uint64_t(millisecond)) {
      append_with_fraction(out, magnitude, 3);
      out += "\xc2\xb5s";
    } else {
      append_with_fraction(out, magnitude, 6);
      out += "ms";
    }

    return out;
  }

  const auto whole_seconds = magnitude / uint64_t(second);
  const auto hours = whole_seconds / 3600;
  const auto minutes = (whole_seconds / 60) % 60;

  if (hours > 0) {
    fmt::format_to(std::back_inserter(out), "{}h", hours);
  }
  if (whole_seconds >= 60) {
    fmt::format_to(std::back_inserter(out), "{}m", minutes);
  }

  append_with_fraction(out, magnitude % uint64_t(minute), 9);
  out.push_back('s');

  return out;
}
