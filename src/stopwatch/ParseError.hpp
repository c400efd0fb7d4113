#pragma once
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace stopwatch {

struct ParseError {
  enum class Reason {
    None,
    Empty,
    InvalidSyntax,
    MissingUnit,
    UnknownUnit,
    Overflow,
  };
  Reason reason{};
  std::string input{};
  // Set for UnknownUnit.
  std::string unit{};

  bool failed() const { return reason != Reason::None; }
};

namespace detail {

std::string_view parse_error_reason_representation(ParseError::Reason reason);

}

}  // namespace stopwatch

template <>
struct fmt::formatter<stopwatch::ParseError::Reason> : formatter<std::string_view> {
  auto format(const stopwatch::ParseError::Reason& reason, format_context& ctx) const {
    return formatter<string_view>::format(
      stopwatch::detail::parse_error_reason_representation(reason), ctx);
  }
};

template <>
struct fmt::formatter<stopwatch::ParseError> : formatter<std::string_view> {
  auto format(const stopwatch::ParseError& error, format_context& ctx) const {
    if (!error.failed()) {
      return formatter<string_view>::format("no error", ctx);
    }
    if (error.reason == stopwatch::ParseError::Reason::UnknownUnit) {
      return fmt::format_to(ctx.out(), "time: unknown unit \"{}\" in duration \"{}\"", error.unit,
                            error.input);
    }
    return fmt::format_to(ctx.out(), "time: {} \"{}\"", error.reason, error.input);
  }
};
