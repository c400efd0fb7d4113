#include "ParseError.hpp"

#include <base/Error.hpp>

using namespace stopwatch;

std::string_view detail::parse_error_reason_representation(ParseError::Reason reason) {
  using R = ParseError::Reason;

  switch (reason) {
      // clang-format off
    case R::None: return "none";
    case R::Empty: return "invalid duration";
    case R::InvalidSyntax: return "invalid duration";
    case R::MissingUnit: return "missing unit in duration";
    case R::UnknownUnit: return "unknown unit";
    case R::Overflow: return "invalid duration (overflow)";
      // clang-format on

    default:
      unreachable();
  }
}
