#pragma once
#include <string>
#include <string_view>

#include <base/ClassTraits.hpp>

namespace stopwatch {

class Clock;

// Destination of Stopwatch::log(). Implementations must not throw; write
// failures are not reported back to the caller.
class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void write(std::string_view message) = 0;
};

// Forwards messages to the process log with a "2006/01/02 15:04:05" prefix.
class BaseLogSink : public LogSink {
  const Clock& clock;

 public:
  CLASS_NON_COPYABLE_NON_MOVABLE(BaseLogSink)

  explicit BaseLogSink(const Clock& clock);

  static BaseLogSink& instance();

  // "2006/01/02 15:04:05 <message>"
  std::string prefixed(std::string_view message) const;

  void write(std::string_view message) override;
};

}  // namespace stopwatch
