#include <stopwatch/LogSink.hpp>
#include <stopwatch/Stopwatch.hpp>

#include "../TestSupport.hpp"

#include <cstdlib>
#include <ctime>

using namespace stopwatch;

int run_reporting_smoke() {
  setenv("TZ", "UTC", 1);
  tzset();

  testing::ManualClock clock;
  testing::CapturingLogSink sink;

  Stopwatch stopwatch{clock, sink};
  if (stopwatch.to_string() != "[start: Jan  1 00:00:00 current: Nov 14 22:13:20 elapsed: 0s]") {
    return 1;
  }

  stopwatch.start();
  clock.advance(Duration::from_seconds(2));
  if (stopwatch.to_string() !=
      "[start: Nov 14 22:13:20 current: Nov 14 22:13:22 elapsed: 2s]") {
    return 2;
  }
  if (fmt::format("{}", stopwatch) != stopwatch.to_string()) {
    return 3;
  }

  stopwatch.log("myFunction");
  clock.advance(Duration::from_milliseconds(500));
  stopwatch.log("myFunction");

  if (sink.messages.size() != 2 || sink.messages[0] != "myFunction - elapsed: 2s" ||
      sink.messages[1] != "myFunction - elapsed: 2.5s") {
    return 4;
  }

  // Goes to stdout, not to the log sink.
  testing::StdoutCapture capture;
  stopwatch.print("myFunction");
  const auto printed = capture.finish();

  if (printed != "myFunction - elapsed: 2.5s\n" || sink.messages.size() != 2) {
    return 5;
  }

  // The default sink prefixes the local time before handing off to the process log.
  testing::ManualClock log_clock;
  BaseLogSink log_sink{log_clock};
  if (log_sink.prefixed("explicit sink") != "2023/11/14 22:13:20 explicit sink") {
    return 6;
  }
  log_sink.write("explicit sink");

  log_clock.advance(Duration::from_hours(24 * 20) + Duration::from_seconds(7));
  if (log_sink.prefixed("later") != "2023/12/04 22:13:27 later") {
    return 7;
  }

  Stopwatch::started().log("default sink");

  return 0;
}
