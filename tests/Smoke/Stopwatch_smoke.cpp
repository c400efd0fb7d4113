#include <stopwatch/Stopwatch.hpp>

#include "../TestSupport.hpp"

using namespace stopwatch;

static Duration ms(int64_t value) {
  return Duration::from_milliseconds(value);
}

int run_stopwatch_state_smoke() {
  testing::ManualClock clock;
  testing::CapturingLogSink sink;

  Stopwatch stopwatch{clock, sink};
  if (!stopwatch.is_reset() || stopwatch.elapsed_time() != Duration::zero()) {
    return 1;
  }

  // Time passing doesn't matter before the first start.
  clock.advance(ms(500));
  if (stopwatch.elapsed_time() != Duration::zero()) {
    return 2;
  }

  // Stopping a reset stopwatch does nothing.
  stopwatch.stop();
  if (!stopwatch.is_reset()) {
    return 3;
  }

  stopwatch.start();
  clock.advance(ms(100));
  if (!stopwatch.is_running() || stopwatch.elapsed_time() != ms(100)) {
    return 4;
  }

  // Starting a running stopwatch keeps the original start.
  stopwatch.start();
  clock.advance(ms(10));
  if (stopwatch.elapsed_time() != ms(110)) {
    return 5;
  }

  stopwatch.stop();
  clock.advance(ms(1000));
  if (!stopwatch.is_stopped() || stopwatch.elapsed_time() != ms(110)) {
    return 6;
  }

  // Resuming doesn't count the stopped interval.
  stopwatch.start();
  clock.advance(ms(40));
  if (!stopwatch.is_running() || stopwatch.elapsed_time() != ms(150)) {
    return 7;
  }

  // The latest stop wins.
  stopwatch.stop();
  clock.advance(ms(50));
  stopwatch.stop();
  if (stopwatch.elapsed_time() != ms(200)) {
    return 8;
  }

  stopwatch.reset();
  if (!stopwatch.is_reset() || stopwatch.elapsed_time() != Duration::zero() ||
      !stopwatch.laps().empty()) {
    return 9;
  }

  // A reset stopwatch starts a fresh session.
  clock.advance(ms(300));
  stopwatch.start();
  clock.advance(ms(20));
  if (stopwatch.elapsed_time() != ms(20)) {
    return 10;
  }

  const auto running = Stopwatch::started(clock, sink);
  clock.advance(ms(5));
  if (!running.is_running() || running.elapsed_time() != ms(5)) {
    return 11;
  }

  return 0;
}

int run_stopwatch_lap_smoke() {
  testing::ManualClock clock;
  testing::CapturingLogSink sink;

  Stopwatch stopwatch{clock, sink};

  // No laps unless running.
  if (stopwatch.lap() != Duration::zero() || !stopwatch.laps().empty()) {
    return 1;
  }

  stopwatch.start();
  clock.advance(ms(100));
  if (stopwatch.lap() != ms(100)) {
    return 2;
  }

  clock.advance(ms(150));
  if (stopwatch.lap() != ms(150)) {
    return 3;
  }

  const std::vector<Duration> expected{ms(100), ms(150)};
  if (stopwatch.laps() != expected) {
    return 4;
  }

  clock.advance(ms(50));
  stopwatch.stop();
  if (stopwatch.elapsed_time() != ms(300)) {
    return 5;
  }

  clock.advance(ms(200));
  if (stopwatch.elapsed_time() != ms(300)) {
    return 6;
  }

  if (stopwatch.lap() != Duration::zero() || stopwatch.laps() != expected) {
    return 7;
  }

  // The first lap after resuming spans the stopped interval.
  stopwatch.start();
  clock.advance(ms(10));
  if (stopwatch.lap() != ms(260) || stopwatch.laps().size() != 3) {
    return 8;
  }

  stopwatch.reset();
  if (!stopwatch.laps().empty() || stopwatch.lap() != Duration::zero()) {
    return 9;
  }

  return 0;
}

int run_stopwatch_copy_smoke() {
  testing::ManualClock clock;
  testing::CapturingLogSink sink;

  auto original = Stopwatch::started(clock, sink);
  clock.advance(ms(30));
  (void)original.lap();

  const auto copy = original;
  original.reset();

  if (!copy.is_running() || copy.elapsed_time() != ms(30) || copy.laps().size() != 1) {
    return 1;
  }

  auto moved = std::move(original);
  if (!moved.is_reset()) {
    return 2;
  }

  moved = copy;
  clock.advance(ms(10));
  if (moved.elapsed_time() != ms(40) || moved.laps().size() != 1) {
    return 3;
  }

  return 0;
}
