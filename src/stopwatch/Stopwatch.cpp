#include "Stopwatch.hpp"
#include "LogSink.hpp"
#include "TimerService.hpp"

#include <base/Error.hpp>
#include <base/Print.hpp>

using namespace stopwatch;

Stopwatch::Stopwatch() : Stopwatch(SystemClock::instance(), BaseLogSink::instance()) {}

Stopwatch::Stopwatch(const Clock& clock) : Stopwatch(clock, BaseLogSink::instance()) {}

Stopwatch::Stopwatch(const Clock& clock, LogSink& log_sink) : clock(&clock), log_sink(&log_sink) {}

Stopwatch Stopwatch::started() {
  return started(SystemClock::instance(), BaseLogSink::instance());
}

Stopwatch Stopwatch::started(const Clock& clock, LogSink& log_sink) {
  Stopwatch stopwatch{clock, log_sink};
  stopwatch.begin_session(clock.now());
  return stopwatch;
}

Stopwatch Stopwatch::after(Duration delay) {
  return after(delay, TimerService::shared(), SystemClock::instance(), BaseLogSink::instance());
}

Stopwatch Stopwatch::after(Duration delay,
                           TimerService& timer_service,
                           const Clock& clock,
                           LogSink& log_sink) {
  Stopwatch stopwatch{clock, log_sink};

  const auto block = std::make_shared<PendingStart>();
  block->clock = &clock;
  stopwatch.pending_start = std::make_shared<PendingStartOwner>(block);

  // The callback only touches the shared block, never the stopwatch.
  timer_service.schedule(delay, [block] {
    std::unique_lock lock(block->mutex);
    if (!block->clock) {
      return;
    }

    block->fired_at.store(block->clock->now().unix_nanoseconds(), std::memory_order::release);
  });

  return stopwatch;
}

Stopwatch::PendingStartOwner::PendingStartOwner(std::shared_ptr<PendingStart> block)
    : block(std::move(block)) {}

Stopwatch::PendingStartOwner::~PendingStartOwner() {
  std::unique_lock lock(block->mutex);
  block->clock = nullptr;
}

Instant Stopwatch::pending_start_instant() const {
  if (!pending_start) {
    return {};
  }
  return Instant::from_unix_nanoseconds(
    pending_start->block->fired_at.load(std::memory_order::acquire));
}

void Stopwatch::settle_pending_start() {
  const auto fired_at = pending_start_instant();
  if (fired_at.is_zero()) {
    return;
  }

  pending_start.reset();
  if (state.is<Reset>()) {
    begin_session(fired_at);
  }
}

void Stopwatch::begin_session(Instant now) {
  state = State(Running{.start = now, .last_lap = now, .laps = {}});
}

Stopwatch::StateId Stopwatch::state_id() const {
  if (state.is<Reset>() && !pending_start_instant().is_zero()) {
    return StateId::Running;
  }
  return state.id();
}

Duration Stopwatch::elapsed_time() const {
  if (const auto stopped = state.as<Stopped>()) {
    return stopped->stop - stopped->start;
  }

  if (const auto running = state.as<Running>()) {
    return clock->now() - running->start;
  }

  const auto fired_at = pending_start_instant();
  if (!fired_at.is_zero()) {
    return clock->now() - fired_at;
  }

  return Duration::zero();
}

void Stopwatch::start() {
  settle_pending_start();

  const auto now = clock->now();

  if (state.is<Reset>()) {
    pending_start.reset();
    begin_session(now);
  } else if (const auto stopped = state.as<Stopped>()) {
    // Shift the start by the stopped interval so it isn't counted.
    state = State(Running{
      .start = stopped->start + (now - stopped->stop),
      .last_lap = stopped->last_lap,
      .laps = std::move(stopped->laps),
    });
  }
}

void Stopwatch::stop() {
  settle_pending_start();

  const auto now = clock->now();

  if (const auto running = state.as<Running>()) {
    state = State(Stopped{
      .start = running->start,
      .stop = now,
      .last_lap = running->last_lap,
      .laps = std::move(running->laps),
    });
  } else if (const auto stopped = state.as<Stopped>()) {
    stopped->stop = now;
  }
}

void Stopwatch::reset() {
  pending_start.reset();
  state = State(Reset{});
}

Duration Stopwatch::lap() {
  settle_pending_start();

  const auto running = state.as<Running>();
  if (!running) {
    return Duration::zero();
  }

  const auto now = clock->now();
  const auto lap = now - running->last_lap;

  running->last_lap = now;
  running->laps.push_back(lap);

  return lap;
}

const std::vector<Duration>& Stopwatch::laps() const {
  static const std::vector<Duration> no_laps;

  if (const auto running = state.as<Running>()) {
    return running->laps;
  }
  if (const auto stopped = state.as<Stopped>()) {
    return stopped->laps;
  }

  return no_laps;
}

std::string Stopwatch::to_string() const {
  Instant start;

  if (const auto running = state.as<Running>()) {
    start = running->start;
  } else if (const auto stopped = state.as<Stopped>()) {
    start = stopped->start;
  } else {
    start = pending_start_instant();
  }

  return base::format("[start: {} current: {} elapsed: {}]", start, clock->now(), elapsed_time());
}

void Stopwatch::print(std::string_view label) const {
  base::println("{} - elapsed: {}", label, elapsed_time());
}

void Stopwatch::log(std::string_view label) const {
  log_sink->write(base::format("{} - elapsed: {}", label, elapsed_time()));
}

std::string Stopwatch::marshal_json() const {
  return base::format("\"{}\"", elapsed_time());
}

ParseError Stopwatch::unmarshal_json(std::string_view data) {
  std::string unquoted;
  unquoted.reserve(data.size());

  for (const auto c : data) {
    if (c != '"') {
      unquoted.push_back(c);
    }
  }

  Duration elapsed;
  if (auto error = Duration::parse(unquoted, elapsed); error.failed()) {
    return error;
  }

  const auto now = clock->now();

  Instant start;
  if (!now.checked_sub(elapsed, start)) {
    return ParseError{.reason = ParseError::Reason::Overflow, .input = std::move(unquoted)};
  }

  settle_pending_start();
  pending_start.reset();

  if (const auto running = state.as<Running>()) {
    running->start = start;
  } else if (const auto stopped = state.as<Stopped>()) {
    state = State(Running{
      .start = start,
      .last_lap = stopped->last_lap,
      .laps = std::move(stopped->laps),
    });
  } else {
    state = State(Running{.start = start, .last_lap = now, .laps = {}});
  }

  verify(state.is<Running>(), "stopwatch is not running after unmarshalling");
  return {};
}
