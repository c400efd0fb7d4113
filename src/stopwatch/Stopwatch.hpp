#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <base/ClassTraits.hpp>
#include <base/SumType.hpp>

#include <fmt/format.h>

#include "Clock.hpp"
#include "Duration.hpp"
#include "ParseError.hpp"

namespace stopwatch {

class LogSink;
class TimerService;

// Measures elapsed wall-clock time. A stopwatch is either reset, running or
// stopped; stopping and starting again resumes the measurement without
// counting the stopped interval.
//
// Not thread-safe. The only asynchrony comes from Stopwatch::after(): the
// timer callback publishes the instant it fired and the stopwatch picks it up
// the next time it is used. Until then it reads as reset.
//
// The clock, log sink and timer service passed in must outlive the
// stopwatch.
class Stopwatch {
 public:
  enum class StateId {
    Reset,
    Running,
    Stopped,
  };

 private:
  struct Reset {
    static constexpr auto variant_id = StateId::Reset;
  };

  struct Running {
    static constexpr auto variant_id = StateId::Running;

    Instant start;
    Instant last_lap;
    std::vector<Duration> laps;
  };

  struct Stopped {
    static constexpr auto variant_id = StateId::Stopped;

    Instant start;
    Instant stop;
    Instant last_lap;
    std::vector<Duration> laps;
  };

  using State = base::SumType<Reset, Running, Stopped>;

  // Shared between a delayed stopwatch and its timer callback. `clock` is
  // cleared under the mutex once no stopwatch refers to the block anymore.
  struct PendingStart {
    std::mutex mutex;
    const Clock* clock = nullptr;
    std::atomic_int64_t fired_at{0};
  };

  struct PendingStartOwner {
    std::shared_ptr<PendingStart> block;

    CLASS_NON_COPYABLE_NON_MOVABLE(PendingStartOwner)

    explicit PendingStartOwner(std::shared_ptr<PendingStart> block);
    ~PendingStartOwner();
  };

  const Clock* clock;
  LogSink* log_sink;

  State state = Reset{};
  std::shared_ptr<PendingStartOwner> pending_start;

  Instant pending_start_instant() const;
  void settle_pending_start();
  void begin_session(Instant now);

 public:
  Stopwatch();
  explicit Stopwatch(const Clock& clock);
  Stopwatch(const Clock& clock, LogSink& log_sink);

  // Creates a stopwatch which is already running.
  static Stopwatch started();
  static Stopwatch started(const Clock& clock, LogSink& log_sink);

  // Creates a stopwatch which starts running once `delay` has passed.
  static Stopwatch after(Duration delay);
  static Stopwatch after(Duration delay,
                         TimerService& timer_service,
                         const Clock& clock,
                         LogSink& log_sink);

  StateId state_id() const;
  bool is_reset() const { return state_id() == StateId::Reset; }
  bool is_running() const { return state_id() == StateId::Running; }
  bool is_stopped() const { return state_id() == StateId::Stopped; }

  Duration elapsed_time() const;

  // Starts a new session when reset, resumes when stopped, does nothing when
  // already running.
  void start();

  // Freezes the elapsed time. Stopping an already stopped stopwatch moves
  // the stop point to now.
  void stop();

  void reset();

  // Records the time since the previous lap (or since the start) and returns
  // it. Returns zero without recording anything unless running.
  Duration lap();

  const std::vector<Duration>& laps() const;

  // "[start: Jan  2 15:04:05 current: Jan  2 15:04:07 elapsed: 2.000321s]"
  std::string to_string() const;

  // Writes "<label> - elapsed: <elapsed>" to stdout.
  void print(std::string_view label) const;

  // Writes "<label> - elapsed: <elapsed>" to the log sink.
  void log(std::string_view label) const;

  // Elapsed time as a quoted duration string, e.g. "\"72h3m0.5s\"".
  std::string marshal_json() const;

  // Accepts a (quoted) duration string and makes the stopwatch run with the
  // given elapsed time measured up to now. On failure nothing is modified.
  [[nodiscard]] ParseError unmarshal_json(std::string_view data);
};

}  // namespace stopwatch

template <>
struct fmt::formatter<stopwatch::Stopwatch> : formatter<std::string_view> {
  auto format(const stopwatch::Stopwatch& value, format_context& ctx) const {
    return formatter<string_view>::format(value.to_string(), ctx);
  }
};
