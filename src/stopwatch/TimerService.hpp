#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

#include <base/ClassTraits.hpp>

#include "Duration.hpp"

namespace stopwatch {

// Runs one-shot callbacks after a delay on a dedicated worker thread.
// Callbacks run outside of the internal lock, in deadline order (ties in
// scheduling order). Callbacks still pending on destruction are dropped.
class TimerService {
  using TimePoint = std::chrono::steady_clock::time_point;

  std::multimap<TimePoint, std::function<void()>> callbacks;
  bool requested_exit = false;

  mutable std::mutex mutex;
  std::condition_variable cv;

  std::thread worker;

  void run();

 public:
  CLASS_NON_COPYABLE_NON_MOVABLE(TimerService)

  TimerService();
  ~TimerService();

  static TimerService& shared();

  void schedule(Duration delay, std::function<void()> callback);

  size_t pending() const;
};

}  // namespace stopwatch
