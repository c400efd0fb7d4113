#include "TimerService.hpp"

#include <base/Error.hpp>
#include <base/Log.hpp>

using namespace stopwatch;

TimerService::TimerService() {
  worker = std::thread([this] { run(); });
}

TimerService::~TimerService() {
  {
    std::unique_lock lock(mutex);

    requested_exit = true;
    if (!callbacks.empty()) {
      log_debug("timer service is dropping {} pending callback(s)", callbacks.size());
      callbacks.clear();
    }

    cv.notify_all();
  }

  worker.join();
}

TimerService& TimerService::shared() {
  static TimerService service;
  return service;
}

void TimerService::schedule(Duration delay, std::function<void()> callback) {
  verify(callback != nullptr, "cannot schedule an empty timer callback");

  if (delay < Duration::zero()) {
    delay = Duration::zero();
  }

  const auto deadline =
    std::chrono::steady_clock::now() + std::chrono::nanoseconds(delay.nanoseconds());

  std::unique_lock lock(mutex);
  verify(!requested_exit, "cannot schedule a callback on a stopped timer service");

  callbacks.emplace(deadline, std::move(callback));
  cv.notify_one();
}

size_t TimerService::pending() const {
  std::unique_lock lock(mutex);
  return callbacks.size();
}

void TimerService::run() {
  std::unique_lock lock(mutex);

  while (!requested_exit) {
    if (callbacks.empty()) {
      cv.wait(lock, [this] { return requested_exit || !callbacks.empty(); });
      continue;
    }

    const auto deadline = callbacks.begin()->first;
    if (std::chrono::steady_clock::now() < deadline) {
      cv.wait_until(lock, deadline);
      continue;
    }

    auto callback = std::move(callbacks.begin()->second);
    callbacks.erase(callbacks.begin());

    lock.unlock();
    callback();
    lock.lock();
  }
}
