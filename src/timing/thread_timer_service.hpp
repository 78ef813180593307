#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include "timing/timer_service.hpp"

namespace rules_timing {

/**
 * @brief Timer service backed by one dispatcher thread.
 *
 * Pending timers are kept ordered by deadline. The dispatcher sleeps until
 * the earliest deadline (or until a new earlier timer / cancel wakes it),
 * pops every due timer and runs the callbacks with the mutex released, so a
 * callback may schedule or cancel timers freely.
 *
 * Callbacks run serially on the dispatcher thread; a slow callback delays
 * the ones behind it but never blocks schedule() or cancel() callers.
 */
class ThreadTimerService : public TimerService {
public:
  static constexpr size_t kDefaultMaxPending = 65536;

  explicit ThreadTimerService(size_t max_pending = kDefaultMaxPending);
  ~ThreadTimerService() override;

  ThreadTimerService(const ThreadTimerService &) = delete;
  ThreadTimerService &operator=(const ThreadTimerService &) = delete;

  // Spawn the dispatcher thread. Idempotent.
  void start();

  // Drop all pending timers and join the dispatcher. Idempotent.
  // schedule_at() throws TimerError once stopped.
  void stop();

  TimePoint now() const override;
  TimerHandle schedule_at(TimePoint deadline, TimerCallback callback) override;
  bool cancel(TimerHandle handle) override;
  size_t pending_count() const override;

private:
  void run();

  const size_t max_pending_;

  // deadline-ordered queue; handle breaks ties in scheduling order
  std::map<std::pair<TimePoint, TimerHandle>, TimerCallback> queue_;
  std::map<TimerHandle, TimePoint> deadlines_;
  TimerHandle next_handle_ = 1;

  bool running_ = false;
  bool stopped_ = false;
  std::unique_ptr<std::thread> dispatcher_;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
};

} // namespace rules_timing
