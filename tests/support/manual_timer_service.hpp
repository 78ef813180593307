#pragma once

#include <condition_variable>
#include <map>
#include <mutex>
#include <utility>

#include "timing/timer_service.hpp"

namespace rules_testing {

using hub_rules::Duration;
using hub_rules::TimePoint;
using rules_timing::TimerCallback;
using rules_timing::TimerHandle;

/**
 * @brief Virtual-clock timer service for deterministic tests.
 *
 * Time only moves through advance()/advance_to(). Due timers run on the
 * calling thread in deadline order, each with the clock set to its deadline
 * and with the internal mutex released.
 */
class ManualTimerService : public rules_timing::TimerService {
public:
  explicit ManualTimerService(TimePoint start = default_start());

  // 2030-01-01 00:00:00 UTC
  static TimePoint default_start();

  TimePoint now() const override;
  TimerHandle schedule_at(TimePoint deadline, TimerCallback callback) override;
  bool cancel(TimerHandle handle) override;
  size_t pending_count() const override;

  // Move the clock forward, firing everything due on the way
  void advance(Duration delta);
  void advance_to(TimePoint target);

  // Block until at least `count` timers are pending (rule threads arm their
  // waits asynchronously). Returns false on real-time timeout.
  bool wait_for_pending(size_t count,
                        std::chrono::milliseconds real_timeout =
                            std::chrono::milliseconds(2000)) const;

  // Deadline of the earliest pending timer; now() when none
  TimePoint next_deadline() const;

private:
  TimePoint now_;
  std::map<std::pair<TimePoint, TimerHandle>, TimerCallback> queue_;
  std::map<TimerHandle, TimePoint> deadlines_;
  TimerHandle next_handle_ = 1;

  mutable std::mutex mutex_;
  mutable std::condition_variable changed_;
};

} // namespace rules_testing
