#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

#include "core/types.hpp"

namespace rules_timing {

using hub_rules::Duration;
using hub_rules::TimePoint;

using TimerHandle = uint64_t;
using TimerCallback = std::function<void()>;

constexpr TimerHandle kInvalidTimer = 0;

// Single-shot delayed callbacks. Purely in-memory: nothing survives a
// restart, owners re-arm their own timers.
//
// Implementations must allow cancel() from any thread, including from inside
// another timer's callback, and must never invoke a callback while holding a
// lock that cancel() or schedule_at() also takes.
class TimerService {
public:
  virtual ~TimerService() = default;

  // Current time of the clock this service schedules against
  virtual TimePoint now() const = 0;

  // Run callback once at deadline (immediately if already past).
  // Throws hub_rules::TimerError if the timer cannot be scheduled.
  virtual TimerHandle schedule_at(TimePoint deadline,
                                  TimerCallback callback) = 0;

  // No-op for handles that already fired, were cancelled, or are unknown.
  // Returns true if a pending timer was removed.
  virtual bool cancel(TimerHandle handle) = 0;

  virtual size_t pending_count() const = 0;

  TimerHandle schedule(Duration delay, TimerCallback callback) {
    return schedule_at(now() + delay, std::move(callback));
  }
};

} // namespace rules_timing
