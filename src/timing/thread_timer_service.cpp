#include "timing/thread_timer_service.hpp"

#include <exception>
#include <iostream>
#include <vector>

#include "core/errors.hpp"

namespace rules_timing {

ThreadTimerService::ThreadTimerService(size_t max_pending)
    : max_pending_(max_pending) {}

ThreadTimerService::~ThreadTimerService() { stop(); }

void ThreadTimerService::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_ || stopped_) {
    return;
  }
  running_ = true;
  dispatcher_ = std::make_unique<std::thread>([this]() { run(); });
}

void ThreadTimerService::stop() {
  std::unique_ptr<std::thread> dispatcher;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
    running_ = false;
    queue_.clear();
    deadlines_.clear();
    dispatcher = std::move(dispatcher_);
  }
  wake_.notify_all();

  if (dispatcher && dispatcher->joinable()) {
    if (dispatcher->get_id() == std::this_thread::get_id()) {
      // stop() called from a timer callback; the loop exits on its own
      dispatcher->detach();
    } else {
      dispatcher->join();
    }
  }
}

TimePoint ThreadTimerService::now() const { return hub_rules::Clock::now(); }

TimerHandle ThreadTimerService::schedule_at(TimePoint deadline,
                                            TimerCallback callback) {
  TimerHandle handle = kInvalidTimer;
  bool earliest = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      throw hub_rules::TimerError("timer service is stopped");
    }
    if (deadlines_.size() >= max_pending_) {
      throw hub_rules::TimerError("too many pending timers (limit " +
                                  std::to_string(max_pending_) + ")");
    }

    handle = next_handle_++;
    queue_.emplace(std::make_pair(deadline, handle), std::move(callback));
    deadlines_.emplace(handle, deadline);
    earliest = queue_.begin()->first.second == handle;
  }

  if (earliest) {
    wake_.notify_all();
  }
  return handle;
}

bool ThreadTimerService::cancel(TimerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = deadlines_.find(handle);
  if (it == deadlines_.end()) {
    return false;
  }
  queue_.erase(std::make_pair(it->second, handle));
  deadlines_.erase(it);
  return true;
}

size_t ThreadTimerService::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deadlines_.size();
}

void ThreadTimerService::run() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (running_) {
    if (queue_.empty()) {
      wake_.wait(lock);
      continue;
    }

    const TimePoint next = queue_.begin()->first.first;
    if (hub_rules::Clock::now() < next) {
      wake_.wait_until(lock, next);
      continue;
    }

    // Collect everything due, then run it unlocked
    std::vector<TimerCallback> due;
    const TimePoint now = hub_rules::Clock::now();
    while (!queue_.empty() && queue_.begin()->first.first <= now) {
      auto it = queue_.begin();
      deadlines_.erase(it->first.second);
      due.push_back(std::move(it->second));
      queue_.erase(it);
    }

    lock.unlock();
    for (auto &callback : due) {
      try {
        callback();
      } catch (const std::exception &e) {
        std::cerr << "[ThreadTimerService] Timer callback failed: "
                  << e.what() << std::endl;
      }
    }
    lock.lock();
  }
}

} // namespace rules_timing
