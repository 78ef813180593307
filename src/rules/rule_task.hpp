#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace rules_exec {

// How a suspended wait was resumed
enum class WaitOutcome { Fired, TimedOut };

// Handle for the one wait a task may have outstanding
struct PendingWait {
  uint64_t id = 0;
  std::future<WaitOutcome> result;
};

/**
 * @brief Thread of control for one installed rule.
 *
 * The body runs on a dedicated thread and suspends only by blocking on the
 * future returned from begin_wait(). The wait is resumed from any thread
 * through resolve(); cancel() resumes it with hub_rules::TaskCancelled.
 * Resolutions for a wait that is no longer current are ignored, so a late
 * timer or engine signal can never wake a later wait.
 *
 * Owners hold the task through a shared_ptr; signal callbacks keep a
 * weak_ptr so they outlive nothing.
 */
class RuleTask : public std::enable_shared_from_this<RuleTask> {
public:
  explicit RuleTask(std::string name);
  ~RuleTask();

  RuleTask(const RuleTask &) = delete;
  RuleTask &operator=(const RuleTask &) = delete;

  const std::string &name() const { return name_; }

  // Launch the body. TaskCancelled escaping the body ends the thread quietly.
  // The task must be owned by a shared_ptr.
  void start(std::function<void(RuleTask &)> body);

  // Request cancellation; a pending wait is resumed with TaskCancelled
  void cancel();

  // Wait for the body to return. No-op from the task's own thread.
  void join();

  bool cancelled() const { return cancelled_.load(); }
  bool running() const;

  // True when called from the body's own thread
  bool on_task_thread() const;

  // Throws hub_rules::TaskCancelled if cancel() was called
  void throw_if_cancelled() const;

  // Open a new wait, superseding any earlier one
  PendingWait begin_wait();

  // Complete wait `id` unless it already completed or was superseded
  void resolve(uint64_t id, WaitOutcome outcome);

  // Callback that resolves wait `id`; safe to run after the task is gone
  std::function<void()> resolver(uint64_t id, WaitOutcome outcome);

  // Block until the wait completes. Throws TaskCancelled when cancelled,
  // including when the wait completed in the same instant.
  WaitOutcome await(PendingWait &wait);

private:
  std::string name_;
  std::thread thread_;
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> running_{false};

  mutable std::mutex mutex_;
  uint64_t current_wait_ = 0;
  std::optional<std::promise<WaitOutcome>> promise_;
};

} // namespace rules_exec
