#include "rules/rule_task.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "core/errors.hpp"

namespace rules_exec {

RuleTask::RuleTask(std::string name) : name_(std::move(name)) {}

RuleTask::~RuleTask() {
  cancel();
  if (thread_.joinable() && on_task_thread()) {
    thread_.detach();
    return;
  }
  join();
}

void RuleTask::start(std::function<void(RuleTask &)> body) {
  if (thread_.joinable()) {
    throw hub_rules::Error("Rule task '" + name_ + "' already started");
  }
  running_ = true;
  // The thread keeps the task alive until the body returns
  auto self = shared_from_this();
  thread_ = std::thread([this, self, body = std::move(body)]() {
    try {
      body(*this);
    } catch (const hub_rules::TaskCancelled &) {
      // normal shutdown path
    } catch (const std::exception &e) {
      std::cerr << "[RuleTask] Rule '" << name_
                << "' stopped on unhandled error: " << e.what() << std::endl;
    }
    running_ = false;
  });
}

void RuleTask::cancel() {
  if (cancelled_.exchange(true)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (promise_) {
    promise_->set_exception(std::make_exception_ptr(hub_rules::TaskCancelled()));
    promise_.reset();
  }
}

void RuleTask::join() {
  if (!thread_.joinable()) {
    return;
  }
  if (on_task_thread()) {
    return;
  }
  thread_.join();
}

bool RuleTask::running() const { return running_.load(); }

bool RuleTask::on_task_thread() const {
  return thread_.get_id() == std::this_thread::get_id();
}

void RuleTask::throw_if_cancelled() const {
  if (cancelled_.load()) {
    throw hub_rules::TaskCancelled();
  }
}

PendingWait RuleTask::begin_wait() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_.load()) {
    throw hub_rules::TaskCancelled();
  }
  PendingWait wait;
  wait.id = ++current_wait_;
  promise_.emplace();
  wait.result = promise_->get_future();
  return wait;
}

void RuleTask::resolve(uint64_t id, WaitOutcome outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!promise_ || id != current_wait_) {
    return;
  }
  promise_->set_value(outcome);
  promise_.reset();
}

std::function<void()> RuleTask::resolver(uint64_t id, WaitOutcome outcome) {
  std::weak_ptr<RuleTask> weak = shared_from_this();
  return [weak, id, outcome]() {
    if (auto task = weak.lock()) {
      task->resolve(id, outcome);
    }
  };
}

WaitOutcome RuleTask::await(PendingWait &wait) {
  const WaitOutcome outcome = wait.result.get();
  throw_if_cancelled();
  return outcome;
}

} // namespace rules_exec
