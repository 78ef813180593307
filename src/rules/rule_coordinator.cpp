#include "rules/rule_coordinator.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace rules_exec {

using hub_rules::ScriptError;
using hub_rules::TaskCancelled;
using rules_audit::AuditKind;

// Shortest sleep of a scheduled rule, so a timer that keeps answering with
// past times cannot spin the task
static const Duration kMinimumScheduleDelay = std::chrono::milliseconds(1);

const char *to_string(RuleKind kind) {
  switch (kind) {
  case RuleKind::Condition:
    return "condition";
  case RuleKind::Scheduled:
    return "scheduled";
  }
  return "unknown";
}

RuleKind parse_rule_kind(const std::string &text) {
  if (text == "condition") {
    return RuleKind::Condition;
  }
  if (text == "scheduled") {
    return RuleKind::Scheduled;
  }
  throw std::invalid_argument("Invalid rule kind: '" + text +
                              "'. Valid values: condition, scheduled");
}

// Script failures surface as ScriptError whatever raised them
static ScriptError normalize(const std::exception &error) {
  if (auto script = dynamic_cast<const ScriptError *>(&error)) {
    return *script;
  }
  if (dynamic_cast<const hub_rules::DeviceCommunicationError *>(&error)) {
    return ScriptError(std::string("device communication failed: ") +
                       error.what());
  }
  return ScriptError(error.what());
}

RuleCoordinator::RuleCoordinator(RuleServices services, ScriptEngine &scripts,
                                 CoordinatorOptions options)
    : services_(services), scripts_(scripts), options_(options) {}

RuleCoordinator::~RuleCoordinator() {
  try {
    shutdown();
  } catch (const ScriptError &e) {
    std::cerr << "[RuleCoordinator] Shutdown failed: " << e.what()
              << std::endl;
  }
}

RuleCoordinator::Compiled RuleCoordinator::compile(const RuleRecord &record) {
  Compiled compiled;
  if (record.kind == RuleKind::Condition) {
    compiled.trigger = scripts_.compile_trigger(record.trigger);
  } else {
    compiled.timer = scripts_.compile_timer(record.trigger);
  }
  compiled.action = scripts_.compile_action(record.action);
  return compiled;
}

void RuleCoordinator::install_rule(const RuleRecord &record) {
  if (record.name.empty()) {
    throw ScriptError("Rule name must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (rules_.count(record.name) > 0) {
    throw hub_rules::DuplicateError("Rule '" + record.name +
                                    "' is already installed");
  }

  Compiled compiled;
  try {
    compiled = compile(record);
  } catch (const ScriptError &e) {
    throw ScriptError("Rule '" + record.name + "' rejected: " + e.what());
  }

  Entry entry;
  entry.record = record;
  entry.task = std::make_shared<RuleTask>(record.name);
  entry.counters = std::make_shared<Counters>();

  auto counters = entry.counters;
  entry.task->start([this, record, compiled, counters](RuleTask &task) {
    if (record.kind == RuleKind::Condition) {
      run_condition_rule(task, record, compiled, *counters);
    } else {
      run_scheduled_rule(task, record, compiled, *counters);
    }
  });
  rules_.emplace(record.name, std::move(entry));

  services_.audit.record({AuditKind::RuleInstalled,
                          ExecutionContext{record.name, "", ""},
                          to_string(record.kind), true});
  std::cerr << "[RuleCoordinator] Installed " << to_string(record.kind)
            << " rule '" << record.name << "'" << std::endl;
}

void RuleCoordinator::uninstall_rule(const std::string &name) {
  Entry entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(name);
    if (it == rules_.end()) {
      throw hub_rules::NotFoundError("Rule '" + name + "' is not installed");
    }
    // Its own thread could not be joined and would outlive the coordinator
    if (it->second.task->on_task_thread()) {
      throw ScriptError("Rule '" + name + "' cannot uninstall itself");
    }
    entry = std::move(it->second);
    rules_.erase(it);
  }
  stop_entry(entry);
}

void RuleCoordinator::shutdown() {
  std::map<std::string, Entry> stopping;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &kv : rules_) {
      if (kv.second.task->on_task_thread()) {
        throw ScriptError("Rule '" + kv.first +
                          "' cannot shut down its own coordinator");
      }
    }
    stopping.swap(rules_);
  }

  // Cancel everything first so the joins overlap
  for (auto &kv : stopping) {
    kv.second.task->cancel();
  }
  for (auto &kv : stopping) {
    stop_entry(kv.second);
  }
}

void RuleCoordinator::stop_entry(Entry &entry) {
  entry.task->cancel();
  entry.task->join();

  services_.audit.record({AuditKind::RuleUninstalled,
                          ExecutionContext{entry.record.name, "", ""}, "",
                          true});
  std::cerr << "[RuleCoordinator] Uninstalled rule '" << entry.record.name
            << "'" << std::endl;
}

std::vector<RuleStatus> RuleCoordinator::list_rules() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RuleStatus> out;
  out.reserve(rules_.size());
  for (const auto &kv : rules_) {
    RuleStatus status;
    status.record = kv.second.record;
    status.active = kv.second.task->running();
    status.actions_run = kv.second.counters->actions_run.load();
    status.failures = kv.second.counters->failures.load();
    out.push_back(status);
  }
  return out;
}

bool RuleCoordinator::is_installed(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rules_.count(name) > 0;
}

void RuleCoordinator::set_failure_handler(FailureHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_handler_ = std::move(handler);
}

void RuleCoordinator::run_condition_rule(RuleTask &task,
                                         const RuleRecord &record,
                                         const Compiled &scripts,
                                         Counters &counters) {
  const auto self = task.shared_from_this();
  // Set once the trigger fired; a condition still holding after the action
  // then waits for its next rising edge instead of firing again
  bool edge_only = false;
  for (;;) {
    task.throw_if_cancelled();
    RuleContext ctx(services_, self, ExecutionContext{record.name, "", ""});

    Trigger trigger;
    WaitOutcome outcome = WaitOutcome::TimedOut;
    try {
      trigger = scripts.trigger->invoke(ctx);
      if (!trigger.condition) {
        throw ScriptError("trigger returned no condition");
      }
      outcome = ctx.await_trigger(trigger, edge_only);
    } catch (const TaskCancelled &) {
      throw;
    } catch (const std::exception &e) {
      report_failure(ctx, "trigger", e, counters);
      ctx.wait(options_.retry_backoff);
      continue;
    }

    if (outcome == WaitOutcome::TimedOut) {
      ctx.audit(AuditKind::ConditionTimedOut, trigger.condition->describe());
      continue;
    }
    ctx.audit(AuditKind::TriggerFired, trigger.condition->describe());
    edge_only = true;
    run_action(ctx, *scripts.action, counters);
  }
}

void RuleCoordinator::run_scheduled_rule(RuleTask &task,
                                         const RuleRecord &record,
                                         const Compiled &scripts,
                                         Counters &counters) {
  const auto self = task.shared_from_this();
  for (;;) {
    task.throw_if_cancelled();
    RuleContext ctx(services_, self, ExecutionContext{record.name, "", ""});

    TimePoint next;
    try {
      next = scripts.timer->invoke(ctx);
    } catch (const TaskCancelled &) {
      throw;
    } catch (const std::exception &e) {
      report_failure(ctx, "timer", e, counters);
      ctx.wait(options_.retry_backoff);
      continue;
    }

    // A time already in the past runs after the minimum delay
    const TimePoint now = ctx.now();
    Duration delay = kMinimumScheduleDelay;
    if (next > now) {
      delay = std::max(delay, std::chrono::ceil<Duration>(next - now));
    }
    ctx.wait(delay);

    ctx.audit(AuditKind::TriggerFired, "scheduled");
    run_action(ctx, *scripts.action, counters);
  }
}

void RuleCoordinator::run_action(RuleContext &ctx, const ActionScript &action,
                                 Counters &counters) {
  ctx.audit(AuditKind::ActionStarted, "");
  try {
    action.invoke(ctx);
  } catch (const TaskCancelled &) {
    throw;
  } catch (const std::exception &e) {
    report_failure(ctx, "action", e, counters);
    return;
  }
  counters.actions_run++;
  ctx.audit(AuditKind::ActionCompleted, "");
}

void RuleCoordinator::report_failure(const RuleContext &ctx,
                                     const std::string &stage,
                                     const std::exception &error,
                                     Counters &counters) {
  const ScriptError failure = normalize(error);
  counters.failures++;

  std::cerr << "[RuleCoordinator] Rule '" << ctx.context().rule_name << "' "
            << stage << " failed: " << failure.what() << std::endl;
  ctx.audit(AuditKind::ActionFailed, stage + ": " + failure.what(), false);

  FailureHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = failure_handler_;
  }
  if (handler) {
    handler(ctx.context(), failure);
  }
}

} // namespace rules_exec
