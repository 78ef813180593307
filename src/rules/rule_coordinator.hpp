#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "rules/rule_context.hpp"

namespace rules_exec {

enum class RuleKind { Condition, Scheduled };

const char *to_string(RuleKind kind);

// Throws std::invalid_argument for anything but "condition"/"scheduled"
RuleKind parse_rule_kind(const std::string &text);

// Stored rule definition. For scheduled rules `trigger` holds the timer text.
struct RuleRecord {
  std::string name;
  RuleKind kind = RuleKind::Condition;
  std::string trigger;
  std::string action;
};

struct RuleStatus {
  RuleRecord record;
  bool active = false;
  uint64_t actions_run = 0;
  uint64_t failures = 0;
};

struct CoordinatorOptions {
  // Delay before re-invoking a trigger or timer script that raised
  Duration retry_backoff = std::chrono::seconds(1);
};

// Receives every normalized script failure (after it was logged)
using FailureHandler = std::function<void(const ExecutionContext &,
                                          const hub_rules::ScriptError &)>;

/**
 * @brief Installs rules and runs each one as its own task.
 *
 * Condition rules loop: invoke the trigger, register the tree, suspend until
 * it fires or times out, run the action on fire, re-arm. Scheduled rules
 * loop: ask the timer script for the next time, sleep until then, run the
 * action, ask again relative to the actual wake-up time.
 *
 * A failing script ends only the current cycle: the error is normalized to
 * hub_rules::ScriptError, logged, audited and passed to the failure handler,
 * and the rule re-arms. Uninstalling cancels the task at its next suspension
 * point; an action that is between suspension points finishes its current
 * step first.
 */
class RuleCoordinator {
public:
  RuleCoordinator(RuleServices services, ScriptEngine &scripts,
                  CoordinatorOptions options = {});
  ~RuleCoordinator();

  RuleCoordinator(const RuleCoordinator &) = delete;
  RuleCoordinator &operator=(const RuleCoordinator &) = delete;

  // Compile and start. Throws hub_rules::ScriptError if a definition does
  // not compile and hub_rules::DuplicateError if the name is installed.
  void install_rule(const RuleRecord &record);

  // Cancel and join the rule's task. Throws hub_rules::NotFoundError, and
  // hub_rules::ScriptError when called from the rule's own task.
  void uninstall_rule(const std::string &name);

  std::vector<RuleStatus> list_rules() const;
  bool is_installed(const std::string &name) const;

  // Uninstall every rule. Throws hub_rules::ScriptError when called from a
  // rule's task; nothing is stopped then.
  void shutdown();

  void set_failure_handler(FailureHandler handler);

private:
  struct Compiled {
    std::shared_ptr<const TriggerScript> trigger;
    std::shared_ptr<const TimerScript> timer;
    std::shared_ptr<const ActionScript> action;
  };

  struct Counters {
    std::atomic<uint64_t> actions_run{0};
    std::atomic<uint64_t> failures{0};
  };

  struct Entry {
    RuleRecord record;
    std::shared_ptr<RuleTask> task;
    std::shared_ptr<Counters> counters;
  };

  Compiled compile(const RuleRecord &record);

  void run_condition_rule(RuleTask &task, const RuleRecord &record,
                          const Compiled &scripts, Counters &counters);
  void run_scheduled_rule(RuleTask &task, const RuleRecord &record,
                          const Compiled &scripts, Counters &counters);
  void run_action(RuleContext &ctx, const ActionScript &action,
                  Counters &counters);
  void report_failure(const RuleContext &ctx, const std::string &stage,
                      const std::exception &error, Counters &counters);

  void stop_entry(Entry &entry);

  RuleServices services_;
  ScriptEngine &scripts_;
  CoordinatorOptions options_;

  std::map<std::string, Entry> rules_;
  FailureHandler failure_handler_;
  mutable std::mutex mutex_;
};

} // namespace rules_exec
