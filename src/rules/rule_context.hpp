#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "audit/audit_sink.hpp"
#include "engine/rule_engine.hpp"
#include "hub/hub_client.hpp"
#include "rules/rule_task.hpp"
#include "rules/script_engine.hpp"
#include "scenes/scene_manager.hpp"
#include "timing/time_of_day.hpp"
#include "timing/timer_service.hpp"

namespace rules_exec {

using hub_rules::CompareOp;
using hub_rules::DeviceId;
using hub_rules::ExecutionContext;
using hub_rules::Value;
using hub_rules::ValueList;

// Collaborators shared by every rule of a coordinator
struct RuleServices {
  rules_engine::RuleEngine &engine;
  rules_hub::HubClient &hub;
  rules_scenes::SceneService &scenes;
  rules_timing::TimerService &timers;
  rules_audit::AuditSink &audit;
};

class RuleContext;

// One device attribute; comparisons build fresh condition leaves
class AttributeRef {
public:
  AttributeRef(DeviceId device_id, std::string attribute);

  const DeviceId &device_id() const { return device_id_; }
  const std::string &attribute() const { return attribute_; }

  ConditionNode::Ptr compare(CompareOp op, Value operand) const;
  ConditionNode::Ptr compare(CompareOp op, const AttributeRef &other) const;
  ConditionNode::Ptr on_change() const;

private:
  DeviceId device_id_;
  std::string attribute_;
};

class DeviceRef {
public:
  DeviceRef(RuleContext &ctx, DeviceId device_id);

  const DeviceId &id() const { return device_id_; }
  AttributeRef attribute(const std::string &name) const;

  // Current value through the hub
  Value value(const std::string &attribute) const;

  // Throws hub_rules::DeviceCommunicationError if the hub rejects it
  void command(const std::string &name, const ValueList &args = {}) const;

private:
  RuleContext &ctx_;
  DeviceId device_id_;
};

class SceneRef {
public:
  SceneRef(RuleContext &ctx, std::string name);

  const std::string &name() const { return name_; }

  // Throws hub_rules::ScriptError for an unknown scene
  ConditionNode::Ptr is_set() const;
  ConditionNode::Ptr on_change() const;

  rules_scenes::SceneApplyResult enable() const;

private:
  rules_scenes::Scene definition() const;

  RuleContext &ctx_;
  std::string name_;
};

/**
 * @brief Capabilities handed to one script invocation.
 *
 * Bundles the collaborators with the rule's execution context and its task.
 * Every wait is a suspension point of the task: it blocks the rule thread
 * until the timer or engine signal arrives, and throws
 * hub_rules::TaskCancelled once the rule is being uninstalled.
 */
class RuleContext {
public:
  RuleContext(RuleServices services, std::shared_ptr<RuleTask> task,
              ExecutionContext context);

  const ExecutionContext &context() const { return context_; }
  const RuleServices &services() const { return services_; }
  RuleTask &task() { return *task_; }

  DeviceRef device(const DeviceId &id);
  SceneRef scene(const std::string &name);

  static ConditionNode::Ptr all_of(std::vector<ConditionNode::Ptr> children);
  static ConditionNode::Ptr any_of(std::vector<ConditionNode::Ptr> children);
  static ConditionNode::Ptr is_not(ConditionNode::Ptr child);

  // Load current values into an unregistered tree
  void prime(const ConditionNode::Ptr &condition);

  // Evaluate once without registering anything
  bool check(const ConditionNode::Ptr &condition);

  void wait(Duration delay);

  // True once the condition holds (for for_duration when given), false on
  // timeout. A condition that already holds with no duration returns true
  // without suspending.
  bool wait_for(const ConditionNode::Ptr &condition,
                std::optional<Duration> timeout = std::nullopt,
                std::optional<Duration> for_duration = std::nullopt);

  // True when the attribute changes, false on timeout
  bool wait_for_change(const AttributeRef &attribute,
                       std::optional<Duration> timeout = std::nullopt);

  // Sleep until the next local occurrence of the time of day
  void wait_until(const rules_timing::TimeOfDay &time);

  // Register a rule trigger and suspend until it fires or times out. The
  // condition is primed under the engine lock. One that already holds fires
  // at once unless edge_only is set, in which case it waits for its next
  // rising edge.
  WaitOutcome await_trigger(const Trigger &trigger, bool edge_only = false);

  TimePoint now() const;

  void log(const std::string &message) const;
  void audit(rules_audit::AuditKind kind, const std::string &detail,
             bool success = true) const;

private:
  rules_engine::AttributeReader reader() const;

  WaitOutcome register_and_wait(const ConditionNode::Ptr &condition,
                                std::optional<Duration> timeout,
                                std::optional<Duration> for_duration,
                                bool edge_only);

  RuleServices services_;
  std::shared_ptr<RuleTask> task_;
  ExecutionContext context_;
};

} // namespace rules_exec
