#include "rules/rule_context.hpp"

#include <iostream>
#include <utility>

#include "conditions/attribute_conditions.hpp"
#include "conditions/boolean_conditions.hpp"
#include "conditions/scene_conditions.hpp"
#include "core/errors.hpp"

namespace rules_exec {

using rules_engine::AllOfCondition;
using rules_engine::AnyOfCondition;
using rules_engine::AttributeCondition;
using rules_engine::AttributeKey;
using rules_engine::ChangeCondition;
using rules_engine::DeviceComparisonCondition;
using rules_engine::NotCondition;
using rules_engine::SceneChangeCondition;
using rules_engine::SceneSetCondition;

// -----------------------------
// AttributeRef
// -----------------------------

AttributeRef::AttributeRef(DeviceId device_id, std::string attribute)
    : device_id_(std::move(device_id)), attribute_(std::move(attribute)) {}

ConditionNode::Ptr AttributeRef::compare(CompareOp op, Value operand) const {
  return std::make_shared<AttributeCondition>(device_id_, attribute_, op,
                                              std::move(operand));
}

ConditionNode::Ptr AttributeRef::compare(CompareOp op,
                                         const AttributeRef &other) const {
  return std::make_shared<DeviceComparisonCondition>(
      AttributeKey{device_id_, attribute_}, op,
      AttributeKey{other.device_id_, other.attribute_});
}

ConditionNode::Ptr AttributeRef::on_change() const {
  return std::make_shared<ChangeCondition>(device_id_, attribute_);
}

// -----------------------------
// DeviceRef
// -----------------------------

DeviceRef::DeviceRef(RuleContext &ctx, DeviceId device_id)
    : ctx_(ctx), device_id_(std::move(device_id)) {}

AttributeRef DeviceRef::attribute(const std::string &name) const {
  return AttributeRef(device_id_, name);
}

Value DeviceRef::value(const std::string &attribute) const {
  return ctx_.services().hub.fetch(ctx_.context().with_device(device_id_),
                                  device_id_, attribute);
}

void DeviceRef::command(const std::string &name, const ValueList &args) const {
  ctx_.task().throw_if_cancelled();
  const auto r = ctx_.services().hub.send_command(
      ctx_.context().with_device(device_id_), device_id_, name, args);
  if (!r.is_ok()) {
    throw hub_rules::DeviceCommunicationError("Command '" + name + "' on '" +
                                              device_id_ +
                                              "' failed: " + r.message);
  }
}

// -----------------------------
// SceneRef
// -----------------------------

SceneRef::SceneRef(RuleContext &ctx, std::string name)
    : ctx_(ctx), name_(std::move(name)) {}

rules_scenes::Scene SceneRef::definition() const {
  auto scene = ctx_.services().scenes.find_scene(name_);
  if (!scene) {
    throw hub_rules::ScriptError("Unknown scene '" + name_ + "'");
  }
  return *scene;
}

ConditionNode::Ptr SceneRef::is_set() const {
  return std::make_shared<SceneSetCondition>(name_,
                                             definition().requirements());
}

ConditionNode::Ptr SceneRef::on_change() const {
  return std::make_shared<SceneChangeCondition>(name_,
                                                definition().requirements());
}

rules_scenes::SceneApplyResult SceneRef::enable() const {
  ctx_.task().throw_if_cancelled();
  if (!ctx_.services().scenes.find_scene(name_)) {
    throw hub_rules::ScriptError("Unknown scene '" + name_ + "'");
  }
  auto result = ctx_.services().scenes.enable_scene(ctx_.context(), name_);

  rules_audit::AuditEvent event;
  event.kind = rules_audit::AuditKind::SceneApplied;
  event.context = ctx_.context().with_scene(name_);
  event.detail = result.message;
  event.success = result.success;
  ctx_.services().audit.record(event);
  return result;
}

// -----------------------------
// RuleContext
// -----------------------------

RuleContext::RuleContext(RuleServices services, std::shared_ptr<RuleTask> task,
                         ExecutionContext context)
    : services_(services), task_(std::move(task)),
      context_(std::move(context)) {}

DeviceRef RuleContext::device(const DeviceId &id) { return DeviceRef(*this, id); }

SceneRef RuleContext::scene(const std::string &name) {
  return SceneRef(*this, name);
}

ConditionNode::Ptr
RuleContext::all_of(std::vector<ConditionNode::Ptr> children) {
  return std::make_shared<AllOfCondition>(std::move(children));
}

ConditionNode::Ptr
RuleContext::any_of(std::vector<ConditionNode::Ptr> children) {
  return std::make_shared<AnyOfCondition>(std::move(children));
}

ConditionNode::Ptr RuleContext::is_not(ConditionNode::Ptr child) {
  return std::make_shared<NotCondition>(std::move(child));
}

void RuleContext::prime(const ConditionNode::Ptr &condition) {
  if (!condition) {
    throw hub_rules::ScriptError("Cannot prime an empty condition");
  }
  condition->prime(reader());
}

rules_engine::AttributeReader RuleContext::reader() const {
  return [this](const DeviceId &device, const std::string &attr) {
    return services_.hub.fetch(context_.with_device(device), device, attr);
  };
}

bool RuleContext::check(const ConditionNode::Ptr &condition) {
  if (condition && services_.engine.is_registered(*condition)) {
    return services_.engine.get_condition_state(*condition);
  }
  prime(condition);
  return condition->current_state();
}

void RuleContext::wait(Duration delay) {
  PendingWait pending = task_->begin_wait();
  const auto handle = services_.timers.schedule(
      delay, task_->resolver(pending.id, WaitOutcome::Fired));
  try {
    task_->await(pending);
  } catch (const hub_rules::TaskCancelled &) {
    services_.timers.cancel(handle);
    throw;
  }
}

bool RuleContext::wait_for(const ConditionNode::Ptr &condition,
                           std::optional<Duration> timeout,
                           std::optional<Duration> for_duration) {
  task_->throw_if_cancelled();
  prime(condition);
  if (!for_duration && condition->current_state()) {
    return true;
  }
  return register_and_wait(condition, timeout, for_duration, false) ==
         WaitOutcome::Fired;
}

bool RuleContext::wait_for_change(const AttributeRef &attribute,
                                  std::optional<Duration> timeout) {
  return wait_for(attribute.on_change(), timeout);
}

void RuleContext::wait_until(const rules_timing::TimeOfDay &time) {
  const TimePoint now = services_.timers.now();
  const TimePoint at = rules_timing::next_occurrence(now, time);
  wait(std::chrono::ceil<Duration>(at - now));
}

WaitOutcome RuleContext::await_trigger(const Trigger &trigger, bool edge_only) {
  if (!trigger.condition) {
    throw hub_rules::ScriptError("Trigger returned no condition");
  }
  return register_and_wait(trigger.condition, trigger.timeout,
                           trigger.for_duration, edge_only);
}

WaitOutcome
RuleContext::register_and_wait(const ConditionNode::Ptr &condition,
                               std::optional<Duration> timeout,
                               std::optional<Duration> for_duration,
                               bool edge_only) {
  rules_engine::ArmOptions options;
  options.edge_only = edge_only;
  // Re-read under the engine lock so an event published since any earlier
  // prime is not lost
  options.prime_with = reader();

  PendingWait pending = task_->begin_wait();
  services_.engine.add_condition(
      condition, task_->resolver(pending.id, WaitOutcome::Fired),
      task_->resolver(pending.id, WaitOutcome::TimedOut), timeout,
      for_duration, options);
  try {
    return task_->await(pending);
  } catch (const hub_rules::TaskCancelled &) {
    services_.engine.try_remove_condition(*condition);
    throw;
  }
}

TimePoint RuleContext::now() const { return services_.timers.now(); }

void RuleContext::log(const std::string &message) const {
  std::cerr << "[Rule:" << context_.rule_name << "] " << message << std::endl;
}

void RuleContext::audit(rules_audit::AuditKind kind, const std::string &detail,
                        bool success) const {
  rules_audit::AuditEvent event;
  event.kind = kind;
  event.context = context_;
  event.detail = detail;
  event.success = success;
  services_.audit.record(event);
}

} // namespace rules_exec
