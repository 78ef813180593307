#pragma once

#include <memory>
#include <optional>
#include <string>

#include "conditions/condition_node.hpp"

namespace rules_exec {

using hub_rules::Duration;
using hub_rules::TimePoint;
using rules_engine::ConditionNode;

class RuleContext;

// What a trigger script hands back for one cycle of a condition rule
struct Trigger {
  ConditionNode::Ptr condition;
  std::optional<Duration> timeout;
  std::optional<Duration> for_duration;
};

class TriggerScript {
public:
  virtual ~TriggerScript() = default;
  virtual Trigger invoke(RuleContext &ctx) const = 0;
};

// Next time a scheduled rule should run, computed from ctx.now()
class TimerScript {
public:
  virtual ~TimerScript() = default;
  virtual TimePoint invoke(RuleContext &ctx) const = 0;
};

class ActionScript {
public:
  virtual ~ActionScript() = default;
  virtual void invoke(RuleContext &ctx) const = 0;
};

/**
 * @brief Compiles rule text into invocable scripts.
 *
 * Compilation happens once at install time; a compiled script is invoked
 * once per cycle with a fresh context. Both steps report problems as
 * hub_rules::ScriptError.
 */
class ScriptEngine {
public:
  virtual ~ScriptEngine() = default;

  virtual std::shared_ptr<const TriggerScript>
  compile_trigger(const std::string &text) = 0;
  virtual std::shared_ptr<const TimerScript>
  compile_timer(const std::string &text) = 0;
  virtual std::shared_ptr<const ActionScript>
  compile_action(const std::string &text) = 0;
};

} // namespace rules_exec
