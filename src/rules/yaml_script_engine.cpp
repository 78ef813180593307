#include "rules/yaml_script_engine.hpp"

#include <regex>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "core/errors.hpp"
#include "rules/rule_context.hpp"

namespace rules_exec {

Duration parse_duration(const std::string &text) {
  static const std::regex pattern(R"(^\s*(\d+)\s*(ms|s|m|h)\s*$)");
  std::smatch m;
  if (!std::regex_match(text, m, pattern)) {
    throw std::invalid_argument("Invalid duration '" + text +
                                "' (expected <n>ms, <n>s, <n>m or <n>h)");
  }
  const long long n = std::stoll(m[1].str());
  const std::string unit = m[2].str();
  if (unit == "ms") {
    return Duration(n);
  }
  if (unit == "s") {
    return std::chrono::seconds(n);
  }
  if (unit == "m") {
    return std::chrono::minutes(n);
  }
  return std::chrono::hours(n);
}

namespace {

using hub_rules::ScriptError;

// -----------------------------
// Compiled forms
// -----------------------------

struct ConditionSpec {
  enum class Kind {
    Attribute,
    DeviceCompare,
    Change,
    AllOf,
    AnyOf,
    Not,
    SceneSet,
    SceneChange
  };

  Kind kind = Kind::Attribute;
  DeviceId device;
  std::string attribute;
  CompareOp op = CompareOp::Equal;
  Value value;
  DeviceId other_device;
  std::string other_attribute;
  std::string scene;
  std::vector<ConditionSpec> children;
};

struct ActionStep {
  enum class Kind {
    Command,
    Wait,
    WaitFor,
    WaitForChange,
    WaitUntil,
    Scene,
    If,
    Log
  };

  Kind kind = Kind::Log;
  DeviceId device;
  std::string attribute;
  std::string name; // command, scene or log text
  ValueList args;
  Duration delay{0};
  std::optional<Duration> timeout;
  std::optional<Duration> for_duration;
  rules_timing::TimeOfDay time;
  ConditionSpec condition;
  std::vector<ActionStep> then_steps;
  std::vector<ActionStep> else_steps;
};

// -----------------------------
// Parsing helpers
// -----------------------------

YAML::Node load_document(const std::string &text, const char *what) {
  try {
    return YAML::Load(text);
  } catch (const YAML::Exception &e) {
    throw ScriptError(std::string("Invalid ") + what + " document: " +
                      e.what());
  }
}

std::string scalar_field(const YAML::Node &node, const char *key,
                         const std::string &where) {
  const YAML::Node field = node[key];
  if (!field) {
    throw ScriptError(where + ": missing required field '" + key + "'");
  }
  if (!field.IsScalar()) {
    throw ScriptError(where + ": '" + key + "' must be a scalar");
  }
  return field.Scalar();
}

Duration duration_value(const YAML::Node &node, const std::string &where) {
  if (!node.IsScalar()) {
    throw ScriptError(where + ": duration must be a scalar");
  }
  try {
    return parse_duration(node.Scalar());
  } catch (const std::invalid_argument &e) {
    throw ScriptError(where + ": " + e.what());
  }
}

std::optional<Duration> optional_duration(const YAML::Node &node,
                                          const char *key,
                                          const std::string &where) {
  const YAML::Node field = node[key];
  if (!field) {
    return std::nullopt;
  }
  return duration_value(field, where + "." + key);
}

rules_timing::TimeOfDay time_value(const YAML::Node &node,
                                   const std::string &where) {
  if (!node.IsScalar()) {
    throw ScriptError(where + ": time of day must be a scalar");
  }
  try {
    return rules_timing::parse_time_of_day(node.Scalar());
  } catch (const std::invalid_argument &e) {
    throw ScriptError(where + ": " + e.what());
  }
}

Value scalar_value(const YAML::Node &node, const std::string &where) {
  if (!node.IsScalar()) {
    throw ScriptError(where + ": value must be a scalar");
  }
  return hub_rules::parse_scalar(node.Scalar());
}

void reject_unknown_keys(const YAML::Node &node,
                         const std::set<std::string> &allowed,
                         const std::string &where) {
  for (const auto &kv : node) {
    const std::string key = kv.first.Scalar();
    if (allowed.count(key) == 0) {
      throw ScriptError(where + ": unexpected key '" + key + "'");
    }
  }
}

// -----------------------------
// Conditions
// -----------------------------

ConditionSpec parse_condition(const YAML::Node &node, const std::string &where,
                              bool root);

std::vector<ConditionSpec> parse_children(const YAML::Node &node,
                                          const std::string &where) {
  if (!node.IsSequence()) {
    throw ScriptError(where + ": must be a sequence of conditions");
  }
  std::vector<ConditionSpec> children;
  for (std::size_t i = 0; i < node.size(); ++i) {
    children.push_back(
        parse_condition(node[i], where + "[" + std::to_string(i) + "]", false));
  }
  return children;
}

ConditionSpec parse_condition(const YAML::Node &node, const std::string &where,
                              bool root) {
  if (!node.IsMap()) {
    throw ScriptError(where + ": condition must be a map");
  }

  static const char *const forms[] = {"device",    "all_of",       "any_of",
                                      "not",       "on_change",    "scene_set",
                                      "scene_change"};
  std::string form;
  for (const char *candidate : forms) {
    if (!node[candidate]) {
      continue;
    }
    if (!form.empty()) {
      throw ScriptError(where + ": '" + form + "' and '" + candidate +
                        "' cannot be combined");
    }
    form = candidate;
  }
  if (form.empty()) {
    throw ScriptError(where + ": no condition given");
  }

  std::set<std::string> allowed = {form};
  if (root) {
    allowed.insert("timeout");
    allowed.insert("for");
  }

  ConditionSpec spec;
  if (form == "device") {
    allowed.insert({"attribute", "op", "value", "other"});
    reject_unknown_keys(node, allowed, where);

    spec.device = scalar_field(node, "device", where);
    spec.attribute = scalar_field(node, "attribute", where);
    if (node["op"]) {
      try {
        spec.op = hub_rules::parse_compare_op(scalar_field(node, "op", where));
      } catch (const std::invalid_argument &e) {
        throw ScriptError(where + ": " + e.what());
      }
    }

    const bool has_value = static_cast<bool>(node["value"]);
    const bool has_other = static_cast<bool>(node["other"]);
    if (has_value == has_other) {
      throw ScriptError(where + ": exactly one of 'value' or 'other' required");
    }
    if (has_value) {
      spec.kind = ConditionSpec::Kind::Attribute;
      spec.value = scalar_value(node["value"], where + ".value");
    } else {
      const YAML::Node other = node["other"];
      if (!other.IsMap()) {
        throw ScriptError(where + ".other: must be a map");
      }
      spec.kind = ConditionSpec::Kind::DeviceCompare;
      spec.other_device = scalar_field(other, "device", where + ".other");
      spec.other_attribute = scalar_field(other, "attribute", where + ".other");
    }
    return spec;
  }

  reject_unknown_keys(node, allowed, where);
  const YAML::Node body = node[form];

  if (form == "all_of" || form == "any_of") {
    spec.kind = form == "all_of" ? ConditionSpec::Kind::AllOf
                                 : ConditionSpec::Kind::AnyOf;
    spec.children = parse_children(body, where + "." + form);
  } else if (form == "not") {
    spec.kind = ConditionSpec::Kind::Not;
    spec.children.push_back(parse_condition(body, where + ".not", false));
  } else if (form == "on_change") {
    if (!body.IsMap()) {
      throw ScriptError(where + ".on_change: must be a map");
    }
    spec.kind = ConditionSpec::Kind::Change;
    spec.device = scalar_field(body, "device", where + ".on_change");
    spec.attribute = scalar_field(body, "attribute", where + ".on_change");
  } else {
    if (!body.IsScalar()) {
      throw ScriptError(where + "." + form + ": must be a scene name");
    }
    spec.kind = form == "scene_set" ? ConditionSpec::Kind::SceneSet
                                    : ConditionSpec::Kind::SceneChange;
    spec.scene = body.Scalar();
  }
  return spec;
}

ConditionNode::Ptr build_condition(const ConditionSpec &spec,
                                   RuleContext &ctx) {
  switch (spec.kind) {
  case ConditionSpec::Kind::Attribute:
    return AttributeRef(spec.device, spec.attribute).compare(spec.op,
                                                             spec.value);
  case ConditionSpec::Kind::DeviceCompare:
    return AttributeRef(spec.device, spec.attribute)
        .compare(spec.op, AttributeRef(spec.other_device, spec.other_attribute));
  case ConditionSpec::Kind::Change:
    return AttributeRef(spec.device, spec.attribute).on_change();
  case ConditionSpec::Kind::AllOf:
  case ConditionSpec::Kind::AnyOf: {
    std::vector<ConditionNode::Ptr> children;
    for (const auto &child : spec.children) {
      children.push_back(build_condition(child, ctx));
    }
    return spec.kind == ConditionSpec::Kind::AllOf
               ? RuleContext::all_of(std::move(children))
               : RuleContext::any_of(std::move(children));
  }
  case ConditionSpec::Kind::Not:
    return RuleContext::is_not(build_condition(spec.children.front(), ctx));
  case ConditionSpec::Kind::SceneSet:
    return ctx.scene(spec.scene).is_set();
  case ConditionSpec::Kind::SceneChange:
    return ctx.scene(spec.scene).on_change();
  }
  throw ScriptError("Unsupported condition");
}

// -----------------------------
// Actions
// -----------------------------

std::vector<ActionStep> parse_steps(const YAML::Node &node,
                                    const std::string &where);

void parse_branches(const YAML::Node &body, ActionStep &step,
                    const std::string &where) {
  if (body["then"]) {
    step.then_steps = parse_steps(body["then"], where + ".then");
  }
  if (body["else"]) {
    step.else_steps = parse_steps(body["else"], where + ".else");
  }
}

ActionStep parse_step(const YAML::Node &node, const std::string &where) {
  if (!node.IsMap() || node.size() != 1) {
    throw ScriptError(where + ": step must be a map with exactly one key");
  }
  const auto entry = node.begin();
  const std::string key = entry->first.Scalar();
  const YAML::Node body = entry->second;
  const std::string at = where + "." + key;

  ActionStep step;
  if (key == "command") {
    if (!body.IsMap()) {
      throw ScriptError(at + ": must be a map");
    }
    reject_unknown_keys(body, {"device", "name", "args"}, at);
    step.kind = ActionStep::Kind::Command;
    step.device = scalar_field(body, "device", at);
    step.name = scalar_field(body, "name", at);
    if (body["args"]) {
      if (!body["args"].IsSequence()) {
        throw ScriptError(at + ".args: must be a sequence");
      }
      for (std::size_t i = 0; i < body["args"].size(); ++i) {
        step.args.push_back(scalar_value(
            body["args"][i], at + ".args[" + std::to_string(i) + "]"));
      }
    }
  } else if (key == "wait") {
    step.kind = ActionStep::Kind::Wait;
    step.delay = duration_value(body, at);
  } else if (key == "wait_for") {
    if (!body.IsMap() || !body["condition"]) {
      throw ScriptError(at + ": requires a 'condition'");
    }
    reject_unknown_keys(body, {"condition", "timeout", "for", "then", "else"},
                        at);
    step.kind = ActionStep::Kind::WaitFor;
    step.condition = parse_condition(body["condition"], at + ".condition",
                                     false);
    step.timeout = optional_duration(body, "timeout", at);
    step.for_duration = optional_duration(body, "for", at);
    parse_branches(body, step, at);
  } else if (key == "wait_for_change") {
    if (!body.IsMap()) {
      throw ScriptError(at + ": must be a map");
    }
    reject_unknown_keys(body, {"device", "attribute", "timeout", "then", "else"},
                        at);
    step.kind = ActionStep::Kind::WaitForChange;
    step.device = scalar_field(body, "device", at);
    step.attribute = scalar_field(body, "attribute", at);
    step.timeout = optional_duration(body, "timeout", at);
    parse_branches(body, step, at);
  } else if (key == "wait_until") {
    step.kind = ActionStep::Kind::WaitUntil;
    step.time = time_value(body, at);
  } else if (key == "scene") {
    if (!body.IsScalar()) {
      throw ScriptError(at + ": must be a scene name");
    }
    step.kind = ActionStep::Kind::Scene;
    step.name = body.Scalar();
  } else if (key == "if") {
    if (!body.IsMap() || !body["condition"]) {
      throw ScriptError(at + ": requires a 'condition'");
    }
    reject_unknown_keys(body, {"condition", "then", "else"}, at);
    step.kind = ActionStep::Kind::If;
    step.condition = parse_condition(body["condition"], at + ".condition",
                                     false);
    parse_branches(body, step, at);
  } else if (key == "log") {
    if (!body.IsScalar()) {
      throw ScriptError(at + ": must be a scalar");
    }
    step.kind = ActionStep::Kind::Log;
    step.name = body.Scalar();
  } else {
    throw ScriptError(where + ": unknown step '" + key + "'");
  }
  return step;
}

std::vector<ActionStep> parse_steps(const YAML::Node &node,
                                    const std::string &where) {
  if (!node.IsSequence()) {
    throw ScriptError(where + ": must be a sequence of steps");
  }
  std::vector<ActionStep> steps;
  for (std::size_t i = 0; i < node.size(); ++i) {
    steps.push_back(parse_step(node[i], where + "[" + std::to_string(i) + "]"));
  }
  return steps;
}

void run_steps(const std::vector<ActionStep> &steps, RuleContext &ctx) {
  for (const auto &step : steps) {
    switch (step.kind) {
    case ActionStep::Kind::Command:
      ctx.device(step.device).command(step.name, step.args);
      break;
    case ActionStep::Kind::Wait:
      ctx.wait(step.delay);
      break;
    case ActionStep::Kind::WaitFor: {
      const bool held = ctx.wait_for(build_condition(step.condition, ctx),
                                     step.timeout, step.for_duration);
      run_steps(held ? step.then_steps : step.else_steps, ctx);
      break;
    }
    case ActionStep::Kind::WaitForChange: {
      const bool changed = ctx.wait_for_change(
          AttributeRef(step.device, step.attribute), step.timeout);
      run_steps(changed ? step.then_steps : step.else_steps, ctx);
      break;
    }
    case ActionStep::Kind::WaitUntil:
      ctx.wait_until(step.time);
      break;
    case ActionStep::Kind::Scene: {
      const auto result = ctx.scene(step.name).enable();
      if (!result.success) {
        ctx.log(result.message);
      }
      break;
    }
    case ActionStep::Kind::If:
      run_steps(ctx.check(build_condition(step.condition, ctx))
                    ? step.then_steps
                    : step.else_steps,
                ctx);
      break;
    case ActionStep::Kind::Log:
      ctx.log(step.name);
      break;
    }
  }
}

// -----------------------------
// Scripts
// -----------------------------

class YamlTrigger : public TriggerScript {
public:
  YamlTrigger(ConditionSpec condition, std::optional<Duration> timeout,
              std::optional<Duration> for_duration)
      : condition_(std::move(condition)), timeout_(timeout),
        for_duration_(for_duration) {}

  Trigger invoke(RuleContext &ctx) const override {
    return Trigger{build_condition(condition_, ctx), timeout_, for_duration_};
  }

private:
  ConditionSpec condition_;
  std::optional<Duration> timeout_;
  std::optional<Duration> for_duration_;
};

class EveryTimer : public TimerScript {
public:
  explicit EveryTimer(Duration period) : period_(period) {}

  TimePoint invoke(RuleContext &ctx) const override {
    return ctx.now() + period_;
  }

private:
  Duration period_;
};

class DailyTimer : public TimerScript {
public:
  explicit DailyTimer(rules_timing::TimeOfDay time) : time_(time) {}

  TimePoint invoke(RuleContext &ctx) const override {
    return rules_timing::next_occurrence(ctx.now(), time_);
  }

private:
  rules_timing::TimeOfDay time_;
};

class YamlAction : public ActionScript {
public:
  explicit YamlAction(std::vector<ActionStep> steps)
      : steps_(std::move(steps)) {}

  void invoke(RuleContext &ctx) const override { run_steps(steps_, ctx); }

private:
  std::vector<ActionStep> steps_;
};

} // namespace

std::shared_ptr<const TriggerScript>
YamlScriptEngine::compile_trigger(const std::string &text) {
  const YAML::Node doc = load_document(text, "trigger");
  ConditionSpec condition = parse_condition(doc, "trigger", true);
  const auto timeout = optional_duration(doc, "timeout", "trigger");
  auto for_duration = optional_duration(doc, "for", "trigger");
  return std::make_shared<YamlTrigger>(std::move(condition), timeout,
                                       for_duration);
}

std::shared_ptr<const TimerScript>
YamlScriptEngine::compile_timer(const std::string &text) {
  const YAML::Node doc = load_document(text, "timer");
  if (!doc.IsMap()) {
    throw ScriptError("timer: must be a map");
  }
  reject_unknown_keys(doc, {"every", "at"}, "timer");
  if (doc["every"] && doc["at"]) {
    throw ScriptError("timer: 'every' and 'at' cannot be combined");
  }
  if (doc["every"]) {
    const Duration period = duration_value(doc["every"], "timer.every");
    if (period <= Duration::zero()) {
      throw ScriptError("timer.every: period must be positive");
    }
    return std::make_shared<EveryTimer>(period);
  }
  if (doc["at"]) {
    return std::make_shared<DailyTimer>(time_value(doc["at"], "timer.at"));
  }
  throw ScriptError("timer: expected 'every' or 'at'");
}

std::shared_ptr<const ActionScript>
YamlScriptEngine::compile_action(const std::string &text) {
  const YAML::Node doc = load_document(text, "action");
  return std::make_shared<YamlAction>(parse_steps(doc, "action"));
}

} // namespace rules_exec
