#pragma once

#include <string>

#include "rules/script_engine.hpp"

namespace rules_exec {

// "<n>ms", "<n>s", "<n>m" or "<n>h". Throws std::invalid_argument.
Duration parse_duration(const std::string &text);

/**
 * @brief Restricted rule language written as YAML documents.
 *
 * Trigger: a condition map with optional root `timeout` and `for`.
 *
 *   all_of:
 *     - {device: motion-1, attribute: motion, value: active}
 *     - {device: lux-1, attribute: illuminance, op: "<", value: 40}
 *   for: 10s
 *
 * Condition forms: `device`/`attribute`/`op`/`value`, the same with
 * `other: {device, attribute}` instead of `value`, `all_of`, `any_of`,
 * `not`, `on_change: {device, attribute}`, `scene_set: <name>` and
 * `scene_change: <name>`. `op` defaults to "==".
 *
 * Timer: `every: <duration>` or `at: "HH:MM"`.
 *
 * Action: a sequence of single-key steps, run in order:
 *
 *   - command: {device: light-1, name: on, args: [80]}
 *   - wait: 5m
 *   - wait_for: {condition: {...}, timeout: 1m, for: 5s, then: [...], else: [...]}
 *   - wait_for_change: {device: door-1, attribute: contact, timeout: 30s}
 *   - wait_until: "07:00"
 *   - scene: evening
 *   - if: {condition: {...}, then: [...], else: [...]}
 *   - log: "message"
 *
 * Everything is validated at compile time; invocation only fails on
 * collaborator errors (unknown scene, unreachable device, failed command).
 */
class YamlScriptEngine : public ScriptEngine {
public:
  std::shared_ptr<const TriggerScript>
  compile_trigger(const std::string &text) override;
  std::shared_ptr<const TimerScript>
  compile_timer(const std::string &text) override;
  std::shared_ptr<const ActionScript>
  compile_action(const std::string &text) override;
};

} // namespace rules_exec
