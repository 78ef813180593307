#include "config.hpp"

#include <filesystem>
#include <set>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include "core/errors.hpp"

namespace hub_rules {

namespace fs = std::filesystem;

AuditSinkKind parse_audit_sink(const std::string &name) {
  if (name == "none") {
    return AuditSinkKind::None;
  } else if (name == "stderr") {
    return AuditSinkKind::Stderr;
  } else {
    throw ConfigError("[CONFIG] Invalid audit.sink: '" + name +
                      "'. Valid values: none, stderr");
  }
}

static std::string entry_name(const char *section, std::size_t i) {
  return std::string(section) + "[" + std::to_string(i) + "]";
}

static std::string required_string(const YAML::Node &node, const char *key,
                                   const std::string &where) {
  if (!node[key]) {
    throw ConfigError("[CONFIG] Invalid " + where +
                      ": missing required field '" + key + "'");
  }
  if (!node[key].IsScalar()) {
    throw ConfigError("[CONFIG] Invalid " + where + ": '" + key +
                      "' must be a scalar");
  }
  return node[key].Scalar();
}

static Value typed_scalar(const YAML::Node &node, const std::string &where) {
  if (!node.IsScalar()) {
    throw ConfigError("[CONFIG] Invalid " + where + ": value must be a scalar");
  }
  return parse_scalar(node.Scalar());
}

static ValueList typed_list(const YAML::Node &node, const std::string &where) {
  if (!node.IsSequence()) {
    throw ConfigError("[CONFIG] Invalid " + where + ": must be a sequence");
  }
  ValueList out;
  for (std::size_t i = 0; i < node.size(); ++i) {
    out.push_back(typed_scalar(node[i], where + "[" + std::to_string(i) + "]"));
  }
  return out;
}

// Rule bodies may be written inline as YAML or as a block string
static std::string script_text(const YAML::Node &node) {
  if (node.IsScalar()) {
    return node.Scalar();
  }
  return YAML::Dump(node);
}

static rules_hub::SimDeviceSpec parse_device(const YAML::Node &node,
                                             const std::string &where) {
  if (!node.IsMap()) {
    throw ConfigError("[CONFIG] Invalid " + where + ": entry must be a map");
  }

  rules_hub::SimDeviceSpec spec;
  spec.id = required_string(node, "id", where);
  if (node["label"]) {
    spec.label = node["label"].as<std::string>();
  }

  if (node["attributes"]) {
    if (!node["attributes"].IsMap()) {
      throw ConfigError("[CONFIG] Invalid " + where +
                        ": 'attributes' must be a map");
    }
    for (const auto &kv : node["attributes"]) {
      const std::string attr = kv.first.as<std::string>();
      spec.attributes[attr] =
          typed_scalar(kv.second, where + ".attributes." + attr);
    }
  }

  if (node["commands"]) {
    if (!node["commands"].IsMap()) {
      throw ConfigError("[CONFIG] Invalid " + where +
                        ": 'commands' must be a map");
    }
    for (const auto &kv : node["commands"]) {
      const std::string command = kv.first.as<std::string>();
      const std::string at = where + ".commands." + command;
      rules_hub::CommandEffect effect;
      if (!kv.second.IsNull()) {
        if (!kv.second.IsMap()) {
          throw ConfigError("[CONFIG] Invalid " + at +
                            ": must map attributes to values");
        }
        for (const auto &assignment : kv.second) {
          const std::string attr = assignment.first.as<std::string>();
          effect[attr] = typed_scalar(assignment.second, at + "." + attr);
        }
      }
      spec.commands[command] = effect;
    }
  }
  return spec;
}

static rules_scenes::Scene parse_scene(const YAML::Node &node,
                                       const std::string &where) {
  if (!node.IsMap()) {
    throw ConfigError("[CONFIG] Invalid " + where + ": entry must be a map");
  }

  rules_scenes::Scene scene;
  scene.name = required_string(node, "name", where);
  if (node["description"]) {
    scene.description = node["description"].as<std::string>();
  }

  const YAML::Node states = node["device_states"];
  if (!states || !states.IsSequence() || states.size() == 0) {
    throw ConfigError("[CONFIG] Invalid " + where +
                      ": 'device_states' must be a non-empty sequence");
  }
  for (std::size_t i = 0; i < states.size(); ++i) {
    const std::string at = where + "." + entry_name("device_states", i);
    const YAML::Node state_node = states[i];
    if (!state_node.IsMap()) {
      throw ConfigError("[CONFIG] Invalid " + at + ": entry must be a map");
    }
    rules_scenes::SceneDeviceState state;
    state.device_id = required_string(state_node, "device", at);
    state.attribute = required_string(state_node, "attribute", at);
    if (!state_node["value"]) {
      throw ConfigError("[CONFIG] Invalid " + at +
                        ": missing required field 'value'");
    }
    state.value = typed_scalar(state_node["value"], at + ".value");
    state.command = required_string(state_node, "command", at);
    if (state_node["arguments"]) {
      state.arguments = typed_list(state_node["arguments"], at + ".arguments");
    }
    scene.device_states.push_back(state);
  }
  return scene;
}

static rules_exec::RuleRecord parse_rule(const YAML::Node &node,
                                         const std::string &where) {
  if (!node.IsMap()) {
    throw ConfigError("[CONFIG] Invalid " + where + ": entry must be a map");
  }

  rules_exec::RuleRecord record;
  record.name = required_string(node, "name", where);
  try {
    record.kind = rules_exec::parse_rule_kind(
        node["kind"] ? node["kind"].as<std::string>() : "condition");
  } catch (const std::invalid_argument &e) {
    throw ConfigError("[CONFIG] Invalid " + where + ": " + e.what());
  }

  const char *trigger_key =
      record.kind == rules_exec::RuleKind::Condition ? "trigger" : "timer";
  if (!node[trigger_key]) {
    throw ConfigError("[CONFIG] Invalid " + where + ": " +
                      rules_exec::to_string(record.kind) +
                      " rule requires '" + trigger_key + "'");
  }
  if (!node["action"]) {
    throw ConfigError("[CONFIG] Invalid " + where +
                      ": missing required field 'action'");
  }
  record.trigger = script_text(node[trigger_key]);
  record.action = script_text(node["action"]);
  return record;
}

static HubConfig parse_document(const YAML::Node &yaml) {
  HubConfig config;
  if (!yaml.IsMap()) {
    throw ConfigError("[CONFIG] Top level must be a map");
  }

  if (yaml["devices"]) {
    if (!yaml["devices"].IsSequence()) {
      throw ConfigError("[CONFIG] 'devices' must be a sequence");
    }
    std::set<std::string> ids;
    for (std::size_t i = 0; i < yaml["devices"].size(); ++i) {
      auto spec = parse_device(yaml["devices"][i], entry_name("devices", i));
      if (!ids.insert(spec.id).second) {
        throw ConfigError("[CONFIG] Duplicate device id: " + spec.id);
      }
      config.devices.push_back(spec);
    }
  }

  if (yaml["scenes"]) {
    if (!yaml["scenes"].IsSequence()) {
      throw ConfigError("[CONFIG] 'scenes' must be a sequence");
    }
    std::set<std::string> names;
    for (std::size_t i = 0; i < yaml["scenes"].size(); ++i) {
      auto scene = parse_scene(yaml["scenes"][i], entry_name("scenes", i));
      if (!names.insert(scene.name).second) {
        throw ConfigError("[CONFIG] Duplicate scene name: " + scene.name);
      }
      config.scenes.push_back(scene);
    }
  }

  if (yaml["rules"]) {
    if (!yaml["rules"].IsSequence()) {
      throw ConfigError("[CONFIG] 'rules' must be a sequence");
    }
    std::set<std::string> names;
    for (std::size_t i = 0; i < yaml["rules"].size(); ++i) {
      auto rule = parse_rule(yaml["rules"][i], entry_name("rules", i));
      if (!names.insert(rule.name).second) {
        throw ConfigError("[CONFIG] Duplicate rule name: " + rule.name);
      }
      config.rules.push_back(rule);
    }
  }

  if (yaml["audit"]) {
    if (!yaml["audit"].IsMap()) {
      throw ConfigError("[CONFIG] 'audit' section must be a map");
    }
    if (yaml["audit"]["sink"]) {
      config.audit_sink =
          parse_audit_sink(yaml["audit"]["sink"].as<std::string>());
    }
  }

  return config;
}

HubConfig load_config(const std::string &path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw ConfigError("[CONFIG] Failed to load config file '" + path +
                      "': " + e.what());
  }

  HubConfig config;
  try {
    config = parse_document(yaml);
  } catch (const YAML::Exception &e) {
    throw ConfigError("[CONFIG] Invalid config file '" + path +
                      "': " + e.what());
  }
  config.config_file_path = fs::absolute(path).string();
  return config;
}

HubConfig parse_config(const std::string &text) {
  try {
    return parse_document(YAML::Load(text));
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("[CONFIG] Invalid config: ") + e.what());
  }
}

} // namespace hub_rules
