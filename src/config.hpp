#pragma once

#include <string>
#include <vector>

#include "hub/sim_hub.hpp"
#include "rules/rule_coordinator.hpp"
#include "scenes/scene_manager.hpp"

namespace hub_rules {

enum class AuditSinkKind {
  None,  // NullAuditSink
  Stderr // StreamAuditSink on std::cerr
};

// Complete hub-rules configuration
struct HubConfig {
  std::string config_file_path; // Absolute path, empty when parsed from text
  std::vector<rules_hub::SimDeviceSpec> devices;
  std::vector<rules_scenes::Scene> scenes;
  std::vector<rules_exec::RuleRecord> rules;
  AuditSinkKind audit_sink = AuditSinkKind::None;
};

// Load configuration from a YAML file.
// Throws ConfigError if the file cannot be read, parsed, or validated.
HubConfig load_config(const std::string &path);

// Same as load_config for an in-memory document
HubConfig parse_config(const std::string &text);

// Throws ConfigError if the sink name is not "none" or "stderr"
AuditSinkKind parse_audit_sink(const std::string &name);

} // namespace hub_rules
