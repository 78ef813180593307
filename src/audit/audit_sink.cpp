#include "audit/audit_sink.hpp"

#include <iostream>

namespace rules_audit {

const char *to_string(AuditKind kind) {
  switch (kind) {
  case AuditKind::RuleInstalled:
    return "rule_installed";
  case AuditKind::RuleUninstalled:
    return "rule_uninstalled";
  case AuditKind::TriggerFired:
    return "trigger_fired";
  case AuditKind::ConditionTimedOut:
    return "condition_timeout";
  case AuditKind::ActionStarted:
    return "action_started";
  case AuditKind::ActionCompleted:
    return "action_completed";
  case AuditKind::ActionFailed:
    return "action_failed";
  case AuditKind::SceneApplied:
    return "scene_applied";
  }
  return "unknown";
}

StreamAuditSink::StreamAuditSink() : out_(std::cerr) {}

StreamAuditSink::StreamAuditSink(std::ostream &out) : out_(out) {}

void StreamAuditSink::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = true;
}

void StreamAuditSink::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
  out_.flush();
}

void StreamAuditSink::record(const AuditEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_) {
    return;
  }

  out_ << "[audit] " << to_string(event.kind);
  if (!event.context.rule_name.empty()) {
    out_ << " rule=" << event.context.rule_name;
  }
  if (!event.context.scene_name.empty()) {
    out_ << " scene=" << event.context.scene_name;
  }
  if (!event.context.device_id.empty()) {
    out_ << " device=" << event.context.device_id;
  }
  out_ << " success=" << (event.success ? "true" : "false");
  if (!event.detail.empty()) {
    out_ << " detail=\"" << event.detail << "\"";
  }
  out_ << "\n";
  ++recorded_;
}

size_t StreamAuditSink::recorded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return recorded_;
}

} // namespace rules_audit
