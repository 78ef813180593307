#pragma once

#include <mutex>
#include <ostream>
#include <string>

#include "core/types.hpp"

namespace rules_audit {

using hub_rules::ExecutionContext;

enum class AuditKind {
  RuleInstalled,
  RuleUninstalled,
  TriggerFired,
  ConditionTimedOut,
  ActionStarted,
  ActionCompleted,
  ActionFailed,
  SceneApplied
};

const char *to_string(AuditKind kind);

struct AuditEvent {
  AuditKind kind;
  ExecutionContext context;
  std::string detail;
  bool success = true;
};

// Injected audit trail. Records outside start()/stop() are dropped.
class AuditSink {
public:
  virtual ~AuditSink() = default;

  virtual void start() = 0;
  virtual void stop() = 0;
  virtual void record(const AuditEvent &event) = 0;
};

// Default sink: accepts and discards everything
class NullAuditSink : public AuditSink {
public:
  void start() override {}
  void stop() override {}
  void record(const AuditEvent &) override {}
};

// One line per event on the given stream (std::cerr by default)
class StreamAuditSink : public AuditSink {
public:
  StreamAuditSink();
  explicit StreamAuditSink(std::ostream &out);

  void start() override;
  void stop() override;
  void record(const AuditEvent &event) override;

  size_t recorded() const;

private:
  std::ostream &out_;
  bool running_ = false;
  size_t recorded_ = 0;
  mutable std::mutex mutex_;
};

} // namespace rules_audit
