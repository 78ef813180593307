#pragma once

#include <string>

#include "core/types.hpp"

namespace rules_hub {

using hub_rules::DeviceEvent;
using hub_rules::DeviceId;
using hub_rules::ExecutionContext;
using hub_rules::Value;
using hub_rules::ValueList;

// -----------------------------
// Command result
// -----------------------------

enum class CommandCode { Ok, NotFound, InvalidArgument, Unavailable };

struct CommandResult {
  CommandCode code = CommandCode::Ok;
  std::string message = "ok";

  bool is_ok() const { return code == CommandCode::Ok; }
};

static inline CommandResult ok() { return {CommandCode::Ok, "ok"}; }
static inline CommandResult bad(const std::string &m) {
  return {CommandCode::InvalidArgument, m};
}
static inline CommandResult nf(const std::string &m) {
  return {CommandCode::NotFound, m};
}
static inline CommandResult unavailable(const std::string &m) {
  return {CommandCode::Unavailable, m};
}

// -----------------------------
// Hub device collaborator
// -----------------------------

class HubClient {
public:
  virtual ~HubClient() = default;

  // Current value of a device attribute.
  // Throws hub_rules::DeviceCommunicationError if it cannot be read.
  virtual Value fetch(const ExecutionContext &ctx, const DeviceId &device_id,
                      const std::string &attribute) = 0;

  virtual CommandResult send_command(const ExecutionContext &ctx,
                                     const DeviceId &device_id,
                                     const std::string &command,
                                     const ValueList &args) = 0;

  virtual bool has_device(const DeviceId &device_id) const = 0;
};

} // namespace rules_hub
