#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "hub/hub_client.hpp"

namespace rules_hub {

// What a command does to the device: attribute -> new value.
// A string value "$N" takes the command's N-th argument instead.
using CommandEffect = std::map<std::string, Value>;

struct SimDeviceSpec {
  DeviceId id;
  std::string label;
  std::map<std::string, Value> attributes;
  std::map<std::string, CommandEffect> commands;
};

using DeviceEventListener = std::function<void(const DeviceEvent &)>;
using CommandListener =
    std::function<void(const ExecutionContext &, const DeviceId &,
                       const std::string &, const ValueList &)>;

/**
 * @brief In-memory hub: attribute cache plus simulated command effects.
 *
 * Inbound events (apply_event) and the attribute changes caused by commands
 * are published to the event listener in the order they were applied. The
 * listener is invoked without the state mutex held, so it may read back
 * through fetch().
 *
 * Thread Safety:
 *   All operations may be called from any thread.
 */
class SimHub : public HubClient {
public:
  SimHub() = default;
  ~SimHub() override = default;

  SimHub(const SimHub &) = delete;
  SimHub &operator=(const SimHub &) = delete;

  // Throws hub_rules::DuplicateError if the id is taken
  void add_device(const SimDeviceSpec &spec);

  std::vector<DeviceId> list_devices() const;

  void set_event_listener(DeviceEventListener listener);
  void set_command_listener(CommandListener listener);

  // Inbound notification stream: update the cache and publish the event.
  // Events for devices not declared yet create them on the fly.
  void apply_event(const DeviceEvent &event);

  // ---- HubClient ----

  Value fetch(const ExecutionContext &ctx, const DeviceId &device_id,
              const std::string &attribute) override;

  CommandResult send_command(const ExecutionContext &ctx,
                             const DeviceId &device_id,
                             const std::string &command,
                             const ValueList &args) override;

  bool has_device(const DeviceId &device_id) const override;

  // ---- Fault injection ----

  // fetch() throws and commands fail as unavailable until the fault expires
  void inject_device_unavailable(const DeviceId &device_id,
                                 std::chrono::milliseconds duration);
  void clear_faults();

private:
  struct Device {
    SimDeviceSpec spec;
    std::optional<std::chrono::steady_clock::time_point> unavailable_until;
  };

  bool is_unavailable(const Device &device) const;
  void publish(const std::vector<DeviceEvent> &events);

  std::map<DeviceId, Device> devices_;
  DeviceEventListener event_listener_;
  CommandListener command_listener_;

  // Guards devices_ and the listeners
  mutable std::mutex state_mutex_;
  // Serializes publication so listeners observe arrival order
  std::mutex publish_mutex_;
};

} // namespace rules_hub
