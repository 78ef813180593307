#include "hub/sim_hub.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "core/errors.hpp"

namespace rules_hub {

using hub_rules::CompareOp;
using hub_rules::compare_values;

// "$N" -> args[N]
static std::optional<size_t> argument_ref(const Value &v) {
  if (!std::holds_alternative<std::string>(v)) {
    return std::nullopt;
  }
  const std::string &s = std::get<std::string>(v);
  if (s.size() < 2 || s[0] != '$') {
    return std::nullopt;
  }
  for (size_t i = 1; i < s.size(); ++i) {
    if (s[i] < '0' || s[i] > '9') {
      return std::nullopt;
    }
  }
  return static_cast<size_t>(std::stoul(s.substr(1)));
}

void SimHub::add_device(const SimDeviceSpec &spec) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (devices_.count(spec.id) > 0) {
    throw hub_rules::DuplicateError("Device '" + spec.id +
                                    "' is already registered");
  }
  devices_[spec.id] = Device{spec, std::nullopt};
}

std::vector<DeviceId> SimHub::list_devices() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  std::vector<DeviceId> ids;
  ids.reserve(devices_.size());
  for (const auto &kv : devices_) {
    ids.push_back(kv.first);
  }
  return ids;
}

void SimHub::set_event_listener(DeviceEventListener listener) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  event_listener_ = std::move(listener);
}

void SimHub::set_command_listener(CommandListener listener) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  command_listener_ = std::move(listener);
}

void SimHub::apply_event(const DeviceEvent &event) {
  std::lock_guard<std::mutex> publish_lock(publish_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    Device &device = devices_[event.device_id];
    if (device.spec.id.empty()) {
      device.spec.id = event.device_id;
    }
    device.spec.attributes[event.attribute] = event.value;
  }
  publish({event});
}

Value SimHub::fetch(const ExecutionContext &ctx, const DeviceId &device_id,
                    const std::string &attribute) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    throw hub_rules::DeviceCommunicationError(
        "[SimHub] Unknown device '" + device_id + "' (rule '" +
        ctx.rule_name + "')");
  }
  if (is_unavailable(it->second)) {
    throw hub_rules::DeviceCommunicationError("[SimHub] Device '" +
                                              device_id + "' is unavailable");
  }
  auto attr = it->second.spec.attributes.find(attribute);
  if (attr == it->second.spec.attributes.end()) {
    throw hub_rules::DeviceCommunicationError(
        "[SimHub] Device '" + device_id + "' has no attribute '" + attribute +
        "'");
  }
  return attr->second;
}

CommandResult SimHub::send_command(const ExecutionContext &ctx,
                                   const DeviceId &device_id,
                                   const std::string &command,
                                   const ValueList &args) {
  std::lock_guard<std::mutex> publish_lock(publish_mutex_);

  std::vector<DeviceEvent> changes;
  CommandListener command_listener;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
      return nf("Unknown device '" + device_id + "'");
    }
    Device &device = it->second;
    if (is_unavailable(device)) {
      return unavailable("Device '" + device_id + "' is unavailable");
    }

    auto cmd = device.spec.commands.find(command);
    if (cmd == device.spec.commands.end()) {
      return bad("Device '" + device_id + "' has no command '" + command +
                 "'");
    }

    // Resolve every assignment before touching the device
    std::vector<std::pair<std::string, Value>> assignments;
    for (const auto &effect : cmd->second) {
      Value next = effect.second;
      if (auto ref = argument_ref(effect.second)) {
        if (*ref >= args.size()) {
          return bad("Command '" + command + "' expects argument " +
                     std::to_string(*ref));
        }
        next = args[*ref];
      }
      assignments.emplace_back(effect.first, std::move(next));
    }

    const auto now = hub_rules::Clock::now();
    for (const auto &assignment : assignments) {
      const Value &next = assignment.second;
      Value &current = device.spec.attributes[assignment.first];
      if (hub_rules::has_value(current) &&
          current.index() == next.index() &&
          compare_values(current, CompareOp::Equal, next)) {
        continue;
      }
      current = next;
      changes.push_back(DeviceEvent{device_id, assignment.first, next, now});
    }
    command_listener = command_listener_;
  }

  if (command_listener) {
    command_listener(ctx, device_id, command, args);
  }
  publish(changes);
  return ok();
}

bool SimHub::has_device(const DeviceId &device_id) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return devices_.count(device_id) > 0;
}

void SimHub::inject_device_unavailable(const DeviceId &device_id,
                                       std::chrono::milliseconds duration) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    throw hub_rules::NotFoundError("Unknown device '" + device_id + "'");
  }
  it->second.unavailable_until = std::chrono::steady_clock::now() + duration;
}

void SimHub::clear_faults() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  for (auto &kv : devices_) {
    kv.second.unavailable_until.reset();
  }
}

bool SimHub::is_unavailable(const Device &device) const {
  return device.unavailable_until &&
         std::chrono::steady_clock::now() < *device.unavailable_until;
}

// Caller holds publish_mutex_ but not state_mutex_
void SimHub::publish(const std::vector<DeviceEvent> &events) {
  DeviceEventListener listener;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    listener = event_listener_;
  }
  if (!listener) {
    return;
  }
  for (const auto &event : events) {
    try {
      listener(event);
    } catch (const std::exception &e) {
      std::cerr << "[SimHub] Event listener failed for " << event.device_id
                << "/" << event.attribute << ": " << e.what() << std::endl;
    }
  }
}

} // namespace rules_hub
