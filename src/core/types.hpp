#pragma once

#include <chrono>
#include <string>

#include "core/value.hpp"

namespace hub_rules {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

using DeviceId = std::string;

// Attribute change reported by the hub; delivered in arrival order
struct DeviceEvent {
  DeviceId device_id;
  std::string attribute;
  Value value;
  TimePoint timestamp;
};

// Identifies on whose behalf a collaborator call is made. Fields that do
// not apply to a call are left empty.
struct ExecutionContext {
  std::string rule_name;
  std::string scene_name;
  DeviceId device_id;

  ExecutionContext with_scene(const std::string &scene) const {
    ExecutionContext c = *this;
    c.scene_name = scene;
    return c;
  }

  ExecutionContext with_device(const DeviceId &device) const {
    ExecutionContext c = *this;
    c.device_id = device;
    return c;
  }
};

} // namespace hub_rules
