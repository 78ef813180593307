#pragma once

#include <set>
#include <unordered_map>

#include "conditions/condition_node.hpp"

namespace rules_engine {

// Device id -> leaf conditions interested in that device.
// Not synchronized; owned and guarded by the RuleEngine.
class DeviceEventRouter {
public:
  void subscribe(const DeviceId &device_id, ConditionId leaf);
  void unsubscribe(const DeviceId &device_id, ConditionId leaf);

  // Subscribe/unsubscribe every watched device of the leaf
  void subscribe(const ConditionNode &leaf);
  void unsubscribe(const ConditionNode &leaf);

  // Leaves interested in the device; empty set for unknown devices
  const std::set<ConditionId> &route(const DeviceId &device_id) const;

  size_t device_count() const { return routes_.size(); }

private:
  std::unordered_map<DeviceId, std::set<ConditionId>> routes_;
};

} // namespace rules_engine
