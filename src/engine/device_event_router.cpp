#include "engine/device_event_router.hpp"

namespace rules_engine {

void DeviceEventRouter::subscribe(const DeviceId &device_id,
                                  ConditionId leaf) {
  routes_[device_id].insert(leaf);
}

void DeviceEventRouter::unsubscribe(const DeviceId &device_id,
                                    ConditionId leaf) {
  auto it = routes_.find(device_id);
  if (it == routes_.end()) {
    return;
  }
  it->second.erase(leaf);
  // Drop empty entries so unrelated devices stay a miss
  if (it->second.empty()) {
    routes_.erase(it);
  }
}

void DeviceEventRouter::subscribe(const ConditionNode &leaf) {
  for (const auto &device_id : leaf.device_ids()) {
    subscribe(device_id, leaf.id());
  }
}

void DeviceEventRouter::unsubscribe(const ConditionNode &leaf) {
  for (const auto &device_id : leaf.device_ids()) {
    unsubscribe(device_id, leaf.id());
  }
}

const std::set<ConditionId> &
DeviceEventRouter::route(const DeviceId &device_id) const {
  static const std::set<ConditionId> kNone;
  auto it = routes_.find(device_id);
  return it == routes_.end() ? kNone : it->second;
}

} // namespace rules_engine
