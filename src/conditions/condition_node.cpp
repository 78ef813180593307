#include "conditions/condition_node.hpp"

#include <algorithm>
#include <atomic>
#include <utility>

namespace rules_engine {

static std::atomic<ConditionId> g_next_condition_id{1};

ConditionNode::ConditionNode(std::vector<Ptr> children)
    : id_(g_next_condition_id.fetch_add(1)), children_(std::move(children)) {}

std::vector<DeviceId> ConditionNode::device_ids() const {
  std::vector<DeviceId> ids;
  for (const auto &key : watched_attributes()) {
    if (std::find(ids.begin(), ids.end(), key.device_id) == ids.end()) {
      ids.push_back(key.device_id);
    }
  }
  return ids;
}

void ConditionNode::prime(const AttributeReader &read) {
  for (const auto &child : children_) {
    child->prime(read);
  }
  load(read);
  state_ = evaluate();
  primed_ = true;
  on_primed();
}

std::optional<bool> ConditionNode::recompute(const DeviceEvent &event) {
  apply(event);
  const bool next = evaluate();
  if (next == state_) {
    return std::nullopt;
  }
  state_ = next;
  return next;
}

void for_each_node(const ConditionNode::Ptr &root,
                   const std::function<void(const ConditionNode::Ptr &)> &fn) {
  if (!root) {
    return;
  }
  fn(root);
  for (const auto &child : root->children()) {
    for_each_node(child, fn);
  }
}

} // namespace rules_engine
