#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace rules_engine {

using hub_rules::DeviceEvent;
using hub_rules::DeviceId;
using hub_rules::Value;

using ConditionId = uint64_t;

// One device attribute a leaf consumes events for
struct AttributeKey {
  DeviceId device_id;
  std::string attribute;

  bool operator==(const AttributeKey &o) const {
    return device_id == o.device_id && attribute == o.attribute;
  }
  bool matches(const DeviceEvent &e) const {
    return e.device_id == device_id && e.attribute == attribute;
  }
};

// Synchronous read of a device attribute's current value (hub fetch)
using AttributeReader =
    std::function<Value(const DeviceId &, const std::string &)>;

/**
 * @brief Node of a condition tree.
 *
 * Leaves watch device attributes and keep their own snapshot of the values
 * they compare; combinators derive their state from the cached states of
 * their children. Children are fixed at construction, so a tree can never
 * contain a cycle.
 *
 * Nodes are not internally synchronized. Once a tree is registered with the
 * RuleEngine it is only touched under the engine's lock.
 */
class ConditionNode {
public:
  using Ptr = std::shared_ptr<ConditionNode>;

  virtual ~ConditionNode() = default;

  ConditionNode(const ConditionNode &) = delete;
  ConditionNode &operator=(const ConditionNode &) = delete;

  ConditionId id() const { return id_; }

  // Human-readable identifier, used in logs and audit records
  virtual std::string describe() const = 0;

  const std::vector<Ptr> &children() const { return children_; }

  // Attributes whose events this node consumes. Empty for combinators.
  virtual std::vector<AttributeKey> watched_attributes() const { return {}; }

  // Distinct device ids watched by this node
  std::vector<DeviceId> device_ids() const;

  bool current_state() const { return state_; }

  bool primed() const { return primed_; }

  // Fetch current values for the whole subtree (children first) and compute
  // the initial states. Reader failures propagate to the caller.
  void prime(const AttributeReader &read);

  // Leaves fold the event into their snapshot when it matches a watched
  // attribute; combinators ignore it and re-derive from their children.
  // Returns the new state if it changed, nullopt otherwise.
  std::optional<bool> recompute(const DeviceEvent &event);

protected:
  explicit ConditionNode(std::vector<Ptr> children = {});

  virtual void load(const AttributeReader &read) { (void)read; }
  virtual void apply(const DeviceEvent &event) { (void)event; }
  virtual bool evaluate() = 0;

  // Called once after the subtree is loaded and the initial state computed
  virtual void on_primed() {}

private:
  const ConditionId id_;
  const std::vector<Ptr> children_;
  bool state_ = false;
  bool primed_ = false;
};

// Visit every node of a tree, parents before children
void for_each_node(const ConditionNode::Ptr &root,
                   const std::function<void(const ConditionNode::Ptr &)> &fn);

} // namespace rules_engine
