#include "conditions/scene_conditions.hpp"

#include <utility>

#include "conditions/attribute_conditions.hpp"

namespace rules_engine {

static std::vector<ConditionNode::Ptr>
requirement_leaves(const std::vector<SceneRequirement> &requirements) {
  std::vector<ConditionNode::Ptr> leaves;
  leaves.reserve(requirements.size());
  for (const auto &req : requirements) {
    leaves.push_back(std::make_shared<AttributeCondition>(
        req.device_id, req.attribute, hub_rules::CompareOp::Equal, req.value));
  }
  return leaves;
}

SceneSetCondition::SceneSetCondition(
    std::string scene_name, const std::vector<SceneRequirement> &requirements)
    : AllOfCondition(requirement_leaves(requirements)),
      scene_name_(std::move(scene_name)) {}

std::string SceneSetCondition::describe() const {
  return "scene_set(" + scene_name_ + ")";
}

SceneChangeCondition::SceneChangeCondition(
    std::string scene_name, const std::vector<SceneRequirement> &requirements)
    : ConditionNode(requirement_leaves(requirements)),
      scene_name_(std::move(scene_name)) {}

std::string SceneChangeCondition::describe() const {
  return "scene_change(" + scene_name_ + ")";
}

void SceneChangeCondition::load(const AttributeReader &read) {
  (void)read;
  snapshot_.clear();
  changed_ = false;
}

void SceneChangeCondition::on_primed() {
  snapshot_.clear();
  for (const auto &child : children()) {
    snapshot_.push_back(child->current_state());
  }
  changed_ = false;
}

bool SceneChangeCondition::evaluate() {
  // Called once during prime before the snapshot exists
  if (changed_ || snapshot_.size() != children().size()) {
    return changed_;
  }
  for (size_t i = 0; i < snapshot_.size(); ++i) {
    if (children()[i]->current_state() != snapshot_[i]) {
      changed_ = true;
      break;
    }
  }
  return changed_;
}

} // namespace rules_engine
