#pragma once

#include "conditions/boolean_conditions.hpp"

namespace rules_engine {

// A scene's declared target: device.attribute should equal value
struct SceneRequirement {
  DeviceId device_id;
  std::string attribute;
  Value value;
};

// Scene is set: AllOf over equality leaves, one per requirement
class SceneSetCondition : public AllOfCondition {
public:
  SceneSetCondition(std::string scene_name,
                    const std::vector<SceneRequirement> &requirements);

  std::string describe() const override;

private:
  std::string scene_name_;
};

// Scene membership changed: true once any requirement's match state differs
// from the match state captured at prime time. Latched like ChangeCondition.
class SceneChangeCondition : public ConditionNode {
public:
  SceneChangeCondition(std::string scene_name,
                       const std::vector<SceneRequirement> &requirements);

  std::string describe() const override;

protected:
  void load(const AttributeReader &read) override;
  bool evaluate() override;
  void on_primed() override;

private:
  std::string scene_name_;
  std::vector<bool> snapshot_;
  bool changed_ = false;
};

} // namespace rules_engine
