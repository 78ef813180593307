#pragma once

#include "conditions/condition_node.hpp"

namespace rules_engine {

using hub_rules::CompareOp;

// device.attribute <op> constant
class AttributeCondition : public ConditionNode {
public:
  AttributeCondition(DeviceId device_id, std::string attribute, CompareOp op,
                     Value operand);

  std::string describe() const override;
  std::vector<AttributeKey> watched_attributes() const override;

  const Value &reading() const { return reading_; }

protected:
  void load(const AttributeReader &read) override;
  void apply(const DeviceEvent &event) override;
  bool evaluate() override;

private:
  AttributeKey key_;
  CompareOp op_;
  Value operand_;
  Value reading_;
};

// deviceA.attribute <op> deviceB.attribute
class DeviceComparisonCondition : public ConditionNode {
public:
  DeviceComparisonCondition(AttributeKey left, CompareOp op,
                            AttributeKey right);

  std::string describe() const override;
  std::vector<AttributeKey> watched_attributes() const override;

protected:
  void load(const AttributeReader &read) override;
  void apply(const DeviceEvent &event) override;
  bool evaluate() override;

private:
  AttributeKey left_;
  CompareOp op_;
  AttributeKey right_;
  Value left_value_;
  Value right_value_;
};

// True once the attribute differs from the value captured when the node was
// primed. Latched: stays true until the tree is destroyed, so a flapping
// attribute cannot produce a second fire from the same tree.
class ChangeCondition : public ConditionNode {
public:
  ChangeCondition(DeviceId device_id, std::string attribute);

  std::string describe() const override;
  std::vector<AttributeKey> watched_attributes() const override;

  const Value &snapshot() const { return snapshot_; }

protected:
  void load(const AttributeReader &read) override;
  void apply(const DeviceEvent &event) override;
  bool evaluate() override;

private:
  AttributeKey key_;
  Value snapshot_;
  bool changed_ = false;
};

} // namespace rules_engine
