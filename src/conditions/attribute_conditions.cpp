#include "conditions/attribute_conditions.hpp"

#include <utility>

namespace rules_engine {

using hub_rules::compare_values;
using hub_rules::has_value;

static std::string describe_key(const AttributeKey &key) {
  return "device(" + key.device_id + ":" + key.attribute + ")";
}

// -----------------------------
// AttributeCondition
// -----------------------------

AttributeCondition::AttributeCondition(DeviceId device_id,
                                       std::string attribute, CompareOp op,
                                       Value operand)
    : key_{std::move(device_id), std::move(attribute)}, op_(op),
      operand_(std::move(operand)) {}

std::string AttributeCondition::describe() const {
  return describe_key(key_) + " " + hub_rules::to_string(op_) + " " +
         hub_rules::to_string(operand_);
}

std::vector<AttributeKey> AttributeCondition::watched_attributes() const {
  return {key_};
}

void AttributeCondition::load(const AttributeReader &read) {
  reading_ = hub_rules::coerce_like(read(key_.device_id, key_.attribute),
                                    operand_);
}

void AttributeCondition::apply(const DeviceEvent &event) {
  if (key_.matches(event)) {
    reading_ = hub_rules::coerce_like(event.value, operand_);
  }
}

bool AttributeCondition::evaluate() {
  if (!has_value(reading_)) {
    return false;
  }
  return compare_values(reading_, op_, operand_);
}

// -----------------------------
// DeviceComparisonCondition
// -----------------------------

DeviceComparisonCondition::DeviceComparisonCondition(AttributeKey left,
                                                     CompareOp op,
                                                     AttributeKey right)
    : left_(std::move(left)), op_(op), right_(std::move(right)) {}

std::string DeviceComparisonCondition::describe() const {
  return describe_key(left_) + " " + hub_rules::to_string(op_) + " " +
         describe_key(right_);
}

std::vector<AttributeKey> DeviceComparisonCondition::watched_attributes() const {
  if (left_ == right_) {
    return {left_};
  }
  return {left_, right_};
}

void DeviceComparisonCondition::load(const AttributeReader &read) {
  left_value_ = read(left_.device_id, left_.attribute);
  right_value_ = read(right_.device_id, right_.attribute);
}

void DeviceComparisonCondition::apply(const DeviceEvent &event) {
  if (left_.matches(event)) {
    left_value_ = event.value;
  }
  if (right_.matches(event)) {
    right_value_ = event.value;
  }
}

bool DeviceComparisonCondition::evaluate() {
  if (!has_value(left_value_) || !has_value(right_value_)) {
    return false;
  }
  return compare_values(left_value_, op_,
                        hub_rules::coerce_like(right_value_, left_value_));
}

// -----------------------------
// ChangeCondition
// -----------------------------

ChangeCondition::ChangeCondition(DeviceId device_id, std::string attribute)
    : key_{std::move(device_id), std::move(attribute)} {}

std::string ChangeCondition::describe() const {
  return "on_change(" + describe_key(key_) + ")";
}

std::vector<AttributeKey> ChangeCondition::watched_attributes() const {
  return {key_};
}

void ChangeCondition::load(const AttributeReader &read) {
  snapshot_ = read(key_.device_id, key_.attribute);
  changed_ = false;
}

void ChangeCondition::apply(const DeviceEvent &event) {
  if (!key_.matches(event) || changed_) {
    return;
  }
  const bool same = has_value(snapshot_) &&
                    compare_values(event.value, hub_rules::CompareOp::Equal,
                                   snapshot_);
  if (!same) {
    changed_ = true;
  }
}

bool ChangeCondition::evaluate() { return changed_; }

} // namespace rules_engine
