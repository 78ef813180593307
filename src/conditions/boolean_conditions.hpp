#pragma once

#include "conditions/condition_node.hpp"

namespace rules_engine {

// True when every child is true. An empty AllOf is true.
class AllOfCondition : public ConditionNode {
public:
  explicit AllOfCondition(std::vector<Ptr> children);

  std::string describe() const override;

protected:
  bool evaluate() override;
};

// True when at least one child is true. An empty AnyOf is false.
class AnyOfCondition : public ConditionNode {
public:
  explicit AnyOfCondition(std::vector<Ptr> children);

  std::string describe() const override;

protected:
  bool evaluate() override;
};

class NotCondition : public ConditionNode {
public:
  explicit NotCondition(Ptr child);

  std::string describe() const override;

protected:
  bool evaluate() override;
};

std::string join_descriptions(const std::vector<ConditionNode::Ptr> &nodes,
                              const std::string &separator);

} // namespace rules_engine
