#include "conditions/boolean_conditions.hpp"

#include <stdexcept>
#include <utility>

namespace rules_engine {

std::string join_descriptions(const std::vector<ConditionNode::Ptr> &nodes,
                              const std::string &separator) {
  std::string out;
  for (size_t i = 0; i < nodes.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += nodes[i]->describe();
  }
  return out;
}

static std::vector<ConditionNode::Ptr>
checked(std::vector<ConditionNode::Ptr> children, const char *what) {
  for (const auto &child : children) {
    if (!child) {
      throw std::invalid_argument(std::string(what) + ": null child condition");
    }
  }
  return children;
}

AllOfCondition::AllOfCondition(std::vector<Ptr> children)
    : ConditionNode(checked(std::move(children), "all_of")) {}

std::string AllOfCondition::describe() const {
  return "(" + join_descriptions(children(), " and ") + ")";
}

bool AllOfCondition::evaluate() {
  for (const auto &child : children()) {
    if (!child->current_state()) {
      return false;
    }
  }
  return true;
}

AnyOfCondition::AnyOfCondition(std::vector<Ptr> children)
    : ConditionNode(checked(std::move(children), "any_of")) {}

std::string AnyOfCondition::describe() const {
  return "(" + join_descriptions(children(), " or ") + ")";
}

bool AnyOfCondition::evaluate() {
  for (const auto &child : children()) {
    if (child->current_state()) {
      return true;
    }
  }
  return false;
}

NotCondition::NotCondition(Ptr child)
    : ConditionNode(checked({std::move(child)}, "not")) {}

std::string NotCondition::describe() const {
  return "not " + children().front()->describe();
}

bool NotCondition::evaluate() { return !children().front()->current_state(); }

} // namespace rules_engine
