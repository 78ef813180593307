#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <stdexcept>

#include "conditions/attribute_conditions.hpp"
#include "conditions/boolean_conditions.hpp"
#include "conditions/scene_conditions.hpp"
#include "support/test_helpers.hpp"

using namespace rules_engine;
using hub_rules::CompareOp;
using hub_rules::Value;
using rules_testing::event;

namespace {

// Attribute table standing in for hub fetches
class FakeReadings {
public:
  void set(const std::string &device, const std::string &attr, Value v) {
    values_[{device, attr}] = std::move(v);
  }

  AttributeReader reader() {
    return [this](const DeviceId &device, const std::string &attr) {
      auto it = values_.find({device, attr});
      if (it == values_.end()) {
        throw std::runtime_error("no reading for " + device + "/" + attr);
      }
      return it->second;
    };
  }

private:
  std::map<std::pair<std::string, std::string>, Value> values_;
};

// Feed an event through a leaf and its parent, as the engine would
void deliver(ConditionNode &leaf, ConditionNode *parent,
             const hub_rules::DeviceEvent &e) {
  if (leaf.recompute(e) && parent != nullptr) {
    parent->recompute(e);
  }
}

} // namespace

TEST(AttributeConditionTest, PrimesFromReaderAndTracksEvents) {
  FakeReadings readings;
  readings.set("thermo", "temperature", Value(int64_t{18}));

  AttributeCondition cond("thermo", "temperature", CompareOp::Greater,
                          Value(int64_t{20}));
  cond.prime(readings.reader());
  EXPECT_TRUE(cond.primed());
  EXPECT_FALSE(cond.current_state());

  auto changed = cond.recompute(event("thermo", "temperature", Value(21.5)));
  ASSERT_TRUE(changed.has_value());
  EXPECT_TRUE(*changed);

  // Same state again reports no transition
  EXPECT_FALSE(cond.recompute(event("thermo", "temperature", Value(int64_t{25})))
                   .has_value());
}

TEST(AttributeConditionTest, NoReadingYetIsFalse) {
  AttributeCondition cond("motion", "motion", CompareOp::Equal,
                          Value(std::string("active")));
  EXPECT_FALSE(cond.primed());
  EXPECT_FALSE(cond.current_state());

  cond.prime([](const DeviceId &, const std::string &) { return Value{}; });
  EXPECT_FALSE(cond.current_state());

  auto changed =
      cond.recompute(event("motion", "motion", Value(std::string("active"))));
  ASSERT_TRUE(changed.has_value());
  EXPECT_TRUE(*changed);
}

TEST(AttributeConditionTest, IgnoresOtherAttributes) {
  FakeReadings readings;
  readings.set("door", "contact", Value(std::string("closed")));

  AttributeCondition cond("door", "contact", CompareOp::Equal,
                          Value(std::string("open")));
  cond.prime(readings.reader());
  EXPECT_FALSE(
      cond.recompute(event("door", "battery", Value(std::string("open"))))
          .has_value());
  EXPECT_FALSE(cond.current_state());
}

TEST(AttributeConditionTest, BoolOperandCoercesStrings) {
  FakeReadings readings;
  readings.set("motion", "motion", Value(std::string("active")));

  AttributeCondition cond("motion", "motion", CompareOp::Equal, Value(true));
  cond.prime(readings.reader());
  EXPECT_TRUE(cond.current_state());
}

TEST(AttributeConditionTest, DescribeNamesDeviceAttributeAndOperand) {
  AttributeCondition cond("lux", "illuminance", CompareOp::Less,
                          Value(int64_t{40}));
  EXPECT_EQ(cond.describe(), "device(lux:illuminance) < 40");
}

TEST(AttributeConditionTest, ReaderFailurePropagates) {
  FakeReadings readings;
  AttributeCondition cond("ghost", "x", CompareOp::Equal, Value(int64_t{1}));
  EXPECT_THROW(cond.prime(readings.reader()), std::runtime_error);
  EXPECT_FALSE(cond.primed());
}

TEST(DeviceComparisonConditionTest, ComparesTwoDevices) {
  FakeReadings readings;
  readings.set("inside", "temperature", Value(int64_t{22}));
  readings.set("outside", "temperature", Value(int64_t{25}));

  DeviceComparisonCondition cond({"inside", "temperature"}, CompareOp::Greater,
                                 {"outside", "temperature"});
  cond.prime(readings.reader());
  EXPECT_FALSE(cond.current_state());
  EXPECT_EQ(cond.watched_attributes().size(), 2u);
  EXPECT_EQ(cond.device_ids().size(), 2u);

  auto changed = cond.recompute(event("outside", "temperature", Value(20.0)));
  ASSERT_TRUE(changed.has_value());
  EXPECT_TRUE(*changed);
}

TEST(ChangeConditionTest, LatchesOnFirstDifference) {
  FakeReadings readings;
  readings.set("door", "contact", Value(std::string("closed")));

  ChangeCondition cond("door", "contact");
  cond.prime(readings.reader());
  EXPECT_FALSE(cond.current_state());

  EXPECT_FALSE(
      cond.recompute(event("door", "contact", Value(std::string("closed"))))
          .has_value());

  auto changed =
      cond.recompute(event("door", "contact", Value(std::string("open"))));
  ASSERT_TRUE(changed.has_value());
  EXPECT_TRUE(*changed);

  // Going back to the snapshot value keeps the latch
  EXPECT_FALSE(
      cond.recompute(event("door", "contact", Value(std::string("closed"))))
          .has_value());
  EXPECT_TRUE(cond.current_state());
}

TEST(ChangeConditionTest, ReprimeTakesFreshSnapshot) {
  FakeReadings readings;
  readings.set("door", "contact", Value(std::string("closed")));

  ChangeCondition cond("door", "contact");
  cond.prime(readings.reader());
  cond.recompute(event("door", "contact", Value(std::string("open"))));
  ASSERT_TRUE(cond.current_state());

  readings.set("door", "contact", Value(std::string("open")));
  cond.prime(readings.reader());
  EXPECT_FALSE(cond.current_state());
  EXPECT_EQ(cond.snapshot(), Value(std::string("open")));
}

TEST(BooleanConditionTest, AllOfAnyOfNot) {
  FakeReadings readings;
  readings.set("a", "x", Value(int64_t{1}));
  readings.set("b", "x", Value(int64_t{0}));

  auto a = std::make_shared<AttributeCondition>("a", "x", CompareOp::Equal,
                                                Value(int64_t{1}));
  auto b = std::make_shared<AttributeCondition>("b", "x", CompareOp::Equal,
                                                Value(int64_t{1}));
  AllOfCondition all({a, b});
  AnyOfCondition any({a, b});
  NotCondition not_b(b);

  all.prime(readings.reader());
  any.prime(readings.reader());
  not_b.prime(readings.reader());

  EXPECT_FALSE(all.current_state());
  EXPECT_TRUE(any.current_state());
  EXPECT_TRUE(not_b.current_state());

  deliver(*b, &all, event("b", "x", Value(int64_t{1})));
  EXPECT_TRUE(all.current_state());
  EXPECT_TRUE(not_b.recompute(event("b", "x", Value(int64_t{1}))).has_value());
  EXPECT_FALSE(not_b.current_state());
}

TEST(BooleanConditionTest, EmptyAllOfIsTrue) {
  FakeReadings readings;
  AllOfCondition all(std::vector<ConditionNode::Ptr>{});
  all.prime(readings.reader());
  EXPECT_TRUE(all.current_state());
}

TEST(BooleanConditionTest, RejectsNullChildren) {
  EXPECT_THROW(AllOfCondition({nullptr}), std::invalid_argument);
  EXPECT_THROW(NotCondition(nullptr), std::invalid_argument);
}

TEST(BooleanConditionTest, DescribeComposes) {
  auto a = std::make_shared<AttributeCondition>("a", "x", CompareOp::Equal,
                                                Value(int64_t{1}));
  auto b = std::make_shared<ChangeCondition>("b", "y");
  AnyOfCondition any({a, b});
  EXPECT_EQ(any.describe(),
            "(device(a:x) == 1 or on_change(device(b:y)))");
}

TEST(SceneConditionTest, SceneSetRequiresEveryRequirement) {
  FakeReadings readings;
  readings.set("lamp", "switch", Value(std::string("on")));
  readings.set("blind", "position", Value(int64_t{30}));

  SceneSetCondition cond("evening",
                         {{"lamp", "switch", Value(std::string("on"))},
                          {"blind", "position", Value(int64_t{0})}});
  cond.prime(readings.reader());
  EXPECT_FALSE(cond.current_state());
  EXPECT_EQ(cond.describe(), "scene_set(evening)");

  deliver(*cond.children()[1], &cond, event("blind", "position", Value(int64_t{0})));
  EXPECT_TRUE(cond.current_state());
}

TEST(SceneConditionTest, SceneChangeLatchesOnMembershipChange) {
  FakeReadings readings;
  readings.set("lamp", "switch", Value(std::string("on")));

  SceneChangeCondition cond("reading",
                            {{"lamp", "switch", Value(std::string("on"))}});
  cond.prime(readings.reader());
  EXPECT_FALSE(cond.current_state());

  deliver(*cond.children()[0], &cond,
          event("lamp", "switch", Value(std::string("off"))));
  EXPECT_TRUE(cond.current_state());

  deliver(*cond.children()[0], &cond,
          event("lamp", "switch", Value(std::string("on"))));
  EXPECT_TRUE(cond.current_state());

  // Re-priming starts a new observation
  cond.prime(readings.reader());
  EXPECT_FALSE(cond.current_state());
}

TEST(ConditionNodeTest, IdsAreUniqueAndTreeIsVisitedParentFirst) {
  auto leaf = std::make_shared<ChangeCondition>("d", "a");
  auto root = std::make_shared<NotCondition>(leaf);
  EXPECT_NE(root->id(), leaf->id());

  std::vector<ConditionId> order;
  for_each_node(root,
                [&](const ConditionNode::Ptr &n) { order.push_back(n->id()); });
  ASSERT_EQ(order.size(), 2u);
  EXPECT_EQ(order[0], root->id());
  EXPECT_EQ(order[1], leaf->id());
}
