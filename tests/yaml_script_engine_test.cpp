#include <gtest/gtest.h>

#include <atomic>

#include "core/errors.hpp"
#include "rules/yaml_script_engine.hpp"
#include "support/rule_harness.hpp"
#include "support/test_helpers.hpp"

using namespace rules_exec;
using hub_rules::Value;
using rules_testing::eventually;
using std::chrono::minutes;
using std::chrono::seconds;

TEST(ParseDurationTest, AcceptsAllUnits) {
  EXPECT_EQ(parse_duration("250ms"), Duration(250));
  EXPECT_EQ(parse_duration("10s"), seconds(10));
  EXPECT_EQ(parse_duration(" 5 m "), minutes(5));
  EXPECT_EQ(parse_duration("2h"), std::chrono::hours(2));
  EXPECT_EQ(parse_duration("0s"), Duration::zero());
}

TEST(ParseDurationTest, RejectsMalformed) {
  EXPECT_THROW(parse_duration(""), std::invalid_argument);
  EXPECT_THROW(parse_duration("10"), std::invalid_argument);
  EXPECT_THROW(parse_duration("-5s"), std::invalid_argument);
  EXPECT_THROW(parse_duration("1.5s"), std::invalid_argument);
  EXPECT_THROW(parse_duration("3d"), std::invalid_argument);
}

TEST(YamlCompileTest, RejectsBadTriggers) {
  YamlScriptEngine engine;
  const char *bad[] = {
      "[1, 2]",
      "timeout: 1m",
      "{device: d, attribute: a}",
      "{device: d, attribute: a, value: 1, other: {device: e, attribute: a}}",
      "{device: d, attribute: a, op: '=~', value: 1}",
      "{device: d, attribute: a, value: 1, colour: red}",
      "{device: d, attribute: a, value: 1, timeout: soon}",
      "{all_of: [{device: d, attribute: a, value: 1, for: 5s}]}",
      "{all_of: {device: d, attribute: a, value: 1}}",
      "{device: d, attribute: a, value: 1, not: {scene_set: s}}",
      "{scene_set: [a, b]}",
      "{on_change: {device: d}}",
      "{device: d, attribute: a, value: [1",
  };
  for (const char *text : bad) {
    EXPECT_THROW(engine.compile_trigger(text), hub_rules::ScriptError) << text;
  }
}

TEST(YamlCompileTest, ReportsPathOfNestedError) {
  YamlScriptEngine engine;
  try {
    engine.compile_trigger(
        "any_of:\n"
        "  - {device: d, attribute: a, value: 1}\n"
        "  - {device: d, attribute: a}\n");
    FAIL() << "expected ScriptError";
  } catch (const hub_rules::ScriptError &e) {
    EXPECT_NE(std::string(e.what()).find("trigger.any_of[1]"),
              std::string::npos)
        << e.what();
  }
}

TEST(YamlCompileTest, RejectsBadTimers) {
  YamlScriptEngine engine;
  EXPECT_THROW(engine.compile_timer("every: 0s"), hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_timer("every: often"), hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_timer("at: '25:00'"), hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_timer("{every: 1m, at: '07:00'}"),
               hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_timer("cron: '* * * * *'"),
               hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_timer("{}"), hub_rules::ScriptError);
}

TEST(YamlCompileTest, RejectsBadActions) {
  YamlScriptEngine engine;
  EXPECT_THROW(engine.compile_action("command: {device: d, name: on}"),
               hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_action("- explode: now"), hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_action("- {wait: 1s, log: hi}"),
               hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_action("- command: {device: d}"),
               hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_action("- command: {device: d, name: x, args: 1}"),
               hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_action("- wait: forever"), hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_action("- wait_for: {timeout: 1s}"),
               hub_rules::ScriptError);
  EXPECT_THROW(engine.compile_action("- wait_until: noon"),
               hub_rules::ScriptError);
  EXPECT_THROW(
      engine.compile_action("- if: {condition: {scene_set: s}, then: x}"),
      hub_rules::ScriptError);
}

TEST(YamlCompileTest, AcceptsEveryStepKind) {
  YamlScriptEngine engine;
  EXPECT_NO_THROW(engine.compile_action(
      "- command: {device: lamp, name: set_level, args: [80]}\n"
      "- wait: 5m\n"
      "- wait_for:\n"
      "    condition: {device: door, attribute: contact, value: closed}\n"
      "    timeout: 1m\n"
      "    for: 5s\n"
      "    then: [{log: closed}]\n"
      "    else: [{log: still open}]\n"
      "- wait_for_change: {device: door, attribute: contact, timeout: 30s}\n"
      "- wait_until: '07:00'\n"
      "- scene: evening\n"
      "- if: {condition: {not: {scene_set: evening}}, then: [{log: x}]}\n"
      "- log: done\n"));
}

namespace {

class YamlScriptRunTest : public ::testing::Test {
protected:
  void SetUp() override {
    h_.hub.add_device(rules_testing::light("lamp"));
    h_.hub.add_device(rules_testing::sensor("motion", "motion",
                                            Value(std::string("inactive"))));
    h_.hub.add_device(
        rules_testing::sensor("lux", "illuminance", Value(int64_t{100})));
  }

  void TearDown() override {
    if (task_) {
      task_->cancel();
      task_->join();
    }
  }

  RuleContext direct_context() {
    return RuleContext(h_.services(), std::make_shared<RuleTask>("direct"),
                       hub_rules::ExecutionContext{"direct", "", ""});
  }

  rules_testing::RuleHarness h_;
  YamlScriptEngine engine_;
  std::shared_ptr<RuleTask> task_;
  std::atomic<bool> done_{false};
};

} // namespace

TEST_F(YamlScriptRunTest, TriggerBuildsConditionTree) {
  auto trigger = engine_.compile_trigger(
      "all_of:\n"
      "  - {device: motion, attribute: motion, value: active}\n"
      "  - {device: lux, attribute: illuminance, op: '<', value: 40}\n"
      "timeout: 10m\n"
      "for: 0s\n");
  auto ctx = direct_context();
  const Trigger t = trigger->invoke(ctx);

  ASSERT_NE(t.condition, nullptr);
  EXPECT_EQ(t.condition->describe(),
            "(device(motion:motion) == active and "
            "device(lux:illuminance) < 40)");
  ASSERT_TRUE(t.timeout.has_value());
  EXPECT_EQ(*t.timeout, minutes(10));
  ASSERT_TRUE(t.for_duration.has_value());
  EXPECT_EQ(*t.for_duration, Duration::zero());

  // Every invocation builds a fresh tree
  const Trigger again = trigger->invoke(ctx);
  EXPECT_NE(again.condition->id(), t.condition->id());
}

TEST_F(YamlScriptRunTest, TriggerWithUnknownSceneFailsAtInvoke) {
  auto trigger = engine_.compile_trigger("scene_set: missing");
  auto ctx = direct_context();
  EXPECT_THROW(trigger->invoke(ctx), hub_rules::ScriptError);
}

TEST_F(YamlScriptRunTest, EveryTimerAddsPeriodToNow) {
  auto timer = engine_.compile_timer("every: 30m");
  auto ctx = direct_context();
  EXPECT_EQ(timer->invoke(ctx), h_.timers.now() + minutes(30));
}

TEST_F(YamlScriptRunTest, DailyTimerUsesNextOccurrence) {
  auto timer = engine_.compile_timer("at: '06:30'");
  auto ctx = direct_context();
  EXPECT_EQ(timer->invoke(ctx),
            rules_timing::next_occurrence(h_.timers.now(), {6, 30, 0}));
}

TEST_F(YamlScriptRunTest, IfStepPicksBranchFromCurrentState) {
  auto action = engine_.compile_action(
      "- if:\n"
      "    condition: {device: lux, attribute: illuminance, op: '>', value: 50}\n"
      "    then: [{command: {device: lamp, name: off}}]\n"
      "    else: [{command: {device: lamp, name: set_level, args: [75]}}]\n");
  auto ctx = direct_context();

  action->invoke(ctx);
  EXPECT_EQ(h_.hub.fetch({}, "lamp", "level"), Value(int64_t{0}));

  h_.publish("lux", "illuminance", Value(int64_t{10}));
  action->invoke(ctx);
  EXPECT_EQ(h_.hub.fetch({}, "lamp", "level"), Value(int64_t{75}));
  EXPECT_EQ(h_.hub.fetch({}, "lamp", "switch"), Value(std::string("on")));
  EXPECT_EQ(h_.engine.tree_count(), 0u);
}

TEST_F(YamlScriptRunTest, FailedCommandAbortsRemainingSteps) {
  auto action = engine_.compile_action(
      "- command: {device: lamp, name: explode}\n"
      "- command: {device: lamp, name: on}\n");
  auto ctx = direct_context();
  EXPECT_THROW(action->invoke(ctx), hub_rules::DeviceCommunicationError);
  EXPECT_EQ(h_.hub.fetch({}, "lamp", "switch"), Value(std::string("off")));
}

TEST_F(YamlScriptRunTest, WaitStepsSuspendTheRule) {
  auto action = engine_.compile_action(
      "- command: {device: lamp, name: on}\n"
      "- wait: 5m\n"
      "- wait_for:\n"
      "    condition: {device: motion, attribute: motion, value: active}\n"
      "    timeout: 1m\n"
      "    else: [{command: {device: lamp, name: off}}]\n");

  task_ = h_.run("steps", [this, action](RuleContext &ctx) {
    action->invoke(ctx);
    done_ = true;
  });

  ASSERT_TRUE(h_.timers.wait_for_pending(1));
  EXPECT_EQ(h_.hub.fetch({}, "lamp", "switch"), Value(std::string("on")));
  h_.timers.advance(minutes(5));

  ASSERT_TRUE(eventually([this]() { return h_.engine.tree_count() == 1; }));
  h_.timers.advance(minutes(1));
  ASSERT_TRUE(eventually([this]() { return done_.load(); }));
  EXPECT_EQ(h_.hub.fetch({}, "lamp", "switch"), Value(std::string("off")));
}

TEST_F(YamlScriptRunTest, SceneStepAppliesScene) {
  rules_scenes::Scene scene;
  scene.name = "reading";
  scene.device_states.push_back(
      {"lamp", "level", Value(int64_t{60}), "set_level", {Value(int64_t{60})}});
  h_.scenes.create_scene(scene);

  auto action = engine_.compile_action("- scene: reading\n");
  auto ctx = direct_context();
  action->invoke(ctx);

  EXPECT_EQ(h_.hub.fetch({}, "lamp", "level"), Value(int64_t{60}));
  EXPECT_EQ(h_.audit.count(rules_audit::AuditKind::SceneApplied), 1u);
}
