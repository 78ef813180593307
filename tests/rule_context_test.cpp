#include <gtest/gtest.h>

#include <atomic>

#include "core/errors.hpp"
#include "support/rule_harness.hpp"
#include "support/test_helpers.hpp"

using namespace rules_exec;
using hub_rules::CompareOp;
using hub_rules::Value;
using rules_testing::eventually;
using rules_testing::light;
using rules_testing::sensor;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

class RuleContextTest : public ::testing::Test {
protected:
  void SetUp() override {
    h_.hub.add_device(light("lamp"));
    h_.hub.add_device(sensor("door", "contact", Value(std::string("closed"))));
  }

  void TearDown() override {
    if (task_) {
      task_->cancel();
      task_->join();
    }
  }

  // Context for calls that never suspend, made on the test thread
  RuleContext direct_context() {
    return RuleContext(h_.services(), std::make_shared<RuleTask>("direct"),
                       hub_rules::ExecutionContext{"direct", "", ""});
  }

  rules_testing::RuleHarness h_;
  std::shared_ptr<RuleTask> task_;
  std::atomic<bool> done_{false};
  std::atomic<int> result_{-1};
};

} // namespace

TEST_F(RuleContextTest, WaitSuspendsUntilTimerFires) {
  task_ = h_.run("sleeper", [this](RuleContext &ctx) {
    ctx.wait(seconds(5));
    done_ = true;
  });

  ASSERT_TRUE(h_.timers.wait_for_pending(1));
  h_.timers.advance(seconds(4));
  EXPECT_FALSE(done_.load());
  h_.timers.advance(seconds(1));
  EXPECT_TRUE(eventually([this]() { return done_.load(); }));
}

TEST_F(RuleContextTest, WaitForAlreadyTrueReturnsWithoutRegistering) {
  task_ = h_.run("immediate", [this](RuleContext &ctx) {
    result_ = ctx.wait_for(ctx.device("door").attribute("contact").compare(
        CompareOp::Equal, Value(std::string("closed"))));
    done_ = true;
  });
  ASSERT_TRUE(eventually([this]() { return done_.load(); }));
  EXPECT_EQ(result_.load(), 1);
  EXPECT_EQ(h_.engine.tree_count(), 0u);
}

TEST_F(RuleContextTest, WaitForResumesWhenConditionBecomesTrue) {
  task_ = h_.run("door-watch", [this](RuleContext &ctx) {
    result_ = ctx.wait_for(ctx.device("door").attribute("contact").compare(
                               CompareOp::Equal, Value(std::string("open"))),
                           seconds(30));
    done_ = true;
  });
  ASSERT_TRUE(eventually([this]() { return h_.engine.tree_count() == 1; }));
  h_.publish("door", "contact", Value(std::string("open")));
  ASSERT_TRUE(eventually([this]() { return done_.load(); }));
  EXPECT_EQ(result_.load(), 1);
  EXPECT_EQ(h_.timers.pending_count(), 0u);
}

TEST_F(RuleContextTest, WaitForTimesOut) {
  task_ = h_.run("door-watch", [this](RuleContext &ctx) {
    result_ = ctx.wait_for(ctx.device("door").attribute("contact").compare(
                               CompareOp::Equal, Value(std::string("open"))),
                           seconds(30));
    done_ = true;
  });
  ASSERT_TRUE(eventually([this]() { return h_.engine.tree_count() == 1; }));
  h_.timers.advance(seconds(30));
  ASSERT_TRUE(eventually([this]() { return done_.load(); }));
  EXPECT_EQ(result_.load(), 0);
  EXPECT_EQ(h_.engine.tree_count(), 0u);
}

TEST_F(RuleContextTest, WaitForWithDurationRegistersEvenWhenTrue) {
  task_ = h_.run("held", [this](RuleContext &ctx) {
    result_ = ctx.wait_for(ctx.device("door").attribute("contact").compare(
                               CompareOp::Equal, Value(std::string("closed"))),
                           std::nullopt, seconds(10));
    done_ = true;
  });
  ASSERT_TRUE(eventually([this]() { return h_.engine.tree_count() == 1; }));
  h_.timers.advance(seconds(10));
  ASSERT_TRUE(eventually([this]() { return done_.load(); }));
  EXPECT_EQ(result_.load(), 1);
}

TEST_F(RuleContextTest, WaitForChangeSeesNextDifferentValue) {
  task_ = h_.run("change", [this](RuleContext &ctx) {
    result_ = ctx.wait_for_change(AttributeRef("door", "contact"), seconds(60));
    done_ = true;
  });
  ASSERT_TRUE(eventually([this]() { return h_.engine.tree_count() == 1; }));
  h_.publish("door", "contact", Value(std::string("closed")));
  EXPECT_FALSE(done_.load());
  h_.publish("door", "contact", Value(std::string("open")));
  ASSERT_TRUE(eventually([this]() { return done_.load(); }));
  EXPECT_EQ(result_.load(), 1);
}

TEST_F(RuleContextTest, WaitUntilSleepsToNextOccurrence) {
  const auto time = rules_timing::parse_time_of_day("07:00");
  const auto expected = rules_timing::next_occurrence(h_.timers.now(), time);

  task_ = h_.run("alarm", [this, time](RuleContext &ctx) {
    ctx.wait_until(time);
    done_ = true;
  });
  ASSERT_TRUE(h_.timers.wait_for_pending(1));
  EXPECT_EQ(h_.timers.next_deadline(), expected);
  h_.timers.advance_to(expected);
  EXPECT_TRUE(eventually([this]() { return done_.load(); }));
}

TEST_F(RuleContextTest, CancelDuringConditionWaitCleansUp) {
  task_ = h_.run("cancelled", [this](RuleContext &ctx) {
    ctx.wait_for(ctx.device("door").attribute("contact").compare(
                     CompareOp::Equal, Value(std::string("open"))),
                 seconds(30));
    done_ = true;
  });
  ASSERT_TRUE(eventually([this]() { return h_.engine.tree_count() == 1; }));

  task_->cancel();
  task_->join();
  EXPECT_FALSE(done_.load());
  EXPECT_EQ(h_.engine.tree_count(), 0u);
  EXPECT_EQ(h_.timers.pending_count(), 0u);
  EXPECT_FALSE(task_->running());
}

TEST_F(RuleContextTest, CancelDuringSleepCancelsTimer) {
  task_ = h_.run("sleeper", [this](RuleContext &ctx) {
    ctx.wait(seconds(60));
    done_ = true;
  });
  ASSERT_TRUE(h_.timers.wait_for_pending(1));
  task_->cancel();
  task_->join();
  EXPECT_FALSE(done_.load());
  EXPECT_EQ(h_.timers.pending_count(), 0u);
}

TEST_F(RuleContextTest, CheckEvaluatesWithoutRegistering) {
  auto ctx = direct_context();
  auto closed = ctx.device("door").attribute("contact").compare(
      CompareOp::Equal, Value(std::string("closed")));
  EXPECT_TRUE(ctx.check(closed));
  EXPECT_FALSE(ctx.check(RuleContext::is_not(
      ctx.device("door").attribute("contact").compare(
          CompareOp::Equal, Value(std::string("closed"))))));
  EXPECT_EQ(h_.engine.tree_count(), 0u);
}

TEST_F(RuleContextTest, CommandFailureBecomesDeviceCommunicationError) {
  auto ctx = direct_context();
  EXPECT_NO_THROW(ctx.device("lamp").command("on"));
  EXPECT_EQ(ctx.device("lamp").value("switch"), Value(std::string("on")));
  EXPECT_THROW(ctx.device("lamp").command("explode"),
               hub_rules::DeviceCommunicationError);
  EXPECT_THROW(ctx.device("fan").command("on"),
               hub_rules::DeviceCommunicationError);
}

TEST_F(RuleContextTest, SceneEnableIsAudited) {
  rules_scenes::Scene scene;
  scene.name = "lights-on";
  scene.device_states.push_back(
      {"lamp", "switch", Value(std::string("on")), "on", {}});
  h_.scenes.create_scene(scene);

  auto ctx = direct_context();
  EXPECT_FALSE(ctx.check(ctx.scene("lights-on").is_set()));
  const auto result = ctx.scene("lights-on").enable();
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(ctx.check(ctx.scene("lights-on").is_set()));

  const auto events = h_.audit.events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, rules_audit::AuditKind::SceneApplied);
  EXPECT_EQ(events[0].context.rule_name, "direct");
  EXPECT_EQ(events[0].context.scene_name, "lights-on");

  EXPECT_THROW(ctx.scene("missing").enable(), hub_rules::ScriptError);
  EXPECT_THROW(ctx.scene("missing").is_set(), hub_rules::ScriptError);
}

TEST_F(RuleContextTest, DeviceComparisonAcrossDevices) {
  h_.hub.add_device(sensor("inside", "temperature", Value(int64_t{22})));
  h_.hub.add_device(sensor("outside", "temperature", Value(int64_t{18})));
  auto ctx = direct_context();
  auto warmer = ctx.device("inside").attribute("temperature").compare(
      CompareOp::Greater, ctx.device("outside").attribute("temperature"));
  EXPECT_TRUE(ctx.check(warmer));
}
