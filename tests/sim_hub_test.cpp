#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "core/errors.hpp"
#include "hub/sim_hub.hpp"
#include "support/test_helpers.hpp"

using namespace rules_hub;
using hub_rules::Value;
using rules_testing::light;
using std::chrono::milliseconds;

namespace {

class SimHubTest : public ::testing::Test {
protected:
  void SetUp() override {
    hub_.add_device(light("lamp"));
    hub_.set_event_listener(
        [this](const DeviceEvent &e) { events_.push_back(e); });
  }

  SimHub hub_;
  ExecutionContext ctx_{"test-rule", "", ""};
  std::vector<DeviceEvent> events_;
};

} // namespace

TEST_F(SimHubTest, FetchReadsCache) {
  EXPECT_EQ(hub_.fetch(ctx_, "lamp", "switch"), Value(std::string("off")));
  EXPECT_TRUE(hub_.has_device("lamp"));
  EXPECT_FALSE(hub_.has_device("fan"));
}

TEST_F(SimHubTest, FetchFailuresRaiseDeviceCommunicationError) {
  EXPECT_THROW(hub_.fetch(ctx_, "fan", "switch"),
               hub_rules::DeviceCommunicationError);
  EXPECT_THROW(hub_.fetch(ctx_, "lamp", "colour"),
               hub_rules::DeviceCommunicationError);
}

TEST_F(SimHubTest, CommandPublishesOnlyChangedAttributes) {
  auto r = hub_.send_command(ctx_, "lamp", "on", {});
  ASSERT_TRUE(r.is_ok());
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].attribute, "switch");
  EXPECT_EQ(events_[0].value, Value(std::string("on")));

  // Already on: no event
  EXPECT_TRUE(hub_.send_command(ctx_, "lamp", "on", {}).is_ok());
  EXPECT_EQ(events_.size(), 1u);
}

TEST_F(SimHubTest, CommandArgumentsSubstitute) {
  auto r = hub_.send_command(ctx_, "lamp", "set_level", {Value(int64_t{75})});
  ASSERT_TRUE(r.is_ok());
  EXPECT_EQ(hub_.fetch(ctx_, "lamp", "level"), Value(int64_t{75}));
  EXPECT_EQ(hub_.fetch(ctx_, "lamp", "switch"), Value(std::string("on")));
  EXPECT_EQ(events_.size(), 2u);
}

TEST_F(SimHubTest, MissingArgumentLeavesDeviceUntouched) {
  auto r = hub_.send_command(ctx_, "lamp", "set_level", {});
  EXPECT_EQ(r.code, CommandCode::InvalidArgument);
  EXPECT_EQ(hub_.fetch(ctx_, "lamp", "switch"), Value(std::string("off")));
  EXPECT_TRUE(events_.empty());
}

TEST_F(SimHubTest, CommandStatusCodes) {
  EXPECT_EQ(hub_.send_command(ctx_, "fan", "on", {}).code,
            CommandCode::NotFound);
  EXPECT_EQ(hub_.send_command(ctx_, "lamp", "explode", {}).code,
            CommandCode::InvalidArgument);
}

TEST_F(SimHubTest, CommandListenerSeesContext) {
  std::string seen_rule;
  std::string seen_command;
  hub_.set_command_listener([&](const ExecutionContext &ctx, const DeviceId &,
                                const std::string &command,
                                const ValueList &) {
    seen_rule = ctx.rule_name;
    seen_command = command;
  });
  ASSERT_TRUE(hub_.send_command(ctx_, "lamp", "on", {}).is_ok());
  EXPECT_EQ(seen_rule, "test-rule");
  EXPECT_EQ(seen_command, "on");
}

TEST_F(SimHubTest, ApplyEventUpdatesCacheAndCreatesUnknownDevices) {
  hub_.apply_event(rules_testing::event("lamp", "switch", Value(std::string("on"))));
  EXPECT_EQ(hub_.fetch(ctx_, "lamp", "switch"), Value(std::string("on")));

  hub_.apply_event(rules_testing::event("motion", "motion", Value(std::string("active"))));
  EXPECT_TRUE(hub_.has_device("motion"));
  EXPECT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[1].device_id, "motion");
}

TEST_F(SimHubTest, ListenerMayReadBackAndFailuresAreContained) {
  hub_.set_event_listener([this](const DeviceEvent &e) {
    EXPECT_EQ(hub_.fetch(ctx_, e.device_id, e.attribute), e.value);
    throw std::runtime_error("listener failure");
  });
  EXPECT_NO_THROW(hub_.apply_event(
      rules_testing::event("lamp", "level", Value(int64_t{10}))));
  EXPECT_EQ(hub_.fetch(ctx_, "lamp", "level"), Value(int64_t{10}));
}

TEST_F(SimHubTest, DuplicateDeviceRejected) {
  EXPECT_THROW(hub_.add_device(light("lamp")), hub_rules::DuplicateError);
  EXPECT_EQ(hub_.list_devices().size(), 1u);
}

TEST_F(SimHubTest, InjectedFaultMakesDeviceUnavailable) {
  hub_.inject_device_unavailable("lamp", milliseconds(60000));
  EXPECT_THROW(hub_.fetch(ctx_, "lamp", "switch"),
               hub_rules::DeviceCommunicationError);
  EXPECT_EQ(hub_.send_command(ctx_, "lamp", "on", {}).code,
            CommandCode::Unavailable);

  hub_.clear_faults();
  EXPECT_NO_THROW(hub_.fetch(ctx_, "lamp", "switch"));
  EXPECT_THROW(hub_.inject_device_unavailable("fan", milliseconds(1)),
               hub_rules::NotFoundError);
}
