#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "robomaster_teleop/teleop_config.hpp"

using robomaster_teleop::TeleopConfig;
using namespace std::chrono_literals;

namespace
{

class TeleopConfigTest : public ::testing::Test
{
protected:
  static void SetUpTestSuite() {rclcpp::init(0, nullptr);}
  static void TearDownTestSuite() {rclcpp::shutdown();}

  std::shared_ptr<rclcpp::Node> makeNode(const std::vector<rclcpp::Parameter> & overrides)
  {
    rclcpp::NodeOptions options;
    options.parameter_overrides(overrides);
    return std::make_shared<rclcpp::Node>("teleop_config_test", options);
  }
};

}  // namespace

TEST_F(TeleopConfigTest, DefaultsMatchDriveSettings)
{
  auto node = makeNode({});
  const auto config = TeleopConfig::load(*node);

  EXPECT_EQ(config.queue_size, 10u);
  EXPECT_EQ(config.push_frequency, 1);
  EXPECT_DOUBLE_EQ(config.timeout_unit, 0.1);
  EXPECT_DOUBLE_EQ(config.unit_delta_speed, 0.2);
  EXPECT_DOUBLE_EQ(config.unit_delta_degree, 20.0);
  EXPECT_EQ(config.cmd_vel_topic, "/cmd_vel");
  EXPECT_EQ(config.event_topic, "/robot/events");
  EXPECT_EQ(config.queueTimeout(), 100ms);
  EXPECT_TRUE(node->has_parameter("keyboard_device"));
}

TEST_F(TeleopConfigTest, OverridesAreApplied)
{
  auto node = makeNode({
      rclcpp::Parameter("queue_size", 4),
      rclcpp::Parameter("push_frequency", 5),
      rclcpp::Parameter("unit_delta_speed", 0.5),
      rclcpp::Parameter("keyboard_device", std::string("/dev/input/event7")),
      rclcpp::Parameter("cmd_vel_topic", std::string("/robot/cmd_vel"))});
  const auto config = TeleopConfig::load(*node);

  EXPECT_EQ(config.queue_size, 4u);
  EXPECT_EQ(config.push_frequency, 5);
  EXPECT_EQ(config.queueTimeout(), 20ms);
  EXPECT_DOUBLE_EQ(config.gearSettings().unit_speed, 0.5);
  EXPECT_DOUBLE_EQ(config.gearSettings().unit_degree, 20.0);
  EXPECT_EQ(config.keyboard_device, "/dev/input/event7");
  EXPECT_EQ(config.cmd_vel_topic, "/robot/cmd_vel");
}

TEST_F(TeleopConfigTest, RejectsNonPositiveQueueSize)
{
  auto node = makeNode({rclcpp::Parameter("queue_size", 0)});
  EXPECT_THROW(TeleopConfig::load(*node), std::invalid_argument);
}

TEST_F(TeleopConfigTest, RejectsNonPositiveFrequency)
{
  auto node = makeNode({rclcpp::Parameter("push_frequency", 0)});
  EXPECT_THROW(TeleopConfig::load(*node), std::invalid_argument);
}

TEST_F(TeleopConfigTest, RejectsFrequencyThatDoesNotFitAnInt)
{
  // 2^32 + 1 would wrap to 1 if narrowed first
  auto node = makeNode({rclcpp::Parameter("push_frequency", static_cast<int64_t>(4294967297LL))});
  EXPECT_THROW(TeleopConfig::load(*node), std::invalid_argument);
}

TEST(TeleopConfigValidate, RejectsBadValues)
{
  TeleopConfig config;
  EXPECT_NO_THROW(config.validate());

  config.timeout_unit = 0.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = TeleopConfig{};
  config.unit_delta_degree = -1.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = TeleopConfig{};
  config.keyboard_device.clear();
  EXPECT_THROW(config.validate(), std::invalid_argument);
}
