#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <variant>

#include <geometry_msgs/msg/vector3_stamped.hpp>
#include <nav_msgs/msg/odometry.hpp>
#include <rclcpp/rclcpp.hpp>

#include "robomaster_teleop/hardware_bridge.hpp"
#include "topic_recorder.hpp"

using robomaster_teleop::ArmorHit;
using robomaster_teleop::HardwareBridge;
using robomaster_teleop::OtherEvent;
using robomaster_teleop::SoundEvent;
using robomaster_teleop::TeleopChannels;
using robomaster_teleop::toTelemetry;
using robomaster_teleop::test::NodeSpinner;
using robomaster_teleop::test::TopicRecorder;
using robomaster_teleop::test::topicOverrides;
using robomaster_teleop::test::waitUntil;
using namespace std::chrono_literals;

TEST(ToTelemetry, OdometryReportsPoseAndTwist)
{
  nav_msgs::msg::Odometry odom;
  odom.pose.pose.position.x = 1.5;
  odom.pose.pose.position.y = -2.0;
  odom.twist.twist.linear.x = 0.25;
  odom.twist.twist.angular.z = -0.5;

  const auto message = toTelemetry(odom);
  EXPECT_EQ(message.source, "chassis");
  EXPECT_EQ(message.text, "x=1.500 y=-2.000 vx=0.250 vy=0.000 wz=-0.500");
}

TEST(ToTelemetry, AttitudeReportsPitchAndYaw)
{
  geometry_msgs::msg::Vector3Stamped attitude;
  attitude.vector.y = 10.0;
  attitude.vector.z = -45.25;

  const auto message = toTelemetry(attitude);
  EXPECT_EQ(message.source, "gimbal");
  EXPECT_EQ(message.text, "pitch=10.000 yaw=-45.250");
}

namespace
{

class HardwareBridgeTest : public ::testing::Test
{
protected:
  static void SetUpTestSuite() {rclcpp::init(0, nullptr);}
  static void TearDownTestSuite() {rclcpp::shutdown();}

  // Bridge with a 10 ms queue timeout, connected to fresh channels and spinning.
  TeleopChannels & start(const std::string & prefix, std::size_t capacity)
  {
    channels_ = std::make_unique<TeleopChannels>(capacity);
    auto overrides = topicOverrides(prefix);
    overrides.emplace_back("push_frequency", 10);
    rclcpp::NodeOptions options;
    options.parameter_overrides(overrides);
    bridge_ = std::make_shared<HardwareBridge>(options);
    bridge_->connect(*channels_);
    spinner_ = std::make_unique<NodeSpinner>(bridge_);
    return *channels_;
  }

  void TearDown() override
  {
    spinner_.reset();
    if (bridge_) {
      bridge_->disconnect();
    }
  }

  std::unique_ptr<TeleopChannels> channels_;
  std::shared_ptr<HardwareBridge> bridge_;
  std::unique_ptr<NodeSpinner> spinner_;
};

}  // namespace

TEST_F(HardwareBridgeTest, ParsesAndForwardsEvents)
{
  TeleopChannels & channels = start("/bridge_events", 4);
  TopicRecorder robot("/bridge_events");
  ASSERT_TRUE(robot.waitForInputSubscribers());

  robot.publishEvent("armor event hit 1 0 ;");
  robot.publishEvent("sound event applause 2");
  robot.publishEvent("gimbal event unknown");

  auto first = channels.events.receive(2s);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(std::holds_alternative<ArmorHit>(*first));
  EXPECT_EQ(std::get<ArmorHit>(*first).index, 1);
  EXPECT_EQ(std::get<ArmorHit>(*first).type, 0);

  auto second = channels.events.receive(2s);
  ASSERT_TRUE(second.has_value());
  ASSERT_TRUE(std::holds_alternative<SoundEvent>(*second));
  EXPECT_EQ(std::get<SoundEvent>(*second).kind, "applause");
  EXPECT_EQ(std::get<SoundEvent>(*second).count, 2);

  auto third = channels.events.receive(2s);
  ASSERT_TRUE(third.has_value());
  ASSERT_TRUE(std::holds_alternative<OtherEvent>(*third));
  EXPECT_EQ(std::get<OtherEvent>(*third).raw, "gimbal event unknown");
}

TEST_F(HardwareBridgeTest, ForwardsChassisPushAsTelemetry)
{
  TeleopChannels & channels = start("/bridge_push", 4);
  TopicRecorder robot("/bridge_push");
  ASSERT_TRUE(robot.waitForInputSubscribers());

  nav_msgs::msg::Odometry odom;
  odom.pose.pose.position.x = 3.0;
  robot.publishOdometry(odom);

  auto message = channels.telemetry.receive(2s);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->source, "chassis");
  EXPECT_EQ(message->text, toTelemetry(odom).text);
}

TEST_F(HardwareBridgeTest, DropsMessagesWhileChannelStaysFull)
{
  TeleopChannels & channels = start("/bridge_full", 1);
  TopicRecorder robot("/bridge_full");
  ASSERT_TRUE(robot.waitForInputSubscribers());

  robot.publishEvent("armor event hit 3 1");
  robot.publishEvent("sound event applause 1");
  robot.publishEvent("sound event applause 2");

  ASSERT_TRUE(waitUntil([&channels]() {return channels.events.size() == 1;}));
  // the later callbacks give up after the 10 ms queue timeout
  std::this_thread::sleep_for(300ms);
  EXPECT_EQ(channels.events.size(), 1u);

  auto kept = channels.events.receive(100ms);
  ASSERT_TRUE(kept.has_value());
  ASSERT_TRUE(std::holds_alternative<ArmorHit>(*kept));
  EXPECT_EQ(std::get<ArmorHit>(*kept).index, 3);

  std::this_thread::sleep_for(100ms);
  EXPECT_FALSE(channels.events.receive(50ms).has_value());
}
