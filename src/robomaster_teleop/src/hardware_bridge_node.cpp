// hardware_bridge_node.cpp
// Description:
//   Bridge between the robot driver's topics and the teleop control loops.
//   Each input stream gets its own callback group so a full channel only
//   stalls that stream.

#include "robomaster_teleop/hardware_bridge.hpp"

#include <sstream>
#include <utility>

namespace robomaster_teleop
{

TelemetryMessage toTelemetry(const nav_msgs::msg::Odometry & odom)
{
  std::ostringstream text;
  text.precision(3);
  text << std::fixed
       << "x=" << odom.pose.pose.position.x
       << " y=" << odom.pose.pose.position.y
       << " vx=" << odom.twist.twist.linear.x
       << " vy=" << odom.twist.twist.linear.y
       << " wz=" << odom.twist.twist.angular.z;
  return TelemetryMessage{"chassis", text.str()};
}

TelemetryMessage toTelemetry(const geometry_msgs::msg::Vector3Stamped & attitude)
{
  std::ostringstream text;
  text.precision(3);
  text << std::fixed
       << "pitch=" << attitude.vector.y
       << " yaw=" << attitude.vector.z;
  return TelemetryMessage{"gimbal", text.str()};
}

HardwareBridge::HardwareBridge(const rclcpp::NodeOptions & options)
: Node("hardware_bridge", options)
{
  config_ = TeleopConfig::load(*this);
  send_timeout_ = config_.queueTimeout();
  commander_ = std::make_unique<TopicCommander>(*this, config_);

  RCLCPP_INFO(
    get_logger(), "commands on %s, %s, %s",
    config_.cmd_vel_topic.c_str(), config_.gimbal_speed_topic.c_str(),
    config_.blaster_topic.c_str());
}

template<typename T>
void HardwareBridge::forward(BoundedChannel<T> & channel, T item, const char * stream)
{
  if (!channel.send(std::move(item), send_timeout_) && !channel.closed()) {
    RCLCPP_WARN_THROTTLE(
      get_logger(), *get_clock(), 1000, "%s channel full, dropping message", stream);
  }
}

void HardwareBridge::connect(TeleopChannels & channels)
{
  auto options = [this]() {
      rclcpp::SubscriptionOptions opts;
      opts.callback_group = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);
      return opts;
    };

  video_sub_ = create_subscription<sensor_msgs::msg::Image>(
    config_.video_topic, rclcpp::SensorDataQoS(),
    [this, &channels](sensor_msgs::msg::Image::ConstSharedPtr msg) {
      forward<VideoFrame>(channels.video, std::move(msg), "video");
    },
    options());

  chassis_sub_ = create_subscription<nav_msgs::msg::Odometry>(
    config_.chassis_push_topic, 10,
    [this, &channels](const nav_msgs::msg::Odometry & msg) {
      forward(channels.telemetry, toTelemetry(msg), "telemetry");
    },
    options());

  gimbal_sub_ = create_subscription<geometry_msgs::msg::Vector3Stamped>(
    config_.gimbal_push_topic, 10,
    [this, &channels](const geometry_msgs::msg::Vector3Stamped & msg) {
      forward(channels.telemetry, toTelemetry(msg), "telemetry");
    },
    options());

  event_sub_ = create_subscription<std_msgs::msg::String>(
    config_.event_topic, 10,
    [this, &channels](const std_msgs::msg::String & msg) {
      forward(channels.events, parseRobotEvent(msg.data), "event");
    },
    options());

  RCLCPP_INFO(
    get_logger(), "listening on %s, %s, %s, %s",
    config_.video_topic.c_str(), config_.chassis_push_topic.c_str(),
    config_.gimbal_push_topic.c_str(), config_.event_topic.c_str());
}

void HardwareBridge::disconnect()
{
  video_sub_.reset();
  chassis_sub_.reset();
  gimbal_sub_.reset();
  event_sub_.reset();
}

}  // namespace robomaster_teleop
