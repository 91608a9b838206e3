// hardware_bridge.hpp
// Description:
//   ROS 2 node facing the robot driver. Publishes commands through its
//   TopicCommander and turns video, chassis/gimbal push and event topics into
//   channel messages for the control loops.

#ifndef ROBOMASTER_TELEOP__HARDWARE_BRIDGE_HPP_
#define ROBOMASTER_TELEOP__HARDWARE_BRIDGE_HPP_

#include <chrono>
#include <cstddef>
#include <memory>

#include <geometry_msgs/msg/vector3_stamped.hpp>
#include <nav_msgs/msg/odometry.hpp>
#include <rclcpp/rclcpp.hpp>
#include <sensor_msgs/msg/image.hpp>
#include <std_msgs/msg/string.hpp>

#include "robomaster_teleop/bounded_channel.hpp"
#include "robomaster_teleop/key_map.hpp"
#include "robomaster_teleop/robot_event.hpp"
#include "robomaster_teleop/teleop_config.hpp"
#include "robomaster_teleop/topic_commander.hpp"

namespace robomaster_teleop
{

using VideoFrame = sensor_msgs::msg::Image::ConstSharedPtr;

struct TeleopChannels
{
  explicit TeleopChannels(std::size_t capacity)
  : telemetry(capacity), events(capacity), video(capacity), keys(capacity) {}

  BoundedChannel<TelemetryMessage> telemetry;
  BoundedChannel<RobotEvent> events;
  BoundedChannel<VideoFrame> video;
  BoundedChannel<KeyEvent> keys;

  void closeAll()
  {
    telemetry.close();
    events.close();
    video.close();
    keys.close();
  }
};

TelemetryMessage toTelemetry(const nav_msgs::msg::Odometry & odom);
TelemetryMessage toTelemetry(const geometry_msgs::msg::Vector3Stamped & attitude);

class HardwareBridge : public rclcpp::Node
{
public:
  explicit HardwareBridge(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());

  const TeleopConfig & config() const {return config_;}

  Commander & commander() {return *commander_;}

  // Starts forwarding robot topics into `channels`. The channels must stay
  // alive until disconnect() or until the node stops spinning.
  void connect(TeleopChannels & channels);
  void disconnect();

private:
  template<typename T>
  void forward(BoundedChannel<T> & channel, T item, const char * stream);

  TeleopConfig config_;
  std::chrono::nanoseconds send_timeout_;
  std::unique_ptr<TopicCommander> commander_;

  rclcpp::Subscription<sensor_msgs::msg::Image>::SharedPtr video_sub_;
  rclcpp::Subscription<nav_msgs::msg::Odometry>::SharedPtr chassis_sub_;
  rclcpp::Subscription<geometry_msgs::msg::Vector3Stamped>::SharedPtr gimbal_sub_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr event_sub_;
};

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__HARDWARE_BRIDGE_HPP_
