// topic_commander.cpp
// Description:
//   Commander over ROS 2 topics: Twist for the chassis, Vector3 for the
//   gimbal (y = pitch, z = yaw), Empty for the blaster.

#include "robomaster_teleop/topic_commander.hpp"

#include <string>

#include <rclcpp/exceptions.hpp>

namespace robomaster_teleop
{

TopicCommander::TopicCommander(rclcpp::Node & node, const TeleopConfig & config)
{
  cmd_vel_pub_ = node.create_publisher<geometry_msgs::msg::Twist>(config.cmd_vel_topic, 10);
  gimbal_pub_ = node.create_publisher<geometry_msgs::msg::Vector3>(config.gimbal_speed_topic, 10);
  blaster_pub_ = node.create_publisher<std_msgs::msg::Empty>(config.blaster_topic, 10);
}

template<typename MessageT>
void TopicCommander::publish(
  const typename rclcpp::Publisher<MessageT>::SharedPtr & publisher,
  const MessageT & message, const char * what)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (!rclcpp::ok()) {
    throw CommandTransportError(std::string(what) + ": ROS context is shut down");
  }
  try {
    publisher->publish(message);
  } catch (const rclcpp::exceptions::RCLError & e) {
    throw CommandTransportError(std::string(what) + ": " + e.what());
  }
}

void TopicCommander::chassisSpeed(double vx, double vy, double vz)
{
  geometry_msgs::msg::Twist twist;
  twist.linear.x = vx;
  twist.linear.y = vy;
  twist.angular.z = vz;
  publish(cmd_vel_pub_, twist, "chassis speed");
}

void TopicCommander::gimbalSpeed(double pitch, double yaw)
{
  geometry_msgs::msg::Vector3 speed;
  speed.y = pitch;
  speed.z = yaw;
  publish(gimbal_pub_, speed, "gimbal speed");
}

void TopicCommander::fireWeapon()
{
  publish(blaster_pub_, std_msgs::msg::Empty(), "blaster fire");
}

void TopicCommander::setChassisZero()
{
  publish(cmd_vel_pub_, geometry_msgs::msg::Twist(), "chassis zero");
}

}  // namespace robomaster_teleop
