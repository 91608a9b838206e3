// topic_commander.hpp
// Description:
//   Commander backed by ROS 2 topics consumed by the robot driver:
//     chassis speed  geometry_msgs/Twist    (linear.x, linear.y, angular.z)
//     gimbal speed   geometry_msgs/Vector3  (y = pitch, z = yaw)
//     blaster        std_msgs/Empty

#ifndef ROBOMASTER_TELEOP__TOPIC_COMMANDER_HPP_
#define ROBOMASTER_TELEOP__TOPIC_COMMANDER_HPP_

#include <mutex>

#include <geometry_msgs/msg/twist.hpp>
#include <geometry_msgs/msg/vector3.hpp>
#include <rclcpp/rclcpp.hpp>
#include <std_msgs/msg/empty.hpp>

#include "robomaster_teleop/commander.hpp"
#include "robomaster_teleop/teleop_config.hpp"

namespace robomaster_teleop
{

class TopicCommander : public Commander
{
public:
  TopicCommander(rclcpp::Node & node, const TeleopConfig & config);

  void chassisSpeed(double vx, double vy, double vz) override;
  void gimbalSpeed(double pitch, double yaw) override;
  void fireWeapon() override;
  void setChassisZero() override;

private:
  template<typename MessageT>
  void publish(
    const typename rclcpp::Publisher<MessageT>::SharedPtr & publisher,
    const MessageT & message, const char * what);

  // Serializes callers from the keyboard and event loops.
  std::mutex mutex_;
  rclcpp::Publisher<geometry_msgs::msg::Twist>::SharedPtr cmd_vel_pub_;
  rclcpp::Publisher<geometry_msgs::msg::Vector3>::SharedPtr gimbal_pub_;
  rclcpp::Publisher<std_msgs::msg::Empty>::SharedPtr blaster_pub_;
};

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__TOPIC_COMMANDER_HPP_
