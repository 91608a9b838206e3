// teleop_config.hpp
// Description:
//   Session settings read from ROS 2 parameters.

#ifndef ROBOMASTER_TELEOP__TELEOP_CONFIG_HPP_
#define ROBOMASTER_TELEOP__TELEOP_CONFIG_HPP_

#include <chrono>
#include <cstddef>
#include <string>

#include <rclcpp/node.hpp>

#include "robomaster_teleop/velocity_state.hpp"

namespace robomaster_teleop
{

struct TeleopConfig
{
  std::size_t queue_size{10};
  int push_frequency{1};      // Hz
  double timeout_unit{0.1};   // s
  double unit_delta_speed{0.2};
  double unit_delta_degree{20.0};
  std::string keyboard_device{"/dev/input/event0"};

  std::string cmd_vel_topic{"/cmd_vel"};
  std::string gimbal_speed_topic{"/gimbal/cmd_speed"};
  std::string blaster_topic{"/blaster/fire"};
  std::string video_topic{"/camera/image_raw"};
  std::string chassis_push_topic{"/chassis/odom"};
  std::string gimbal_push_topic{"/gimbal/attitude"};
  std::string event_topic{"/robot/events"};

  // Declares every parameter on `node` (defaults as above) and validates the result.
  static TeleopConfig load(rclcpp::Node & node);

  // Throws std::invalid_argument on the first bad value.
  void validate() const;

  // timeout_unit / push_frequency
  std::chrono::nanoseconds queueTimeout() const;

  GearSettings gearSettings() const;
};

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__TELEOP_CONFIG_HPP_
