// teleop_config.cpp
// Description:
//   Parameter declaration and range checks. Integer parameters are checked
//   as int64 before they are narrowed.

#include "robomaster_teleop/teleop_config.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace robomaster_teleop
{

TeleopConfig TeleopConfig::load(rclcpp::Node & node)
{
  TeleopConfig config;

  const auto queue_size = node.declare_parameter<std::int64_t>(
    "queue_size", static_cast<std::int64_t>(config.queue_size));
  if (queue_size <= 0) {
    throw std::invalid_argument("queue_size must be positive, got " + std::to_string(queue_size));
  }
  config.queue_size = static_cast<std::size_t>(queue_size);

  const auto push_frequency =
    node.declare_parameter<std::int64_t>("push_frequency", config.push_frequency);
  if (push_frequency <= 0 || push_frequency > std::numeric_limits<int>::max()) {
    throw std::invalid_argument(
            "push_frequency out of range, got " + std::to_string(push_frequency));
  }
  config.push_frequency = static_cast<int>(push_frequency);
  config.timeout_unit = node.declare_parameter<double>("timeout_unit", config.timeout_unit);
  config.unit_delta_speed =
    node.declare_parameter<double>("unit_delta_speed", config.unit_delta_speed);
  config.unit_delta_degree =
    node.declare_parameter<double>("unit_delta_degree", config.unit_delta_degree);
  config.keyboard_device =
    node.declare_parameter<std::string>("keyboard_device", config.keyboard_device);

  config.cmd_vel_topic = node.declare_parameter<std::string>("cmd_vel_topic", config.cmd_vel_topic);
  config.gimbal_speed_topic =
    node.declare_parameter<std::string>("gimbal_speed_topic", config.gimbal_speed_topic);
  config.blaster_topic = node.declare_parameter<std::string>("blaster_topic", config.blaster_topic);
  config.video_topic = node.declare_parameter<std::string>("video_topic", config.video_topic);
  config.chassis_push_topic =
    node.declare_parameter<std::string>("chassis_push_topic", config.chassis_push_topic);
  config.gimbal_push_topic =
    node.declare_parameter<std::string>("gimbal_push_topic", config.gimbal_push_topic);
  config.event_topic = node.declare_parameter<std::string>("event_topic", config.event_topic);

  config.validate();
  return config;
}

void TeleopConfig::validate() const
{
  if (queue_size == 0) {
    throw std::invalid_argument("queue_size must be positive");
  }
  if (push_frequency <= 0) {
    throw std::invalid_argument(
            "push_frequency must be positive, got " + std::to_string(push_frequency));
  }
  if (!(timeout_unit > 0.0)) {
    throw std::invalid_argument(
            "timeout_unit must be positive, got " + std::to_string(timeout_unit));
  }
  if (!(unit_delta_speed > 0.0)) {
    throw std::invalid_argument("unit_delta_speed must be positive");
  }
  if (!(unit_delta_degree > 0.0)) {
    throw std::invalid_argument("unit_delta_degree must be positive");
  }
  if (keyboard_device.empty()) {
    throw std::invalid_argument("keyboard_device must not be empty");
  }
}

std::chrono::nanoseconds TeleopConfig::queueTimeout() const
{
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
    std::chrono::duration<double>(timeout_unit / push_frequency));
}

GearSettings TeleopConfig::gearSettings() const
{
  GearSettings settings;
  settings.unit_speed = unit_delta_speed;
  settings.unit_degree = unit_delta_degree;
  return settings;
}

}  // namespace robomaster_teleop
