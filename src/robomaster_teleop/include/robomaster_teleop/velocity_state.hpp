// velocity_state.hpp
// Description:
//   Chassis and gimbal velocity set by keyboard edges. All access goes through
//   applyKeyDown / applyKeyUp, which hold the state's own lock for the whole
//   edge, including the speed commands derived from it.

#ifndef ROBOMASTER_TELEOP__VELOCITY_STATE_HPP_
#define ROBOMASTER_TELEOP__VELOCITY_STATE_HPP_

#include <mutex>

#include <rclcpp/logger.hpp>

#include "robomaster_teleop/commander.hpp"
#include "robomaster_teleop/key_map.hpp"

namespace robomaster_teleop
{

struct ChassisVelocity
{
  double x{0.0};
  double y{0.0};
};

struct GimbalVelocity
{
  double pitch{0.0};
  double yaw{0.0};
};

inline bool operator==(const ChassisVelocity & a, const ChassisVelocity & b)
{
  return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const ChassisVelocity & a, const ChassisVelocity & b)
{
  return !(a == b);
}

inline bool operator==(const GimbalVelocity & a, const GimbalVelocity & b)
{
  return a.pitch == b.pitch && a.yaw == b.yaw;
}

inline bool operator!=(const GimbalVelocity & a, const GimbalVelocity & b)
{
  return !(a == b);
}

struct GearSettings
{
  double unit_speed{0.2};    // m/s per gear
  double unit_degree{20.0};  // deg/s per gear
  int initial_gear{1};
};

struct VelocitySnapshot
{
  int gear;
  double delta_speed;
  double delta_degree;
  ChassisVelocity chassis;
  ChassisVelocity previous_chassis;
  GimbalVelocity gimbal;
  GimbalVelocity previous_gimbal;
  bool modifier_held;
};

enum class EdgeResult
{
  Ignored,
  Applied,
  Terminate
};

class VelocityState
{
public:
  static constexpr int kMinGear = 1;
  static constexpr int kMaxGear = 5;

  VelocityState(Commander & commander, const GearSettings & settings, rclcpp::Logger logger);

  VelocityState(const VelocityState &) = delete;
  VelocityState & operator=(const VelocityState &) = delete;

  EdgeResult applyKeyDown(Key key);
  EdgeResult applyKeyUp(Key key);

  VelocitySnapshot snapshot() const;

private:
  // Callers hold mutex_.
  void setGear(int gear);
  void setAxis(Axis axis, double value);
  double magnitude(Magnitude source) const;
  void sendCommand();

  mutable std::mutex mutex_;
  Commander & commander_;
  rclcpp::Logger logger_;

  const double unit_speed_;
  const double unit_degree_;
  int gear_{kMinGear};
  double delta_speed_{0.0};
  double delta_degree_{0.0};
  ChassisVelocity chassis_;
  ChassisVelocity previous_chassis_;
  GimbalVelocity gimbal_;
  GimbalVelocity previous_gimbal_;
  bool modifier_held_{false};
};

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__VELOCITY_STATE_HPP_
