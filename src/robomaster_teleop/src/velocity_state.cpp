// velocity_state.cpp
// Description:
//   Edge handlers for the velocity state. A press sets one axis to a signed
//   gear-scaled value (last press wins), a release zeroes it, and every movement
//   edge ends with a send-on-change for the chassis and gimbal groups.

#include "robomaster_teleop/velocity_state.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <rclcpp/logging.hpp>

namespace robomaster_teleop
{

VelocityState::VelocityState(
  Commander & commander, const GearSettings & settings, rclcpp::Logger logger)
: commander_(commander),
  logger_(std::move(logger)),
  unit_speed_(settings.unit_speed),
  unit_degree_(settings.unit_degree)
{
  if (settings.initial_gear < kMinGear || settings.initial_gear > kMaxGear) {
    throw std::invalid_argument(
            "initial gear out of range: " + std::to_string(settings.initial_gear));
  }
  setGear(settings.initial_gear);
}

EdgeResult VelocityState::applyKeyDown(Key key)
{
  std::lock_guard<std::mutex> lock(mutex_);
  RCLCPP_DEBUG(logger_, "pressed: %s", keyName(key));

  const KeyEffect effect = effectFor(key);
  switch (effect.kind) {
    case EffectKind::Modifier:
      modifier_held_ = true;
      return EdgeResult::Applied;

    case EffectKind::Quit:
      if (!modifier_held_) {
        return EdgeResult::Ignored;
      }
      chassis_ = ChassisVelocity{};
      gimbal_ = GimbalVelocity{};
      sendCommand();
      return EdgeResult::Terminate;

    case EffectKind::Fire:
      commander_.fireWeapon();
      return EdgeResult::Applied;

    case EffectKind::Move:
      setAxis(effect.axis, effect.sign * magnitude(effect.magnitude));
      sendCommand();
      return EdgeResult::Applied;

    case EffectKind::Gear:
    case EffectKind::Ignore:
      break;
  }
  return EdgeResult::Ignored;
}

EdgeResult VelocityState::applyKeyUp(Key key)
{
  std::lock_guard<std::mutex> lock(mutex_);
  RCLCPP_DEBUG(logger_, "released: %s", keyName(key));

  const KeyEffect effect = effectFor(key);
  switch (effect.kind) {
    case EffectKind::Modifier:
      modifier_held_ = false;
      return EdgeResult::Applied;

    case EffectKind::Gear:
      setGear(effect.gear);
      RCLCPP_INFO(logger_, "gear: %d", gear_);
      return EdgeResult::Applied;

    case EffectKind::Move:
      setAxis(effect.axis, 0.0);
      sendCommand();
      return EdgeResult::Applied;

    case EffectKind::Fire:
    case EffectKind::Quit:
    case EffectKind::Ignore:
      break;
  }
  return EdgeResult::Ignored;
}

VelocitySnapshot VelocityState::snapshot() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return VelocitySnapshot{
    gear_, delta_speed_, delta_degree_,
    chassis_, previous_chassis_, gimbal_, previous_gimbal_,
    modifier_held_};
}

void VelocityState::setGear(int gear)
{
  gear_ = gear;
  delta_speed_ = gear_ * unit_speed_;
  delta_degree_ = gear_ * unit_degree_;
}

void VelocityState::setAxis(Axis axis, double value)
{
  switch (axis) {
    case Axis::ChassisX:    chassis_.x = value; break;
    case Axis::ChassisY:    chassis_.y = value; break;
    case Axis::GimbalPitch: gimbal_.pitch = value; break;
    case Axis::GimbalYaw:   gimbal_.yaw = value; break;
    case Axis::None:        break;
  }
}

double VelocityState::magnitude(Magnitude source) const
{
  switch (source) {
    case Magnitude::Speed:  return delta_speed_;
    case Magnitude::Degree: return delta_degree_;
    case Magnitude::None:   break;
  }
  return 0.0;
}

void VelocityState::sendCommand()
{
  if (chassis_ != previous_chassis_) {
    previous_chassis_ = chassis_;
    RCLCPP_DEBUG(logger_, "chassis speed: x: %.3f, y: %.3f", chassis_.x, chassis_.y);
    commander_.chassisSpeed(chassis_.x, chassis_.y, 0.0);
  }
  if (gimbal_ != previous_gimbal_) {
    previous_gimbal_ = gimbal_;
    RCLCPP_DEBUG(logger_, "gimbal speed: pitch: %.3f, yaw: %.3f", gimbal_.pitch, gimbal_.yaw);
    commander_.gimbalSpeed(gimbal_.pitch, gimbal_.yaw);
  }
}

}  // namespace robomaster_teleop
