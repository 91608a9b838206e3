// key_map.cpp
// Description:
//   Effect table for operator keys. Left and yaw-left are negative, matching the
//   robot's chassis and gimbal frames.

#include "robomaster_teleop/key_map.hpp"

namespace robomaster_teleop
{

namespace
{

KeyEffect move(Axis axis, int sign, Magnitude magnitude)
{
  KeyEffect effect;
  effect.kind = EffectKind::Move;
  effect.axis = axis;
  effect.sign = sign;
  effect.magnitude = magnitude;
  return effect;
}

KeyEffect gear(int value)
{
  KeyEffect effect;
  effect.kind = EffectKind::Gear;
  effect.gear = value;
  return effect;
}

KeyEffect simple(EffectKind kind)
{
  KeyEffect effect;
  effect.kind = kind;
  return effect;
}

}  // namespace

KeyEffect effectFor(Key key)
{
  switch (key) {
    case Key::Forward:     return move(Axis::ChassisX, 1, Magnitude::Speed);
    case Key::Back:        return move(Axis::ChassisX, -1, Magnitude::Speed);
    case Key::Left:        return move(Axis::ChassisY, -1, Magnitude::Speed);
    case Key::Right:       return move(Axis::ChassisY, 1, Magnitude::Speed);
    case Key::GimbalUp:    return move(Axis::GimbalPitch, 1, Magnitude::Degree);
    case Key::GimbalDown:  return move(Axis::GimbalPitch, -1, Magnitude::Degree);
    case Key::GimbalLeft:  return move(Axis::GimbalYaw, -1, Magnitude::Degree);
    case Key::GimbalRight: return move(Axis::GimbalYaw, 1, Magnitude::Degree);
    case Key::Modifier:    return simple(EffectKind::Modifier);
    case Key::Fire:        return simple(EffectKind::Fire);
    case Key::Gear1:       return gear(1);
    case Key::Gear2:       return gear(2);
    case Key::Gear3:       return gear(3);
    case Key::Gear4:       return gear(4);
    case Key::Gear5:       return gear(5);
    case Key::Quit:        return simple(EffectKind::Quit);
    case Key::Unknown:     break;
  }
  return KeyEffect{};
}

const char * keyName(Key key)
{
  switch (key) {
    case Key::Forward:     return "forward";
    case Key::Back:        return "back";
    case Key::Left:        return "left";
    case Key::Right:       return "right";
    case Key::GimbalUp:    return "gimbal_up";
    case Key::GimbalDown:  return "gimbal_down";
    case Key::GimbalLeft:  return "gimbal_left";
    case Key::GimbalRight: return "gimbal_right";
    case Key::Modifier:    return "modifier";
    case Key::Fire:        return "fire";
    case Key::Gear1:       return "gear1";
    case Key::Gear2:       return "gear2";
    case Key::Gear3:       return "gear3";
    case Key::Gear4:       return "gear4";
    case Key::Gear5:       return "gear5";
    case Key::Quit:        return "quit";
    case Key::Unknown:     break;
  }
  return "unknown";
}

}  // namespace robomaster_teleop
