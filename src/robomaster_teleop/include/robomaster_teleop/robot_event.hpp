// robot_event.hpp
// Description:
//   Messages flowing from the robot into the control core: periodic telemetry
//   pushes (logged only) and discrete robot events (armor hits, sounds, other).

#ifndef ROBOMASTER_TELEOP__ROBOT_EVENT_HPP_
#define ROBOMASTER_TELEOP__ROBOT_EVENT_HPP_

#include <string>
#include <variant>

namespace robomaster_teleop
{

struct TelemetryMessage
{
  std::string source;  // "chassis" or "gimbal"
  std::string text;
};

struct ArmorHit
{
  int index{0};  // armor plate that was struck
  int type{0};   // 0 = projectile, 1 = infrared
};

struct SoundEvent
{
  std::string kind;
  int count{0};
};

struct OtherEvent
{
  std::string raw;
};

using RobotEvent = std::variant<ArmorHit, SoundEvent, OtherEvent>;

// Parses one event line, e.g. "armor event hit 2 0 ;" or "sound event applause 3".
// Lines that are not recognized come back as OtherEvent.
RobotEvent parseRobotEvent(const std::string & line);

bool isArmorHit(const RobotEvent & event);

std::string describe(const RobotEvent & event);
std::string describe(const TelemetryMessage & message);

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__ROBOT_EVENT_HPP_
