// commander.hpp
// Description:
//   Command capability used by the control loops. Every call is fire-and-forget;
//   a transport failure is raised as CommandTransportError and ends the calling loop.

#ifndef ROBOMASTER_TELEOP__COMMANDER_HPP_
#define ROBOMASTER_TELEOP__COMMANDER_HPP_

#include <stdexcept>
#include <string>

namespace robomaster_teleop
{

class CommandTransportError : public std::runtime_error
{
public:
  explicit CommandTransportError(const std::string & what)
  : std::runtime_error(what) {}
};

// Implementations must accept calls from several threads at once.
class Commander
{
public:
  virtual ~Commander() = default;

  // vx, vy in m/s, vz in deg/s
  virtual void chassisSpeed(double vx, double vy, double vz) = 0;
  // deg/s
  virtual void gimbalSpeed(double pitch, double yaw) = 0;
  virtual void fireWeapon() = 0;
  virtual void setChassisZero() = 0;
};

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__COMMANDER_HPP_
