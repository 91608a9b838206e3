// keyboard_controller.hpp
// Description:
//   Consumer of operator key edges. Owns the session's VelocityState and ends
//   the session on the quit chord (modifier + C).

#ifndef ROBOMASTER_TELEOP__KEYBOARD_CONTROLLER_HPP_
#define ROBOMASTER_TELEOP__KEYBOARD_CONTROLLER_HPP_

#include <atomic>
#include <chrono>

#include <rclcpp/logger.hpp>

#include "robomaster_teleop/bounded_channel.hpp"
#include "robomaster_teleop/commander.hpp"
#include "robomaster_teleop/key_map.hpp"
#include "robomaster_teleop/velocity_state.hpp"

namespace robomaster_teleop
{

class KeyboardController
{
public:
  KeyboardController(Commander & commander, const GearSettings & settings, rclcpp::Logger logger);

  // Returns false once the session has been terminated.
  bool handle(const KeyEvent & event);

  // Drains `keys` until the quit chord or until `running` is cleared.
  // Returns true when the quit chord ended the session.
  bool run(
    BoundedChannel<KeyEvent> & keys, const std::atomic<bool> & running,
    std::chrono::nanoseconds poll_timeout);

  bool terminated() const {return terminated_.load();}

  const VelocityState & state() const {return state_;}

private:
  rclcpp::Logger logger_;
  VelocityState state_;
  std::atomic<bool> terminated_{false};
};

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__KEYBOARD_CONTROLLER_HPP_
