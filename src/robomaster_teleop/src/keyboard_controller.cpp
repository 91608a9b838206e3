// keyboard_controller.cpp
// Description:
//   Drains the key channel into the velocity state until the quit chord,
//   the end of input, or the running flag clears.

#include "robomaster_teleop/keyboard_controller.hpp"

#include <utility>

#include <rclcpp/logging.hpp>

namespace robomaster_teleop
{

KeyboardController::KeyboardController(
  Commander & commander, const GearSettings & settings, rclcpp::Logger logger)
: logger_(logger),
  state_(commander, settings, std::move(logger))
{
}

bool KeyboardController::handle(const KeyEvent & event)
{
  if (terminated_.load()) {
    return false;
  }

  const EdgeResult result = event.edge == KeyEdge::Down ?
    state_.applyKeyDown(event.key) :
    state_.applyKeyUp(event.key);

  if (result == EdgeResult::Terminate) {
    RCLCPP_INFO(logger_, "quit chord received, stopping keyboard control");
    terminated_.store(true);
    return false;
  }
  return true;
}

bool KeyboardController::run(
  BoundedChannel<KeyEvent> & keys, const std::atomic<bool> & running,
  std::chrono::nanoseconds poll_timeout)
{
  while (running.load()) {
    auto event = keys.receive(poll_timeout);
    if (!event) {
      if (keys.closed()) {
        break;
      }
      continue;
    }
    if (!handle(*event)) {
      return true;
    }
  }
  return terminated();
}

}  // namespace robomaster_teleop
