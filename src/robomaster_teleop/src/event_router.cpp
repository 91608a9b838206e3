// event_router.cpp
// Description:
//   Logs chassis/gimbal push and robot events. An armor hit stops the chassis
//   directly, without going through the keyboard's velocity state.

#include "robomaster_teleop/event_router.hpp"

#include <utility>

#include <rclcpp/logging.hpp>

namespace robomaster_teleop
{

EventRouter::EventRouter(
  Commander & commander,
  BoundedChannel<TelemetryMessage> & telemetry,
  BoundedChannel<RobotEvent> & events,
  std::chrono::nanoseconds poll_timeout,
  rclcpp::Logger logger)
: commander_(commander),
  telemetry_(telemetry),
  events_(events),
  poll_timeout_(poll_timeout),
  logger_(std::move(logger))
{
}

PollResult EventRouter::pollOnce()
{
  PollResult result;

  if (auto push = telemetry_.receive(poll_timeout_)) {
    result.telemetry_received = true;
    RCLCPP_INFO(logger_, "push: %s", describe(*push).c_str());
  }

  if (auto event = events_.receive(poll_timeout_)) {
    result.event_received = true;
    // safety first: stop before logging
    if (isArmorHit(*event)) {
      commander_.chassisSpeed(0.0, 0.0, 0.0);
      result.safety_stop = true;
      RCLCPP_WARN(logger_, "armor hit, chassis stopped");
    }
    RCLCPP_INFO(logger_, "event: %s", describe(*event).c_str());
  }

  return result;
}

void EventRouter::run(const std::atomic<bool> & running)
{
  while (running.load()) {
    pollOnce();
  }
}

}  // namespace robomaster_teleop
