// event_router.hpp
// Description:
//   Polls the telemetry and robot event channels. An armor hit stops the chassis
//   immediately through the commander, without going through VelocityState.

#ifndef ROBOMASTER_TELEOP__EVENT_ROUTER_HPP_
#define ROBOMASTER_TELEOP__EVENT_ROUTER_HPP_

#include <atomic>
#include <chrono>

#include <rclcpp/logger.hpp>

#include "robomaster_teleop/bounded_channel.hpp"
#include "robomaster_teleop/commander.hpp"
#include "robomaster_teleop/robot_event.hpp"

namespace robomaster_teleop
{

struct PollResult
{
  bool telemetry_received{false};
  bool event_received{false};
  bool safety_stop{false};
};

class EventRouter
{
public:
  EventRouter(
    Commander & commander,
    BoundedChannel<TelemetryMessage> & telemetry,
    BoundedChannel<RobotEvent> & events,
    std::chrono::nanoseconds poll_timeout,
    rclcpp::Logger logger);

  // One bounded receive per channel; each waits at most the poll timeout.
  PollResult pollOnce();

  void run(const std::atomic<bool> & running);

private:
  Commander & commander_;
  BoundedChannel<TelemetryMessage> & telemetry_;
  BoundedChannel<RobotEvent> & events_;
  const std::chrono::nanoseconds poll_timeout_;
  rclcpp::Logger logger_;
};

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__EVENT_ROUTER_HPP_
