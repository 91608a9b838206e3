// teleop_orchestrator.hpp
// Description:
//   Runs one teleop session: the ROS executor plus one worker thread per loop
//   (display, event router, keyboard listener, keyboard controller). Each worker
//   is its own failure domain; failures are reported after the join.

#ifndef ROBOMASTER_TELEOP__TELEOP_ORCHESTRATOR_HPP_
#define ROBOMASTER_TELEOP__TELEOP_ORCHESTRATOR_HPP_

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <rclcpp/executors/multi_threaded_executor.hpp>
#include <rclcpp/rclcpp.hpp>

#include "robomaster_teleop/hardware_bridge.hpp"

namespace robomaster_teleop
{

using FrameSink = std::function<void (const VideoFrame &)>;

struct WorkerFailure
{
  std::string worker;
  std::string cause;
};

class TeleopOrchestrator
{
public:
  TeleopOrchestrator(std::shared_ptr<HardwareBridge> bridge, FrameSink display);
  ~TeleopOrchestrator();

  TeleopOrchestrator(const TeleopOrchestrator &) = delete;
  TeleopOrchestrator & operator=(const TeleopOrchestrator &) = delete;

  // Blocks until the quit chord, the end of keyboard input, a stop condition,
  // or ROS shutdown. Then stops chassis and gimbal before returning.
  // Returns 0 when every worker finished cleanly, 1 otherwise.
  int run();

  void requestStop(const std::string & reason);

  // Polled while run() waits; `condition` must be cheap and non-blocking.
  void stopWhen(std::function<bool()> condition, const std::string & reason);

  std::vector<WorkerFailure> failures() const;

private:
  // A worker with `ends_session` set stops the session when it returns or fails.
  void spawn(const std::string & name, std::function<void()> body, bool ends_session);
  void recordFailure(const std::string & worker, const std::string & cause);
  void waitForStop();
  void shutdown();
  void sendFinalStop();

  std::shared_ptr<HardwareBridge> bridge_;
  FrameSink display_;
  rclcpp::Logger logger_;
  TeleopChannels channels_;

  rclcpp::executors::MultiThreadedExecutor executor_;
  std::thread spin_thread_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<bool> spin_done_{true};

  mutable std::mutex mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};
  std::function<bool()> stop_condition_;
  std::string stop_condition_reason_;
  std::vector<WorkerFailure> failures_;
};

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__TELEOP_ORCHESTRATOR_HPP_
