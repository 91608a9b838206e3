// teleop_orchestrator.cpp
// Description:
//   Session lifecycle. Producers: bridge subscriptions (video, push, events) and
//   the keyboard listener. Consumers: display loop, event router, keyboard
//   controller. Workers are never restarted.

#include "robomaster_teleop/teleop_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include "robomaster_teleop/event_router.hpp"
#include "robomaster_teleop/keyboard_controller.hpp"
#include "robomaster_teleop/keyboard_listener.hpp"

namespace robomaster_teleop
{

TeleopOrchestrator::TeleopOrchestrator(std::shared_ptr<HardwareBridge> bridge, FrameSink display)
: bridge_(std::move(bridge)),
  display_(std::move(display)),
  logger_(bridge_->get_logger().get_child("orchestrator")),
  channels_(bridge_->config().queue_size)
{
  if (!display_) {
    throw std::invalid_argument("TeleopOrchestrator needs a frame sink");
  }
  bridge_->connect(channels_);
}

TeleopOrchestrator::~TeleopOrchestrator()
{
  shutdown();
  bridge_->disconnect();
}

int TeleopOrchestrator::run()
{
  const TeleopConfig & config = bridge_->config();
  const auto slice = config.queueTimeout();
  const auto slice_ms = std::max(
    std::chrono::milliseconds(1),
    std::chrono::duration_cast<std::chrono::milliseconds>(slice));

  running_.store(true);
  executor_.add_node(bridge_);
  spin_done_.store(false);
  spin_thread_ = std::thread(
    [this]() {
      try {
        executor_.spin();
      } catch (const std::exception & e) {
        RCLCPP_ERROR(logger_, "executor failed: %s", e.what());
        recordFailure("executor", e.what());
        requestStop("executor failed");
      }
      spin_done_.store(true);
    });

  spawn(
    "display", [this, slice]() {
      while (running_.load()) {
        if (auto frame = channels_.video.receive(slice)) {
          display_(*frame);
        }
      }
    }, false);

  spawn(
    "event-handler", [this, slice]() {
      EventRouter router(
        bridge_->commander(), channels_.telemetry, channels_.events, slice,
        logger_.get_child("event_router"));
      router.run(running_);
    }, false);

  spawn(
    "keyboard", [this, &config, slice_ms]() {
      KeyboardListener listener(config.keyboard_device, logger_.get_child("keyboard"));
      listener.run(channels_.keys, running_, slice_ms);
    }, true);

  spawn(
    "controller", [this, &config, slice]() {
      KeyboardController controller(
        bridge_->commander(), config.gearSettings(), logger_.get_child("controller"));
      if (controller.run(channels_.keys, running_, slice)) {
        requestStop("quit chord");
      }
    }, true);

  RCLCPP_INFO(logger_, "teleop session running, Ctrl+C on the keyboard device to quit");
  waitForStop();
  shutdown();
  sendFinalStop();

  const auto failed = failures();
  for (const auto & failure : failed) {
    RCLCPP_ERROR(logger_, "worker %s failed: %s", failure.worker.c_str(), failure.cause.c_str());
  }
  return failed.empty() ? 0 : 1;
}

void TeleopOrchestrator::requestStop(const std::string & reason)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_) {
      return;
    }
    stop_requested_ = true;
  }
  RCLCPP_INFO(logger_, "stopping: %s", reason.c_str());
  stop_cv_.notify_all();
}

void TeleopOrchestrator::stopWhen(std::function<bool()> condition, const std::string & reason)
{
  std::lock_guard<std::mutex> lock(mutex_);
  stop_condition_ = std::move(condition);
  stop_condition_reason_ = reason;
}

std::vector<WorkerFailure> TeleopOrchestrator::failures() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_;
}

void TeleopOrchestrator::recordFailure(const std::string & worker, const std::string & cause)
{
  std::lock_guard<std::mutex> lock(mutex_);
  failures_.push_back(WorkerFailure{worker, cause});
}

void TeleopOrchestrator::spawn(
  const std::string & name, std::function<void()> body, bool ends_session)
{
  workers_.emplace_back(
    [this, name, body = std::move(body), ends_session]() {
      try {
        body();
        RCLCPP_INFO(logger_, "%s worker finished", name.c_str());
      } catch (const CommandTransportError & e) {
        RCLCPP_ERROR(
          logger_, "%s worker stopped on command transport failure: %s", name.c_str(), e.what());
        recordFailure(name, e.what());
      } catch (const std::exception & e) {
        RCLCPP_ERROR(logger_, "%s worker failed: %s", name.c_str(), e.what());
        recordFailure(name, e.what());
      }
      if (ends_session) {
        requestStop(name + " worker ended");
      }
    });
}

void TeleopOrchestrator::waitForStop()
{
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    stop_cv_.wait_for(lock, std::chrono::milliseconds(100));
    if (stop_requested_) {
      break;
    }
    if (stop_condition_ && stop_condition_()) {
      stop_requested_ = true;
      RCLCPP_INFO(logger_, "stopping: %s", stop_condition_reason_.c_str());
    } else if (!rclcpp::ok()) {
      stop_requested_ = true;
      RCLCPP_INFO(logger_, "stopping: ROS shutdown");
    }
  }
}

// The quit chord may not have been handled when the session was stopped from
// elsewhere, so both groups are zeroed here regardless.
void TeleopOrchestrator::sendFinalStop()
{
  Commander & commander = bridge_->commander();
  try {
    commander.setChassisZero();
  } catch (const CommandTransportError & e) {
    RCLCPP_WARN(logger_, "final chassis stop not sent: %s", e.what());
  }
  try {
    commander.gimbalSpeed(0.0, 0.0);
  } catch (const CommandTransportError & e) {
    RCLCPP_WARN(logger_, "final gimbal stop not sent: %s", e.what());
  }
}

void TeleopOrchestrator::shutdown()
{
  running_.store(false);
  channels_.closeAll();

  if (spin_thread_.joinable()) {
    // a cancel issued before spin() starts is lost, so repeat until it returns
    while (!spin_done_.load()) {
      executor_.cancel();
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    spin_thread_.join();
    executor_.remove_node(bridge_);
  }
  for (auto & worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

}  // namespace robomaster_teleop
