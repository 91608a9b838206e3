// teleop_node.cpp
// Description:
//   Keyboard teleoperation of a RoboMaster-style chassis + gimbal robot.
//   Reads key edges from an evdev keyboard, publishes chassis/gimbal speed and
//   blaster commands, shows the camera stream, logs chassis/gimbal push and
//   robot events, and stops the chassis whenever an armor hit is reported.
//
//   ros2 run robomaster_teleop teleop_node --ros-args -p keyboard_device:=/dev/input/event3

#include <atomic>
#include <csignal>
#include <memory>

#include <opencv2/highgui.hpp>
#include <rclcpp/rclcpp.hpp>

#include "robomaster_teleop/frame_display.hpp"
#include "robomaster_teleop/hardware_bridge.hpp"
#include "robomaster_teleop/teleop_orchestrator.hpp"

namespace
{

std::atomic<bool> g_interrupted{false};

void onSignal(int)
{
  g_interrupted.store(true);
}

}  // namespace

int main(int argc, char ** argv)
{
  // 1) Initialize ROS 2; SIGINT/SIGTERM are ours so the context outlives the final stop
  rclcpp::init(argc, argv, rclcpp::InitOptions(), rclcpp::SignalHandlerOptions::None);
  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  int status = 0;
  try {
    // 2) Create the bridge node; it reads its parameters on construction
    auto bridge = std::make_shared<robomaster_teleop::HardwareBridge>();

    // 3) Run the session until the quit chord, the keyboard closing or a signal
    robomaster_teleop::FrameDisplay display("RoboMaster", rclcpp::get_logger("display"));
    robomaster_teleop::TeleopOrchestrator orchestrator(
      bridge, [&display](const robomaster_teleop::VideoFrame & frame) {display.show(frame);});
    orchestrator.stopWhen([]() {return g_interrupted.load();}, "interrupted");
    status = orchestrator.run();
  } catch (const std::exception & e) {
    RCLCPP_FATAL(rclcpp::get_logger("teleop_node"), "%s", e.what());
    status = 1;
  }

  // 4) Clean up and exit
  cv::destroyAllWindows();
  rclcpp::shutdown();
  return status;
}
