// frame_display.hpp
// Description:
//   Frame sink that shows the camera stream in an OpenCV window. Used from
//   the display worker only; all HighGUI calls stay on that thread.

#ifndef ROBOMASTER_TELEOP__FRAME_DISPLAY_HPP_
#define ROBOMASTER_TELEOP__FRAME_DISPLAY_HPP_

#include <cstddef>
#include <optional>
#include <string>

#include <opencv2/core.hpp>
#include <rclcpp/logger.hpp>

#include "robomaster_teleop/hardware_bridge.hpp"

namespace robomaster_teleop
{

// bgr8 copy of `frame`, or nullopt when its encoding cannot be converted.
std::optional<cv::Mat> toBgr(const VideoFrame & frame);

class FrameDisplay
{
public:
  FrameDisplay(std::string window_name, rclcpp::Logger logger);

  FrameDisplay(const FrameDisplay &) = delete;
  FrameDisplay & operator=(const FrameDisplay &) = delete;

  void show(const VideoFrame & frame);

  std::size_t shown() const {return shown_;}
  std::size_t skipped() const {return skipped_;}

private:
  std::string window_name_;
  rclcpp::Logger logger_;
  bool window_open_{false};
  std::size_t shown_{0};
  std::size_t skipped_{0};
};

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__FRAME_DISPLAY_HPP_
