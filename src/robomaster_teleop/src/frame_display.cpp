// frame_display.cpp
// Description:
//   Image to cv::Mat conversion through cv_bridge and the HighGUI window.

#include "robomaster_teleop/frame_display.hpp"

#include <utility>

#include <cv_bridge/cv_bridge.h>
#include <opencv2/highgui.hpp>
#include <rclcpp/logging.hpp>

namespace robomaster_teleop
{

std::optional<cv::Mat> toBgr(const VideoFrame & frame)
{
  try {
    return cv_bridge::toCvShare(frame, "bgr8")->image.clone();
  } catch (const cv_bridge::Exception &) {
    return std::nullopt;
  }
}

FrameDisplay::FrameDisplay(std::string window_name, rclcpp::Logger logger)
: window_name_(std::move(window_name)),
  logger_(std::move(logger))
{
}

void FrameDisplay::show(const VideoFrame & frame)
{
  auto image = toBgr(frame);
  if (!image) {
    if (skipped_++ == 0) {
      RCLCPP_WARN(logger_, "cannot show %s frames, skipping them", frame->encoding.c_str());
    }
    return;
  }

  if (!window_open_) {
    cv::namedWindow(window_name_, cv::WINDOW_AUTOSIZE);
    window_open_ = true;
  }
  cv::imshow(window_name_, *image);
  cv::waitKey(1);
  ++shown_;
}

}  // namespace robomaster_teleop
