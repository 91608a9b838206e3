#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>
#include <rclcpp/logging.hpp>
#include <sensor_msgs/msg/image.hpp>

#include "robomaster_teleop/frame_display.hpp"

using robomaster_teleop::FrameDisplay;
using robomaster_teleop::VideoFrame;
using robomaster_teleop::toBgr;

namespace
{

VideoFrame makeFrame(const std::string & encoding, std::vector<uint8_t> data, uint32_t width)
{
  auto image = std::make_shared<sensor_msgs::msg::Image>();
  image->encoding = encoding;
  image->width = width;
  image->height = 1;
  image->step = static_cast<uint32_t>(data.size());
  image->data = std::move(data);
  return image;
}

}  // namespace

TEST(ToBgr, SwapsRgbChannels)
{
  const auto frame = makeFrame("rgb8", {255, 0, 0, 0, 0, 255}, 2);

  auto image = toBgr(frame);
  ASSERT_TRUE(image.has_value());
  ASSERT_EQ(image->cols, 2);
  ASSERT_EQ(image->rows, 1);
  EXPECT_EQ(image->at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 255));
  EXPECT_EQ(image->at<cv::Vec3b>(0, 1), cv::Vec3b(255, 0, 0));
}

TEST(ToBgr, KeepsBgrFrames)
{
  const auto frame = makeFrame("bgr8", {1, 2, 3}, 1);

  auto image = toBgr(frame);
  ASSERT_TRUE(image.has_value());
  EXPECT_EQ(image->at<cv::Vec3b>(0, 0), cv::Vec3b(1, 2, 3));
}

TEST(ToBgr, RejectsUnknownEncoding)
{
  EXPECT_FALSE(toBgr(makeFrame("not_an_encoding", {0, 0, 0}, 1)).has_value());
}

// Skipped frames never reach HighGUI, so this runs without a display.
TEST(FrameDisplay, SkipsFramesItCannotConvert)
{
  FrameDisplay display("test", rclcpp::get_logger("frame_display_test"));

  EXPECT_NO_THROW(display.show(makeFrame("not_an_encoding", {0, 0, 0}, 1)));
  EXPECT_NO_THROW(display.show(makeFrame("not_an_encoding", {0, 0, 0}, 1)));
  EXPECT_EQ(display.skipped(), 2u);
  EXPECT_EQ(display.shown(), 0u);
}
