// keyboard_listener.hpp
// Description:
//   Reads key edges from a Linux evdev device (/dev/input/eventN). Unlike a
//   terminal, evdev reports releases, which the velocity state needs.

#ifndef ROBOMASTER_TELEOP__KEYBOARD_LISTENER_HPP_
#define ROBOMASTER_TELEOP__KEYBOARD_LISTENER_HPP_

#include <linux/input.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include <rclcpp/logger.hpp>

#include "robomaster_teleop/bounded_channel.hpp"
#include "robomaster_teleop/key_map.hpp"

namespace robomaster_teleop
{

// Maps a raw evdev record to a key edge. Non-key records yield std::nullopt;
// auto-repeat (value 2) is reported as Down.
std::optional<KeyEvent> translateInputEvent(const input_event & raw);

Key keyFromCode(unsigned int code);

enum class ReadStatus
{
  Event,
  Timeout,
  Closed
};

class KeyboardListener
{
public:
  // Opens `device` read-only. Throws std::system_error on failure.
  KeyboardListener(const std::string & device, rclcpp::Logger logger);

  // Takes ownership of an already open descriptor.
  KeyboardListener(int fd, rclcpp::Logger logger);

  ~KeyboardListener();

  KeyboardListener(const KeyboardListener &) = delete;
  KeyboardListener & operator=(const KeyboardListener &) = delete;

  // Waits up to `timeout` for the next key edge. Closed means the device went away.
  ReadStatus next(KeyEvent & event, std::chrono::milliseconds timeout);

  // Forwards key edges into `keys` until the device closes or `running` is cleared.
  void run(
    BoundedChannel<KeyEvent> & keys, const std::atomic<bool> & running,
    std::chrono::milliseconds slice);

private:
  bool readRecord(input_event & raw);

  int fd_{-1};
  rclcpp::Logger logger_;
};

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__KEYBOARD_LISTENER_HPP_
