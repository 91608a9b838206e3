// keyboard_listener.cpp
// Description:
//   evdev keyboard source. Key layout:
//     W/S/A/D        chassis forward/back/left/right
//     arrow keys     gimbal pitch and yaw
//     Ctrl           modifier (Ctrl+C ends the session)
//     Space          fire
//     1..5           gear, applied on release

#include "robomaster_teleop/keyboard_listener.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <rclcpp/logging.hpp>

namespace robomaster_teleop
{

Key keyFromCode(unsigned int code)
{
  switch (code) {
    case KEY_W:         return Key::Forward;
    case KEY_S:         return Key::Back;
    case KEY_A:         return Key::Left;
    case KEY_D:         return Key::Right;
    case KEY_UP:        return Key::GimbalUp;
    case KEY_DOWN:      return Key::GimbalDown;
    case KEY_LEFT:      return Key::GimbalLeft;
    case KEY_RIGHT:     return Key::GimbalRight;
    case KEY_LEFTCTRL:
    case KEY_RIGHTCTRL: return Key::Modifier;
    case KEY_SPACE:     return Key::Fire;
    case KEY_1:         return Key::Gear1;
    case KEY_2:         return Key::Gear2;
    case KEY_3:         return Key::Gear3;
    case KEY_4:         return Key::Gear4;
    case KEY_5:         return Key::Gear5;
    case KEY_C:         return Key::Quit;
    default:            break;
  }
  return Key::Unknown;
}

std::optional<KeyEvent> translateInputEvent(const input_event & raw)
{
  if (raw.type != EV_KEY) {
    return std::nullopt;
  }
  KeyEvent event;
  event.edge = raw.value == 0 ? KeyEdge::Up : KeyEdge::Down;
  event.key = keyFromCode(raw.code);
  return event;
}

KeyboardListener::KeyboardListener(const std::string & device, rclcpp::Logger logger)
: logger_(std::move(logger))
{
  fd_ = ::open(device.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    throw std::system_error(errno, std::generic_category(), "cannot open keyboard " + device);
  }
  RCLCPP_INFO(logger_, "reading keyboard from %s", device.c_str());
}

KeyboardListener::KeyboardListener(int fd, rclcpp::Logger logger)
: fd_(fd),
  logger_(std::move(logger))
{
  if (fd_ < 0) {
    throw std::invalid_argument("invalid keyboard descriptor");
  }
}

KeyboardListener::~KeyboardListener()
{
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

bool KeyboardListener::readRecord(input_event & raw)
{
  for (;;) {
    const ssize_t n = ::read(fd_, &raw, sizeof(raw));
    if (n == static_cast<ssize_t>(sizeof(raw))) {
      return true;
    }
    if (n == 0) {
      return false;
    }
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == ENODEV) {
        return false;
      }
      throw std::system_error(errno, std::generic_category(), "keyboard read failed");
    }
    throw std::runtime_error("short read from keyboard device");
  }
}

ReadStatus KeyboardListener::next(KeyEvent & event, std::chrono::milliseconds timeout)
{
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + timeout;

  for (;;) {
    const auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    const int wait_ms = remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
    pollfd pfd{fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "keyboard poll failed");
    }
    if (ready == 0) {
      return ReadStatus::Timeout;
    }
    if (!(pfd.revents & POLLIN)) {
      // POLLHUP / POLLERR with nothing left to read
      return ReadStatus::Closed;
    }

    input_event raw{};
    if (!readRecord(raw)) {
      return ReadStatus::Closed;
    }
    if (auto translated = translateInputEvent(raw)) {
      event = *translated;
      return ReadStatus::Event;
    }
  }
}

void KeyboardListener::run(
  BoundedChannel<KeyEvent> & keys, const std::atomic<bool> & running,
  std::chrono::milliseconds slice)
{
  KeyEvent event{};
  while (running.load()) {
    const ReadStatus status = next(event, slice);
    if (status == ReadStatus::Closed) {
      RCLCPP_WARN(logger_, "keyboard device closed");
      keys.close();
      return;
    }
    if (status == ReadStatus::Timeout) {
      continue;
    }
    // key edges are never dropped
    while (!keys.send(event, slice)) {
      if (!running.load() || keys.closed()) {
        return;
      }
      RCLCPP_WARN(logger_, "key channel full, retrying %s", keyName(event.key));
    }
  }
}

}  // namespace robomaster_teleop
