// key_map.hpp
// Description:
//   Operator keys, key edge events and the effect table that tells the velocity
//   state what a key does on press and on release.

#ifndef ROBOMASTER_TELEOP__KEY_MAP_HPP_
#define ROBOMASTER_TELEOP__KEY_MAP_HPP_

#include <cstdint>

namespace robomaster_teleop
{

enum class Key : std::uint8_t
{
  Unknown,
  Forward,
  Back,
  Left,
  Right,
  GimbalUp,
  GimbalDown,
  GimbalLeft,
  GimbalRight,
  Modifier,
  Fire,
  Gear1,
  Gear2,
  Gear3,
  Gear4,
  Gear5,
  Quit
};

enum class KeyEdge : std::uint8_t
{
  Down,
  Up
};

struct KeyEvent
{
  KeyEdge edge;
  Key key;
};

inline bool operator==(const KeyEvent & a, const KeyEvent & b)
{
  return a.edge == b.edge && a.key == b.key;
}

enum class Axis : std::uint8_t
{
  None,
  ChassisX,
  ChassisY,
  GimbalPitch,
  GimbalYaw
};

enum class Magnitude : std::uint8_t
{
  None,
  Speed,   // gear * unit speed
  Degree   // gear * unit degree
};

enum class EffectKind : std::uint8_t
{
  Ignore,
  Move,
  Modifier,
  Fire,
  Gear,
  Quit
};

struct KeyEffect
{
  EffectKind kind{EffectKind::Ignore};
  Axis axis{Axis::None};
  int sign{0};
  Magnitude magnitude{Magnitude::None};
  int gear{0};
};

KeyEffect effectFor(Key key);

const char * keyName(Key key);

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__KEY_MAP_HPP_
