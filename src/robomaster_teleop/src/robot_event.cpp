// robot_event.cpp
// Description:
//   Text event parsing. The robot reports events as whitespace separated tokens,
//   optionally terminated by ';':
//     armor event hit <index> <type>
//     sound event <kind> <count>

#include "robomaster_teleop/robot_event.hpp"

#include <sstream>
#include <vector>

namespace robomaster_teleop
{

namespace
{

std::vector<std::string> tokenize(const std::string & line)
{
  std::vector<std::string> tokens;
  std::istringstream in(line);
  std::string token;
  while (in >> token) {
    if (token == ";") {
      break;
    }
    if (!token.empty() && token.back() == ';') {
      token.pop_back();
      if (!token.empty()) {
        tokens.push_back(token);
      }
      break;
    }
    tokens.push_back(token);
  }
  return tokens;
}

bool toInt(const std::string & text, int & value)
{
  std::istringstream in(text);
  int parsed = 0;
  if (!(in >> parsed) || !in.eof()) {
    return false;
  }
  value = parsed;
  return true;
}

}  // namespace

RobotEvent parseRobotEvent(const std::string & line)
{
  const auto tokens = tokenize(line);

  if (tokens.size() == 5 && tokens[0] == "armor" && tokens[1] == "event" && tokens[2] == "hit") {
    ArmorHit hit;
    if (toInt(tokens[3], hit.index) && toInt(tokens[4], hit.type)) {
      return hit;
    }
  }

  if (tokens.size() == 4 && tokens[0] == "sound" && tokens[1] == "event") {
    SoundEvent sound;
    sound.kind = tokens[2];
    if (toInt(tokens[3], sound.count)) {
      return sound;
    }
  }

  return OtherEvent{line};
}

bool isArmorHit(const RobotEvent & event)
{
  return std::holds_alternative<ArmorHit>(event);
}

std::string describe(const RobotEvent & event)
{
  std::ostringstream out;
  if (const auto * hit = std::get_if<ArmorHit>(&event)) {
    out << "ArmorHit(index=" << hit->index << ", type=" << hit->type << ")";
  } else if (const auto * sound = std::get_if<SoundEvent>(&event)) {
    out << "Sound(kind=" << sound->kind << ", count=" << sound->count << ")";
  } else if (const auto * other = std::get_if<OtherEvent>(&event)) {
    out << "Other(" << other->raw << ")";
  }
  return out.str();
}

std::string describe(const TelemetryMessage & message)
{
  return message.source + ": " + message.text;
}

}  // namespace robomaster_teleop
