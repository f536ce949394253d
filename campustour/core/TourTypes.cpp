#include "TourTypes.hpp"

#include <algorithm>
#include <cmath>

namespace CampusTour {
namespace TourType {

namespace {

const std::array<const char *, NUM_DIRECTIONS> directionNames = {
    "forward", "forwardRight", "right",    "backRight", "back",   "backLeft",
    "left",    "forwardLeft",  "up",       "down",      "elevator", "door",
    "floor1",  "floor2",       "floor3",   "floor4",
};

int index(Direction dir) { return static_cast<int>(dir); }

} // namespace

bool isHorizontal(Direction dir) { return index(dir) < NUM_HORIZONTAL; }

bool isVertical(Direction dir) {
  return dir == Direction::Up || dir == Direction::Down ||
         dir == Direction::Elevator || dir == Direction::Door;
}

bool isFloorSelect(Direction dir) { return index(dir) >= index(Direction::Floor1); }

bool isForwardFamily(Direction dir) {
  return dir == Direction::Forward || dir == Direction::ForwardLeft ||
         dir == Direction::ForwardRight;
}

bool isBackFamily(Direction dir) {
  return dir == Direction::Back || dir == Direction::BackLeft ||
         dir == Direction::BackRight;
}

bool isPureTurn(Direction dir) {
  return dir == Direction::Left || dir == Direction::Right;
}

float directionOffset(Direction dir) {
  return isHorizontal(dir) ? directionOffsets[index(dir)] : 0.0f;
}

std::optional<Direction> floorDirection(int floor) {
  if (floor < 1 || floor > static_cast<int>(floorDirections.size())) {
    return std::nullopt;
  }
  return floorDirections[floor - 1];
}

int floorNumber(Direction dir) {
  return isFloorSelect(dir) ? index(dir) - index(Direction::Floor1) + 1 : 0;
}

const char *directionName(Direction dir) { return directionNames[index(dir)]; }

std::optional<Direction> parseDirection(const std::string &name) {
  for (int i = 0; i < NUM_DIRECTIONS; ++i) {
    if (name == directionNames[i]) {
      return static_cast<Direction>(i);
    }
  }
  return std::nullopt;
}

///////////////////////////////////////////////////////////////////////////////

bool isMultiple(const Edge &edge) {
  return std::holds_alternative<std::vector<std::string>>(edge);
}

std::optional<std::string> firstTarget(const Edge &edge) {
  if (const auto *single = std::get_if<std::string>(&edge)) {
    return *single;
  }
  const auto &list = std::get<std::vector<std::string>>(edge);
  if (list.empty()) {
    return std::nullopt;
  }
  return list.front();
}

std::vector<std::string> targets(const Edge &edge) {
  if (const auto *single = std::get_if<std::string>(&edge)) {
    return {*single};
  }
  return std::get<std::vector<std::string>>(edge);
}

bool leadsTo(const Edge &edge, const std::string &id) {
  if (const auto *single = std::get_if<std::string>(&edge)) {
    return *single == id;
  }
  const auto &list = std::get<std::vector<std::string>>(edge);
  return std::find(list.begin(), list.end(), id) != list.end();
}

const char *navigationTypeName(NavigationType type) {
  switch (type) {
  case NavigationType::SameCorridor:
    return "same-corridor";
  case NavigationType::SameBuildingCorner:
    return "same-building-corner";
  case NavigationType::CrossBuilding:
    return "cross-building";
  case NavigationType::Turn:
    return "turn";
  }
  return "unknown";
}

///////////////////////////////////////////////////////////////////////////////

float normalizeAngle(float deg) {
  float a = std::fmod(deg, 360.0f);
  if (a < 0.0f) {
    a += 360.0f;
  }
  // fmod of a tiny negative can round up to 360
  return a >= 360.0f ? 0.0f : a;
}

float normalizeSigned(float deg) {
  float a = normalizeAngle(deg);
  return a > 180.0f ? a - 360.0f : a;
}

float angularDifference(float a, float b) {
  float diff = std::fabs(normalizeAngle(a) - normalizeAngle(b));
  return diff > 180.0f ? 360.0f - diff : diff;
}

} // namespace TourType
} // namespace CampusTour
