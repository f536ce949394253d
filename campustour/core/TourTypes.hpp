#ifndef CAMPUSTOUR_CORE_TOURTYPES_HPP_
#define CAMPUSTOUR_CORE_TOURTYPES_HPP_

#include <array>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "CampusTourApi.h"

namespace CampusTour {
namespace TourType {

// Declaration order matters: it is the tie-break order for closest direction
// searches and the neighbour order used by the BFS.
enum class Direction {
  Forward = 0,
  ForwardRight,
  Right,
  BackRight,
  Back,
  BackLeft,
  Left,
  ForwardLeft,
  // Vertical / special
  Up,
  Down,
  Elevator,
  Door,
  // Hub floor selection
  Floor1,
  Floor2,
  Floor3,
  Floor4,
};

const int NUM_DIRECTIONS = 16;
const int NUM_HORIZONTAL = 8;

const static std::array<Direction, NUM_HORIZONTAL> horizontalDirections = {
    Direction::Forward,  Direction::ForwardRight, Direction::Right,
    Direction::BackRight, Direction::Back,        Direction::BackLeft,
    Direction::Left,     Direction::ForwardLeft,
};

const static std::array<Direction, 4> verticalDirections = {
    Direction::Up, Direction::Down, Direction::Elevator, Direction::Door};

const static std::array<Direction, 4> floorDirections = {
    Direction::Floor1, Direction::Floor2, Direction::Floor3, Direction::Floor4};

// Offset in degrees from a location's baseHeading, indexed by horizontal
// direction. Non-horizontal directions have no offset.
const static std::array<float, NUM_HORIZONTAL> directionOffsets = {
    0.0f, 45.0f, 90.0f, 135.0f, 180.0f, 225.0f, 270.0f, 315.0f};

CAMPUS_TOUR_API bool isHorizontal(Direction dir);
CAMPUS_TOUR_API bool isVertical(Direction dir);
CAMPUS_TOUR_API bool isFloorSelect(Direction dir);
CAMPUS_TOUR_API bool isForwardFamily(Direction dir);
CAMPUS_TOUR_API bool isBackFamily(Direction dir);
CAMPUS_TOUR_API bool isPureTurn(Direction dir);
CAMPUS_TOUR_API float directionOffset(Direction dir);

// Floor1..Floor4 <-> 1..4
CAMPUS_TOUR_API std::optional<Direction> floorDirection(int floor);
CAMPUS_TOUR_API int floorNumber(Direction dir);

// Canonical names: "forward", "forwardRight", ... "floor4"
CAMPUS_TOUR_API const char *directionName(Direction dir);
CAMPUS_TOUR_API std::optional<Direction> parseDirection(const std::string &name);

// Edge = Single(id) | Multiple(list<id>)
using Edge = std::variant<std::string, std::vector<std::string>>;

CAMPUS_TOUR_API bool isMultiple(const Edge &edge);
CAMPUS_TOUR_API std::optional<std::string> firstTarget(const Edge &edge);
CAMPUS_TOUR_API std::vector<std::string> targets(const Edge &edge);
CAMPUS_TOUR_API bool leadsTo(const Edge &edge, const std::string &id);

struct Vec3 {
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
};

// Clickable area on the sphere for stairs/elevators/doors
struct Hotspot {
  Direction direction;
  Vec3 position;
  std::string destination; // empty = use the direction's edge
};

// Floor button inside a hub
struct FloorButton {
  int floor;
  Vec3 position;
};

struct Location {
  std::string id;
  std::string imageUrl;
  float baseHeading = 0.0f;

  std::string buildingId;
  int floor = 0;
  std::string wing;

  std::map<Direction, Edge> edges;

  std::vector<Hotspot> hotspots;
  std::vector<std::string> nearbyRooms;
  std::vector<std::string> facilities;

  // Hub (elevator interior)
  bool isHub = false;
  std::string hubName;
  std::vector<FloorButton> floorButtons;

  bool hasEdge(Direction dir) const { return edges.count(dir) != 0; }
  const Edge *edge(Direction dir) const {
    auto it = edges.find(dir);
    return it == edges.end() ? nullptr : &it->second;
  }
};

struct AngleOverride {
  std::string locationId;
  Direction direction;
  float angle;
};

enum class NavigationType { SameCorridor, SameBuildingCorner, CrossBuilding, Turn };

CAMPUS_TOUR_API const char *navigationTypeName(NavigationType type);

enum class MovementSense { Forward, Backward };

struct PathResult {
  std::vector<std::string> path;
  int distance = 0;
  std::string startId;
  std::string endId;
};

struct NavigationState {
  std::string currentLocationId;
  float currentHeading = 0.0f;
  bool isTransitioning = false;
};

// Angles
CAMPUS_TOUR_API float normalizeAngle(float deg);  // [0, 360)
CAMPUS_TOUR_API float normalizeSigned(float deg); // [-180, 180]
CAMPUS_TOUR_API float angularDifference(float a, float b); // [0, 180]

} // namespace TourType
} // namespace CampusTour

#endif /* CAMPUSTOUR_CORE_TOURTYPES_HPP_ */
