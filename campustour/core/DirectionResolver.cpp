#include "DirectionResolver.hpp"

#include <algorithm>
#include <limits>

#include "Debug.hpp"

namespace CampusTour {

using namespace TourType;

DirectionResolver::DirectionResolver(const AngleOverrideTable &overrides)
    : m_overrides(overrides) {}

float DirectionResolver::angleOf(const Location &loc, Direction dir) const {
  if (auto angle = m_overrides.find(loc.id, dir)) {
    return normalizeAngle(*angle);
  }
  return normalizeAngle(loc.baseHeading + directionOffset(dir));
}

std::optional<Direction>
DirectionResolver::closestDirection(const Location &loc, float targetAngle,
                                    const std::vector<Direction> &candidates) const {
  std::optional<Direction> best;
  float bestDiff = std::numeric_limits<float>::max();

  // Walk in enumeration order so ties keep the first-declared direction
  // regardless of the order the caller listed them in.
  for (int i = 0; i < NUM_DIRECTIONS; ++i) {
    Direction dir = static_cast<Direction>(i);
    if (!loc.hasEdge(dir)) continue;
    if (std::find(candidates.begin(), candidates.end(), dir) == candidates.end()) continue;

    float diff = angularDifference(angleOf(loc, dir), targetAngle);
    LOG_TRACE("    closest: " << directionName(dir) << " at " << angleOf(loc, dir)
                              << " diff " << diff);
    if (diff < bestDiff) {
      bestDiff = diff;
      best = dir;
    }
  }
  return best;
}

std::optional<Direction>
DirectionResolver::findDirectionTo(const Location &loc,
                                   const std::string &targetId) const {
  for (Direction dir : horizontalDirections) {
    const Edge *e = loc.edge(dir);
    if (e && leadsTo(*e, targetId)) return dir;
  }
  for (Direction dir : verticalDirections) {
    const Edge *e = loc.edge(dir);
    if (e && leadsTo(*e, targetId)) return dir;
  }
  for (Direction dir : floorDirections) {
    const Edge *e = loc.edge(dir);
    if (e && leadsTo(*e, targetId)) return dir;
  }
  return std::nullopt;
}

std::vector<Direction> DirectionResolver::directionsFacing(const Location &loc,
                                                           float heading,
                                                           float tolerance) const {
  std::vector<Direction> result;
  for (Direction dir : horizontalDirections) {
    if (loc.hasEdge(dir) && angularDifference(angleOf(loc, dir), heading) <= tolerance) {
      result.push_back(dir);
    }
  }
  return result;
}

} // namespace CampusTour
