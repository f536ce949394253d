#include "OrientationResolver.hpp"

#include <cmath>

#include "Debug.hpp"

namespace CampusTour {
namespace Orientation {

using namespace TourType;

const char *strategyName(Strategy strategy) {
  switch (strategy) {
  case Strategy::ReverseConnection:
    return "reverse-connection";
  case Strategy::DirectFamily:
    return "direct-family";
  case Strategy::Preserved:
    return "preserved";
  case Strategy::Fallback:
    return "fallback";
  }
  return "unknown";
}

OrientationResolver::OrientationResolver(const LocationGraph &graph,
                                         const DirectionResolver &directions,
                                         const TourConfig &config)
    : m_graph(graph), m_directions(directions),
      m_corridorTolerance(config.corridorTolerance),
      m_directionTolerance(config.directionTolerance) {}

std::vector<Direction> OrientationResolver::compatibleDirections(MovementSense sense) {
  if (sense == MovementSense::Forward) {
    return {Direction::Forward, Direction::ForwardLeft, Direction::ForwardRight,
            Direction::Left, Direction::Right};
  }
  return {Direction::Back, Direction::BackLeft, Direction::BackRight,
          Direction::Left, Direction::Right};
}

///////////////////////////////////////////////////////////////////////////////

NavigationType OrientationResolver::classify(const Location &source,
                                             const Location &destination,
                                             Direction dir) const {
  const bool forward = isForwardFamily(dir);
  const bool back = isBackFamily(dir);
  if (!forward && !back) {
    return NavigationType::Turn;
  }

  if (source.buildingId != destination.buildingId || source.floor != destination.floor) {
    return NavigationType::CrossBuilding;
  }

  const Direction reverse = forward ? Direction::Back : Direction::Forward;
  const Edge *out = source.edge(dir);
  const Edge *in = destination.edge(reverse);
  if (!out || !in || !leadsTo(*out, destination.id) || !leadsTo(*in, source.id)) {
    return NavigationType::SameBuildingCorner;
  }

  // Both ends of a straight corridor point at each other
  float outAngle = m_directions.angleOf(source, dir);
  float inAngle = m_directions.angleOf(destination, reverse);
  if (std::fabs(angularDifference(outAngle, inAngle) - 180.0f) > m_corridorTolerance) {
    return NavigationType::SameBuildingCorner;
  }
  return NavigationType::SameCorridor;
}

float OrientationResolver::forwardReference(const Location &loc) const {
  if (loc.hasEdge(Direction::Forward)) {
    return m_directions.angleOf(loc, Direction::Forward);
  }
  if (loc.hasEdge(Direction::Back)) {
    return normalizeAngle(m_directions.angleOf(loc, Direction::Back) + 180.0f);
  }
  return normalizeAngle(loc.baseHeading);
}

std::optional<MovementSense>
OrientationResolver::senseFromFacedDirection(float heading, const Location &loc) const {
  static const Direction order[] = {
      Direction::Forward, Direction::ForwardLeft, Direction::ForwardRight,
      Direction::Back,    Direction::BackLeft,    Direction::BackRight,
      Direction::Left,    Direction::Right,
  };

  for (Direction dir : order) {
    const Edge *e = loc.edge(dir);
    if (!e) continue;
    if (angularDifference(heading, m_directions.angleOf(loc, dir)) >= m_directionTolerance) {
      continue;
    }
    if (isForwardFamily(dir)) return MovementSense::Forward;
    if (isBackFamily(dir)) return MovementSense::Backward;

    // Looking left/right: how does that neighbour connect back to us?
    auto targetId = firstTarget(*e);
    const Location *neighbor = targetId ? m_graph.getById(*targetId) : nullptr;
    if (!neighbor) continue;
    auto reverse = m_directions.findDirectionTo(*neighbor, loc.id);
    if (!reverse) continue;
    if (isForwardFamily(*reverse)) return MovementSense::Backward;
    if (isBackFamily(*reverse)) return MovementSense::Forward;
  }
  return std::nullopt;
}

std::optional<MovementSense>
OrientationResolver::effectiveSense(float currentHeading, const Location &source,
                                    Direction dir) const {
  if (isForwardFamily(dir)) return MovementSense::Forward;
  if (isBackFamily(dir)) return MovementSense::Backward;
  if (!isPureTurn(dir)) return std::nullopt;

  if (auto sense = senseFromFacedDirection(currentHeading, source)) {
    return sense;
  }
  float diff = angularDifference(currentHeading, forwardReference(source));
  return diff < 90.0f ? MovementSense::Forward : MovementSense::Backward;
}

std::optional<float>
OrientationResolver::preservedOrientation(float currentHeading, const Location &source,
                                          const Location &destination) const {
  if (!source.hasEdge(Direction::Forward) || !destination.hasEdge(Direction::Forward)) {
    return std::nullopt;
  }
  float relative = normalizeSigned(currentHeading - m_directions.angleOf(source, Direction::Forward));
  return normalizeAngle(m_directions.angleOf(destination, Direction::Forward) + relative);
}

///////////////////////////////////////////////////////////////////////////////

Resolution OrientationResolver::resolve(float currentHeading, const Location &source,
                                        const Location &destination,
                                        Direction dir) const {
  return resolve(currentHeading, source, destination, dir,
                 classify(source, destination, dir));
}

Resolution OrientationResolver::resolve(float currentHeading, const Location &source,
                                        const Location &destination, Direction dir,
                                        NavigationType type) const {
  const bool forward = isForwardFamily(dir);
  const bool back = isBackFamily(dir);
  const auto sense = effectiveSense(currentHeading, source, dir);

  LOG_DEBUG("resolve " << source.id << " -(" << directionName(dir) << ")-> "
                       << destination.id << " heading " << currentHeading << " "
                       << navigationTypeName(type) << " sense "
                       << (!sense ? "none"
                                  : *sense == MovementSense::Forward ? "forward"
                                                                     : "backward"));

  // 1. Reverse connection
  if (auto reverse = m_directions.findDirectionTo(destination, source.id)) {
    float continuation =
        normalizeAngle(m_directions.angleOf(destination, *reverse) + 180.0f);
    LOG_DEBUG("  reverse " << directionName(*reverse) << " continuation "
                           << continuation);

    bool exactPrimary = (forward && destination.hasEdge(Direction::Forward)) ||
                        (back && destination.hasEdge(Direction::Back));
    if (type == NavigationType::SameCorridor && exactPrimary) {
      if (auto glide = preservedOrientation(currentHeading, source, destination)) {
        LOG_DEBUG("  corridor glide -> " << *glide);
        return {*glide, Strategy::Preserved, type};
      }
    }

    if (sense) {
      if (auto match = m_directions.closestDirection(destination, continuation,
                                                     compatibleDirections(*sense))) {
        float heading = m_directions.angleOf(destination, *match);
        LOG_DEBUG("  closest " << directionName(*match) << " -> " << heading);
        return {heading, Strategy::ReverseConnection, type};
      }
    }
  }

  // 2. Same family on the destination
  if (forward || back) {
    const Direction family[3] = {
        forward ? Direction::Forward : Direction::Back,
        forward ? Direction::ForwardLeft : Direction::BackLeft,
        forward ? Direction::ForwardRight : Direction::BackRight,
    };
    for (Direction candidate : family) {
      if (destination.hasEdge(candidate)) {
        float heading = m_directions.angleOf(destination, candidate);
        LOG_DEBUG("  direct " << directionName(candidate) << " -> " << heading);
        return {heading, Strategy::DirectFamily, type};
      }
    }
  }

  // 3. Keep the heading relative to the corridor
  if (type == NavigationType::SameCorridor || type == NavigationType::Turn) {
    if (auto kept = preservedOrientation(currentHeading, source, destination)) {
      LOG_DEBUG("  preserved -> " << *kept);
      return {*kept, Strategy::Preserved, type};
    }
  }

  // 4. Nothing fits
  float heading = back ? normalizeAngle(destination.baseHeading + 180.0f)
                       : normalizeAngle(destination.baseHeading);
  LOG_DEBUG("  fallback -> " << heading);
  return {heading, Strategy::Fallback, type};
}

} // namespace Orientation
} // namespace CampusTour
