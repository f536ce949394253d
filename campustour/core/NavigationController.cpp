#include "NavigationController.hpp"

#include <exception>

#include "Debug.hpp"

namespace CampusTour {

using namespace TourType;

NavigationController::NavigationController(
    const LocationGraph &graph,
    const Orientation::OrientationResolver &orientation,
    const Routing::PathFinder &pathFinder, ImageLoader &loader,
    const TourConfig &config)
    : m_graph(graph), m_orientation(orientation),
      m_pathFinder(pathFinder), m_loader(loader), m_config(config) {
  const std::string entry =
      m_config.entryLocationId.empty() ? m_graph.entryId() : m_config.entryLocationId;
  if (const Location *loc = m_graph.getById(entry)) {
    m_state.currentLocationId = loc->id;
    m_state.currentHeading = normalizeAngle(loc->baseHeading);
    LOG_INFO("Tour starts at " << loc->id << " heading " << m_state.currentHeading);
  } else {
    LOG_ERROR("Entry location '" << entry << "' not found");
  }
}

const Location *NavigationController::currentLocation() const {
  return m_graph.getById(m_state.currentLocationId);
}

void NavigationController::setHeading(float degrees) {
  m_state.currentHeading = normalizeAngle(degrees);
}

///////////////////////////////////////////////////////////////////////////////

bool NavigationController::navigate(Direction dir) {
  if (m_state.isTransitioning) {
    LOG_DEBUG("navigate " << directionName(dir) << " dropped: transition in flight");
    return false;
  }
  const Location *current = currentLocation();
  if (!current) {
    return false;
  }
  const Edge *edge = current->edge(dir);
  if (!edge) {
    LOG_DEBUG("navigate: " << current->id << " has no " << directionName(dir));
    return false;
  }

  // Several doors/elevators: the first listed one
  auto targetId = firstTarget(*edge);
  const Location *target = targetId ? m_graph.getById(*targetId) : nullptr;
  if (!target) {
    reportError("Target location not found: " + targetId.value_or("<none>"));
    return false;
  }

  auto resolution = m_orientation.resolve(m_state.currentHeading, *current, *target, dir);
  LOG_INFO("navigate " << current->id << " -(" << directionName(dir) << ")-> "
                       << target->id << " [" << navigationTypeName(resolution.type)
                       << ", " << Orientation::strategyName(resolution.strategy)
                       << "] heading " << m_state.currentHeading << " -> "
                       << resolution.heading);
  return beginTransition(*target, resolution.heading, resolution);
}

bool NavigationController::jumpTo(const std::string &locationId) {
  if (m_state.isTransitioning || locationId == m_state.currentLocationId) {
    return false;
  }
  const Location *target = m_graph.getById(locationId);
  if (!target) {
    reportError("Location not found: " + locationId);
    return false;
  }
  LOG_INFO("jumpTo " << locationId);
  return beginTransition(*target, normalizeAngle(target->baseHeading), std::nullopt);
}

std::optional<RoutePlan> NavigationController::planRouteTo(const std::string &locationId) const {
  auto path = m_pathFinder.findPath(m_state.currentLocationId, locationId);
  if (!path) {
    LOG_INFO("No route from " << m_state.currentLocationId << " to " << locationId);
    return std::nullopt;
  }
  RoutePlan plan;
  plan.description = m_pathFinder.describeRoute(*path);
  plan.estimate = m_pathFinder.estimateTravelTime(*path, m_config.secondsPerHop);
  plan.path = std::move(*path);
  return plan;
}

void NavigationController::cancelPending() {
  if (!m_state.isTransitioning) {
    return;
  }
  ++m_requestToken;
  m_state.isTransitioning = false;
  LOG_DEBUG("Pending transition cancelled");
}

///////////////////////////////////////////////////////////////////////////////

bool NavigationController::beginTransition(const Location &target, float heading,
                                           std::optional<Orientation::Resolution> resolution) {
  m_state.isTransitioning = true;
  const uint64_t token = ++m_requestToken;
  std::weak_ptr<char> alive = m_lifeline;
  std::string targetId = target.id;

  try {
    m_loader.load(target.imageUrl, [this, alive, token, targetId, heading,
                                    resolution](bool ok) {
      if (alive.expired()) {
        return;
      }
      finishTransition(token, targetId, heading, resolution, ok);
    });
  } catch (const std::exception &e) {
    // Only a request the loader never started is ours to unwind
    if (token != m_requestToken || !m_state.isTransitioning) {
      throw;
    }
    ++m_requestToken;
    m_state.isTransitioning = false;
    reportError("Failed to load image: " + target.imageUrl + " (" + e.what() + ")");
    return false;
  }
  return true;
}

void NavigationController::finishTransition(uint64_t token, const std::string &targetId,
                                            float heading,
                                            std::optional<Orientation::Resolution> resolution,
                                            bool ok) {
  if (token != m_requestToken) {
    LOG_DEBUG("Stale image load for " << targetId << " ignored");
    return;
  }
  m_state.isTransitioning = false;

  const Location *target = m_graph.getById(targetId);
  if (!ok || !target) {
    reportError("Failed to load image: " + (target ? target->imageUrl : targetId));
    return;
  }

  m_state.currentLocationId = targetId;
  m_state.currentHeading = heading;
  m_lastResolution = resolution;
  if (m_onState) {
    m_onState(m_state, *target);
  }
}

void NavigationController::reportError(const std::string &message) {
  LOG_ERROR(message);
  if (m_onError) {
    m_onError(message);
  }
}

} // namespace CampusTour
