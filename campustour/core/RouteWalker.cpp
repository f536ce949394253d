#include "RouteWalker.hpp"

#include <algorithm>

#include "Debug.hpp"

namespace CampusTour {
namespace Routing {

using namespace TourType;

RouteWalker::RouteWalker(const LocationGraph &graph, const DirectionResolver &directions)
    : m_graph(graph), m_directions(directions) {}

bool RouteWalker::start(const PathResult &route) {
  m_route = route;
  m_index = route.path.empty() ? -1 : 0;
  m_paused = false;
  m_active = route.path.size() > 1;
  LOG_DEBUG("RouteWalker: start " << route.startId << " -> " << route.endId << " ("
                                  << route.distance << " hops)");
  return m_active;
}

std::optional<std::string> RouteWalker::nextLocationId() const {
  if (!m_active || m_index < 0 || m_index + 1 >= totalSteps()) {
    return std::nullopt;
  }
  return m_route.path[m_index + 1];
}

bool RouteWalker::syncPosition(const std::string &currentId) {
  // The last hop may still be loading, or may have failed: follow where the
  // controller actually is.
  auto it = std::find(m_route.path.begin() + std::max(m_index, 0), m_route.path.end(),
                      currentId);
  if (it == m_route.path.end()) {
    LOG_WARN("RouteWalker: " << currentId << " is off the route, stopping");
    cancel();
    return false;
  }
  m_index = static_cast<int>(it - m_route.path.begin());
  if (m_index + 1 >= totalSteps()) {
    m_active = false;
    LOG_DEBUG("RouteWalker: arrived at " << currentId);
    return false;
  }
  return true;
}

bool RouteWalker::step(NavigationController &controller) {
  if (!m_active || m_paused || controller.state().isTransitioning) {
    return false;
  }
  if (!syncPosition(controller.state().currentLocationId)) {
    return false;
  }

  const std::string &nextId = m_route.path[m_index + 1];
  const Location *here = m_graph.getById(controller.state().currentLocationId);
  auto dir = here ? m_directions.findDirectionTo(*here, nextId) : std::nullopt;

  // navigate() always takes the first of several doors; other hops jump
  if (dir) {
    const Edge *edge = here->edge(*dir);
    if (edge && firstTarget(*edge) == nextId) {
      LOG_DEBUG("RouteWalker: step " << m_index + 1 << "/" << totalSteps() - 1 << " "
                                     << directionName(*dir) << " -> " << nextId);
      return controller.navigate(*dir);
    }
  }
  LOG_DEBUG("RouteWalker: step " << m_index + 1 << "/" << totalSteps() - 1
                                 << " jump -> " << nextId);
  return controller.jumpTo(nextId);
}

bool RouteWalker::skipToEnd(NavigationController &controller) {
  // A pending hop would swallow the jump, so the route stays as it is
  if (!m_active || controller.state().isTransitioning) {
    return false;
  }
  if (!controller.jumpTo(m_route.endId)) {
    return false;
  }
  m_active = false;
  m_paused = false;
  m_index = totalSteps() - 1;
  return true;
}

void RouteWalker::pause() {
  if (m_active) m_paused = true;
}

void RouteWalker::resume() {
  if (m_active) m_paused = false;
}

void RouteWalker::cancel() {
  m_active = false;
  m_paused = false;
}

} // namespace Routing
} // namespace CampusTour
