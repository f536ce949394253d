#include "CampusTourCore.hpp"

#include "Debug.hpp"

namespace CampusTour {

using namespace TourType;

CampusTourCore::CampusTourCore(ImageLoader &loader) : m_loader(loader) {}

void CampusTourCore::initialize(const std::string &graphFile) {
  LOG_INFO("## LOAD " << graphFile);
  initialize(readGraphFromFile(graphFile));
}

void CampusTourCore::initialize(TourData data) {
  // Everything below refers into m_data
  reset();
  m_data = std::move(data);
  SET_DEBUG(m_data.config.logLevel);

  LOG_INFO("## CREATE CampusTourCore: " << m_data.graph.size() << " locations, "
                                        << m_data.overrides.entries().size()
                                        << " angle overrides");
  m_directions = std::make_unique<DirectionResolver>(m_data.overrides);
  m_orientation = std::make_unique<Orientation::OrientationResolver>(
      m_data.graph, *m_directions, m_data.config);
  m_pathFinder = std::make_unique<Routing::PathFinder>(m_data.graph);
  m_controller = std::make_unique<NavigationController>(
      m_data.graph, *m_orientation, *m_pathFinder, m_loader, m_data.config);
  m_walker = std::make_unique<Routing::RouteWalker>(m_data.graph, *m_directions);
}

void CampusTourCore::reset() {
  m_walker.reset();
  m_controller.reset();
  m_pathFinder.reset();
  m_orientation.reset();
  m_directions.reset();
}

std::optional<RoutePlan> CampusTourCore::startRoute(const std::string &destinationId) {
  if (!isReady()) {
    return std::nullopt;
  }
  auto plan = m_controller->planRouteTo(destinationId);
  if (!plan) {
    return std::nullopt;
  }
  LOG_INFO(plan->description << " (" << plan->estimate.formatted << ")");
  m_walker->start(plan->path);
  return plan;
}

std::vector<Direction> CampusTourCore::visibleDirections() const {
  if (!isReady()) {
    return {};
  }
  const Location *here = m_controller->currentLocation();
  if (!here) {
    return {};
  }
  return m_directions->directionsFacing(*here, m_controller->state().currentHeading,
                                        m_data.config.facingTolerance);
}

} // namespace CampusTour
