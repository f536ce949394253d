#ifndef CAMPUSTOUR_CORE_ROUTEWALKER_HPP_
#define CAMPUSTOUR_CORE_ROUTEWALKER_HPP_

#include <optional>
#include <string>

#include "CampusTourApi.h"
#include "DirectionResolver.hpp"
#include "LocationGraph.hpp"
#include "NavigationController.hpp"
#include "TourTypes.hpp"

namespace CampusTour {
namespace Routing {

struct WalkSpeed {
  const char *label;
  int delayMs;
};

const WalkSpeed WALK_SLOW = {"Slow", 3500};
const WalkSpeed WALK_NORMAL = {"Normal", 2200};
const WalkSpeed WALK_FAST = {"Fast", 1200};

//
// Route context for walking a PathResult hop by hop. The caller owns the
// timer and calls step() every speed().delayMs; each step issues one
// navigate() (so orientation continuity applies) or, when the hop has no
// usable direction, one jumpTo().
//
class CAMPUS_TOUR_API RouteWalker {
public:
  RouteWalker(const LocationGraph &graph, const DirectionResolver &directions);
  ~RouteWalker() = default;

  bool start(const TourType::PathResult &route);
  bool step(NavigationController &controller);
  bool skipToEnd(NavigationController &controller);

  void pause();
  void resume();
  void cancel();

  void setSpeed(const WalkSpeed &speed) { m_speed = speed; }
  const WalkSpeed &speed() const { return m_speed; }

  bool isActive() const { return m_active; }
  bool isPaused() const { return m_paused; }
  int currentStep() const { return m_index; }
  int totalSteps() const { return static_cast<int>(m_route.path.size()); }
  std::optional<std::string> nextLocationId() const;

private:
  const LocationGraph &m_graph;
  const DirectionResolver &m_directions;

  TourType::PathResult m_route;
  int m_index = -1; // position of the user in m_route.path
  bool m_active = false;
  bool m_paused = false;
  WalkSpeed m_speed = WALK_NORMAL;

  bool syncPosition(const std::string &currentId);
};

} // namespace Routing
} // namespace CampusTour

#endif /* CAMPUSTOUR_CORE_ROUTEWALKER_HPP_ */
