#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "AngleOverrides.hpp"
#include "CampusTourApi.h"
#include "DirectionResolver.hpp"
#include "GraphLoader.hpp"
#include "LocationGraph.hpp"
#include "NavigationController.hpp"
#include "OrientationResolver.hpp"
#include "PathFinder.hpp"
#include "RouteWalker.hpp"
#include "TourConfig.hpp"
#include "TourTypes.hpp"

namespace CampusTour {

//
// One tour session: graph, overrides, resolvers, controller and route walker.
// initialize() may be called again to reload; the ImageLoader must outlive
// the core.
//
class CAMPUS_TOUR_API CampusTourCore {
public:
  explicit CampusTourCore(ImageLoader &loader);
  ~CampusTourCore() = default;

  CampusTourCore(const CampusTourCore &) = delete;
  CampusTourCore &operator=(const CampusTourCore &) = delete;

  // Throws GraphLoadError
  void initialize(const std::string &graphFile);
  void initialize(TourData data);

  bool isReady() const { return m_controller != nullptr; }

  const TourConfig &config() const { return m_data.config; }
  const LocationGraph &graph() const { return m_data.graph; }
  const DirectionResolver &directions() const { return *m_directions; }
  const Routing::PathFinder &pathFinder() const { return *m_pathFinder; }

  NavigationController &controller() { return *m_controller; }
  const NavigationController &controller() const { return *m_controller; }
  Routing::RouteWalker &walker() { return *m_walker; }
  const Routing::RouteWalker &walker() const { return *m_walker; }

  // Plan a route from the current location and hand it to the walker
  std::optional<RoutePlan> startRoute(const std::string &destinationId);

  // Directional controls to show for the current camera heading
  std::vector<TourType::Direction> visibleDirections() const;

private:
  ImageLoader &m_loader;
  TourData m_data;

  std::unique_ptr<DirectionResolver> m_directions;
  std::unique_ptr<Orientation::OrientationResolver> m_orientation;
  std::unique_ptr<Routing::PathFinder> m_pathFinder;
  std::unique_ptr<NavigationController> m_controller;
  std::unique_ptr<Routing::RouteWalker> m_walker;

  void reset();
};

} // namespace CampusTour
