#ifndef CAMPUSTOUR_CORE_NAVIGATIONCONTROLLER_HPP_
#define CAMPUSTOUR_CORE_NAVIGATIONCONTROLLER_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "CampusTourApi.h"
#include "LocationGraph.hpp"
#include "OrientationResolver.hpp"
#include "PathFinder.hpp"
#include "TourConfig.hpp"
#include "TourTypes.hpp"

namespace CampusTour {

// Asset layer: attempt to load an image and report the outcome. The
// callback may run synchronously inside load() or any time later. A load()
// that throws is reported as a failed load.
class CAMPUS_TOUR_API ImageLoader {
public:
  using Callback = std::function<void(bool ok)>;
  virtual ~ImageLoader() = default;
  virtual void load(const std::string &url, Callback done) = 0;
};

struct RoutePlan {
  TourType::PathResult path;
  std::string description;
  Routing::TravelEstimate estimate;
};

//
// Owns the session's NavigationState and is the only thing that changes it.
// One transition at a time: intents arriving while an image preload is in
// flight are dropped. A preload answer is only committed if its request
// token is still the current one.
//
class CAMPUS_TOUR_API NavigationController {
public:
  using StateListener =
      std::function<void(const TourType::NavigationState &, const TourType::Location &)>;
  using ErrorListener = std::function<void(const std::string &)>;

  NavigationController(const LocationGraph &graph,
                       const Orientation::OrientationResolver &orientation,
                       const Routing::PathFinder &pathFinder, ImageLoader &loader,
                       const TourConfig &config = TourConfig());
  ~NavigationController() = default;

  NavigationController(const NavigationController &) = delete;
  NavigationController &operator=(const NavigationController &) = delete;

  const TourType::NavigationState &state() const { return m_state; }
  const TourType::Location *currentLocation() const;

  // Raw drag/scroll from the renderer
  void setHeading(float degrees);

  // false when the intent was dropped or could not start
  bool navigate(TourType::Direction dir);
  bool jumpTo(const std::string &locationId);

  std::optional<RoutePlan> planRouteTo(const std::string &locationId) const;

  // Forget the in-flight preload, if any
  void cancelPending();

  void setStateListener(StateListener listener) { m_onState = std::move(listener); }
  void setErrorListener(ErrorListener listener) { m_onError = std::move(listener); }

  // Navigation type and strategy of the last committed directional move
  const std::optional<Orientation::Resolution> &lastResolution() const { return m_lastResolution; }

private:
  const LocationGraph &m_graph;
  const Orientation::OrientationResolver &m_orientation;
  const Routing::PathFinder &m_pathFinder;
  ImageLoader &m_loader;
  TourConfig m_config;

  TourType::NavigationState m_state;
  uint64_t m_requestToken = 0;
  std::optional<Orientation::Resolution> m_lastResolution;

  StateListener m_onState;
  ErrorListener m_onError;

  // Expires with the controller so late loader callbacks can tell
  std::shared_ptr<char> m_lifeline = std::make_shared<char>(0);

  bool beginTransition(const TourType::Location &target, float heading,
                       std::optional<Orientation::Resolution> resolution);
  void finishTransition(uint64_t token, const std::string &targetId, float heading,
                        std::optional<Orientation::Resolution> resolution, bool ok);
  void reportError(const std::string &message);
};

} // namespace CampusTour

#endif /* CAMPUSTOUR_CORE_NAVIGATIONCONTROLLER_HPP_ */
