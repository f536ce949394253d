#ifndef CAMPUSTOUR_CORE_ORIENTATIONRESOLVER_HPP_
#define CAMPUSTOUR_CORE_ORIENTATIONRESOLVER_HPP_

#include <optional>
#include <vector>

#include "CampusTourApi.h"
#include "DirectionResolver.hpp"
#include "LocationGraph.hpp"
#include "TourConfig.hpp"
#include "TourTypes.hpp"

namespace CampusTour {
namespace Orientation {

//
// Decides which way the camera faces after moving from one Location to
// another so the move reads as a continuation of the user's motion.
//
// No single rule fits every layout, so strategies are tried in order and the
// first that produces an angle wins:
//
//   1. ReverseConnection  Find the edge on the destination that points back
//                         at the source. Facing directly away from it is the
//                         "continuation"; snap to the closest destination
//                         direction compatible with the movement sense.
//                         Same-corridor moves with an exact forward/back
//                         match glide instead (strategy 3).
//   2. DirectFamily       Destination's forward (fwdLeft, fwdRight) when
//                         moving forward, back (backLeft, backRight) when
//                         moving back.
//   3. Preserved          Keep the heading relative to the forward axis:
//                         dest.forward + (heading - src.forward).
//   4. Fallback           baseHeading, or its opposite when moving back.
//
//     A ----fwd----> X          X has only right->Y and back->A.
//                   |           Reverse of A->X on X is "back" (180), so the
//                 right         continuation is 0; the closest forward-sense
//                   v           direction on X is right (90). Face right.
//                   Y
//
enum class Strategy { ReverseConnection, DirectFamily, Preserved, Fallback };

CAMPUS_TOUR_API const char *strategyName(Strategy strategy);

struct Resolution {
  float heading;
  Strategy strategy;
  TourType::NavigationType type;
};

class CAMPUS_TOUR_API OrientationResolver {
public:
  OrientationResolver(const LocationGraph &graph, const DirectionResolver &directions,
                      const TourConfig &config = TourConfig());
  ~OrientationResolver() = default;

  TourType::NavigationType classify(const TourType::Location &source,
                                    const TourType::Location &destination,
                                    TourType::Direction dir) const;

  // Forward/backward sense of a move; none for vertical and floor moves
  std::optional<TourType::MovementSense>
  effectiveSense(float currentHeading, const TourType::Location &source,
                 TourType::Direction dir) const;

  Resolution resolve(float currentHeading, const TourType::Location &source,
                     const TourType::Location &destination, TourType::Direction dir,
                     TourType::NavigationType type) const;

  // classify() then resolve()
  Resolution resolve(float currentHeading, const TourType::Location &source,
                     const TourType::Location &destination,
                     TourType::Direction dir) const;

  // None when either location lacks a forward edge
  std::optional<float> preservedOrientation(float currentHeading,
                                            const TourType::Location &source,
                                            const TourType::Location &destination) const;

  static std::vector<TourType::Direction> compatibleDirections(TourType::MovementSense sense);

private:
  const LocationGraph &m_graph;
  const DirectionResolver &m_directions;
  float m_corridorTolerance;
  float m_directionTolerance;

  float forwardReference(const TourType::Location &loc) const;
  std::optional<TourType::MovementSense> senseFromFacedDirection(float heading,
                                                                 const TourType::Location &loc) const;
};

} // namespace Orientation
} // namespace CampusTour

#endif /* CAMPUSTOUR_CORE_ORIENTATIONRESOLVER_HPP_ */
