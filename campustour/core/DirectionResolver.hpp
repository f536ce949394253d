#ifndef CAMPUSTOUR_CORE_DIRECTIONRESOLVER_HPP_
#define CAMPUSTOUR_CORE_DIRECTIONRESOLVER_HPP_

#include <optional>
#include <string>
#include <vector>

#include "AngleOverrides.hpp"
#include "CampusTourApi.h"
#include "TourTypes.hpp"

namespace CampusTour {

/**
 * Angle math for the directions of a single Location.
 *
 * Stateless apart from the (immutable) override table it refers to. The
 * table must outlive the resolver.
 */
class CAMPUS_TOUR_API DirectionResolver {
public:
  explicit DirectionResolver(const AngleOverrideTable &overrides);
  ~DirectionResolver() = default;

  /**
   * Absolute angle [0, 360) of a direction's control on a location.
   * The override table wins, else (baseHeading + offset) mod 360.
   */
  float angleOf(const TourType::Location &loc, TourType::Direction dir) const;

  /**
   * Direction among candidates (only those present as edges on loc) with the
   * smallest circular distance to targetAngle. Ties go to the direction
   * declared first in the enumeration.
   */
  std::optional<TourType::Direction>
  closestDirection(const TourType::Location &loc, float targetAngle,
                   const std::vector<TourType::Direction> &candidates) const;

  /**
   * Which direction of loc leads to targetId. Horizontal edges are searched
   * first, then vertical/special (any member of a list), then floor-select.
   */
  std::optional<TourType::Direction>
  findDirectionTo(const TourType::Location &loc, const std::string &targetId) const;

  // Horizontal edges whose control lies within tolerance of heading
  std::vector<TourType::Direction> directionsFacing(const TourType::Location &loc,
                                                    float heading,
                                                    float tolerance) const;

private:
  const AngleOverrideTable &m_overrides;
};

} // namespace CampusTour

#endif /* CAMPUSTOUR_CORE_DIRECTIONRESOLVER_HPP_ */
