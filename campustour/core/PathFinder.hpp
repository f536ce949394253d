#ifndef CAMPUSTOUR_CORE_PATHFINDER_HPP_
#define CAMPUSTOUR_CORE_PATHFINDER_HPP_

#include <optional>
#include <string>

#include "CampusTourApi.h"
#include "LocationGraph.hpp"
#include "TourTypes.hpp"

namespace CampusTour {
namespace Routing {

struct TravelEstimate {
  float seconds = 0.0f;
  std::string formatted; // "4.0s" or "1m 12s"
};

const float DEFAULT_SECONDS_PER_HOP = 0.8f;

//
// Shortest hop sequence between two locations. Every edge kind is
// traversable and costs one hop, so a plain BFS is optimal. Neighbour order
// is fixed by LocationGraph::getNeighbors which makes the chosen path
// deterministic when several shortest paths exist.
//
class CAMPUS_TOUR_API PathFinder {
public:
  explicit PathFinder(const LocationGraph &graph);
  ~PathFinder() = default;

  std::optional<TourType::PathResult> findPath(const std::string &startId,
                                               const std::string &endId) const;

  std::string describeRoute(const TourType::PathResult &result) const;

  TravelEstimate estimateTravelTime(const TourType::PathResult &result,
                                    float secondsPerHop = DEFAULT_SECONDS_PER_HOP) const;

  // Re-checks every hop against the graph. Not for the hot path.
  bool validatePath(const TourType::PathResult &result) const;

private:
  const LocationGraph &m_graph;

  std::string locationLabel(const std::string &id) const;
};

} // namespace Routing
} // namespace CampusTour

#endif /* CAMPUSTOUR_CORE_PATHFINDER_HPP_ */
