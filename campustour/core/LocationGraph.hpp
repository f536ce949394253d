#ifndef CAMPUSTOUR_CORE_LOCATIONGRAPH_HPP_
#define CAMPUSTOUR_CORE_LOCATIONGRAPH_HPP_

#include <string>
#include <unordered_map>
#include <vector>

#include "CampusTourApi.h"
#include "TourTypes.hpp"

namespace CampusTour {

//
// All Locations and Hubs of the tour keyed by id.
// Populated once by the constructor and read-only after that, so any number
// of readers may share one instance.
//
class CAMPUS_TOUR_API LocationGraph {
public:
  LocationGraph() = default;
  LocationGraph(std::vector<TourType::Location> locations,
                std::unordered_map<std::string, std::string> buildingNames = {},
                std::string entryId = "");
  ~LocationGraph() = default;

  // nullptr for an unknown id, which is a normal outcome
  const TourType::Location *getById(const std::string &id) const;

  // Every id reachable over one edge of any kind, deduplicated, in the order
  // horizontal (enumeration order), vertical/special, floor-select.
  std::vector<std::string> getNeighbors(const std::string &id) const;

  // Load-time check of the whole graph. Empty = valid.
  std::vector<std::string> validate() const;

  std::string buildingName(const std::string &buildingId) const;

  const std::vector<std::string> &ids() const { return m_order; }
  size_t size() const { return m_order.size(); }
  const std::string &entryId() const { return m_entryId; }

private:
  std::unordered_map<std::string, TourType::Location> m_locations;
  std::vector<std::string> m_order;
  std::unordered_map<std::string, std::string> m_buildingNames;
  std::string m_entryId;
  std::vector<std::string> m_duplicates;
};

} // namespace CampusTour

#endif /* CAMPUSTOUR_CORE_LOCATIONGRAPH_HPP_ */
