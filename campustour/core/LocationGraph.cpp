#include "LocationGraph.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "Debug.hpp"

namespace CampusTour {

using namespace TourType;

LocationGraph::LocationGraph(
    std::vector<Location> locations,
    std::unordered_map<std::string, std::string> buildingNames,
    std::string entryId)
    : m_buildingNames(std::move(buildingNames)), m_entryId(std::move(entryId)) {
  m_locations.reserve(locations.size());
  for (auto &loc : locations) {
    std::string id = loc.id;
    if (m_locations.count(id)) {
      m_duplicates.push_back(id);
      continue;
    }
    m_order.push_back(id);
    m_locations.emplace(id, std::move(loc));
  }
  if (m_entryId.empty() && !m_order.empty()) {
    m_entryId = m_order.front();
  }
  LOG_DEBUG("LocationGraph: " << m_order.size() << " locations, entry "
                              << m_entryId);
}

const Location *LocationGraph::getById(const std::string &id) const {
  auto it = m_locations.find(id);
  return it == m_locations.end() ? nullptr : &it->second;
}

std::vector<std::string> LocationGraph::getNeighbors(const std::string &id) const {
  std::vector<std::string> result;
  const Location *loc = getById(id);
  if (!loc) {
    return result;
  }

  std::unordered_set<std::string> seen;
  auto add = [&](const Edge &edge) {
    for (auto &target : targets(edge)) {
      if (seen.insert(target).second) {
        result.push_back(target);
      }
    }
  };

  for (Direction dir : horizontalDirections) {
    if (const Edge *e = loc->edge(dir)) add(*e);
  }
  for (Direction dir : verticalDirections) {
    if (const Edge *e = loc->edge(dir)) add(*e);
  }
  for (Direction dir : floorDirections) {
    if (const Edge *e = loc->edge(dir)) add(*e);
  }
  return result;
}

std::vector<std::string> LocationGraph::validate() const {
  std::vector<std::string> problems;

  for (const auto &dup : m_duplicates) {
    problems.push_back("duplicate location id '" + dup + "'");
  }
  if (!m_entryId.empty() && !getById(m_entryId)) {
    problems.push_back("entry location '" + m_entryId + "' does not exist");
  }

  for (const auto &id : m_order) {
    const Location &loc = m_locations.at(id);
    for (const auto &[dir, edge] : loc.edges) {
      const std::string where = id + "." + directionName(dir);
      if (isMultiple(edge)) {
        if (isHorizontal(dir) || isFloorSelect(dir)) {
          problems.push_back(where + " must have exactly one target");
        }
        if (std::get<std::vector<std::string>>(edge).empty()) {
          problems.push_back(where + " has an empty target list");
        }
      }
      for (const auto &target : targets(edge)) {
        if (!getById(target)) {
          problems.push_back(where + " -> '" + target + "' does not exist");
        }
      }
    }
    for (const auto &hs : loc.hotspots) {
      if (!hs.destination.empty() && !getById(hs.destination)) {
        problems.push_back(id + " hotspot -> '" + hs.destination +
                           "' does not exist");
      }
    }
  }

  for (const auto &p : problems) {
    LOG_WARN("LocationGraph: " << p);
  }
  return problems;
}

std::string LocationGraph::buildingName(const std::string &buildingId) const {
  auto it = m_buildingNames.find(buildingId);
  if (it != m_buildingNames.end()) {
    return it->second;
  }
  std::string upper = buildingId;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return upper;
}

} // namespace CampusTour
