#include "PathFinder.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <queue>
#include <unordered_map>

#include "Debug.hpp"

namespace CampusTour {
namespace Routing {

using namespace TourType;

PathFinder::PathFinder(const LocationGraph &graph) : m_graph(graph) {}

std::optional<PathResult> PathFinder::findPath(const std::string &startId,
                                               const std::string &endId) const {
  if (startId == endId) {
    return PathResult{{startId}, 0, startId, endId};
  }
  if (!m_graph.getById(startId) || !m_graph.getById(endId)) {
    LOG_DEBUG("findPath: unknown endpoint " << startId << " -> " << endId);
    return std::nullopt;
  }

  std::queue<std::string> q;
  std::unordered_map<std::string, std::string> parent;
  parent.emplace(startId, "");
  q.push(startId);

  int expanded = 0;
  while (!q.empty()) {
    std::string current = q.front();
    q.pop();
    ++expanded;

    if (current == endId) {
      PathResult result;
      result.startId = startId;
      result.endId = endId;
      for (std::string at = endId; !at.empty(); at = parent.at(at)) {
        result.path.push_back(at);
      }
      std::reverse(result.path.begin(), result.path.end());
      result.distance = static_cast<int>(result.path.size()) - 1;
      LOG_DEBUG("findPath: " << startId << " -> " << endId << " "
                             << result.distance << " hops (" << expanded
                             << " expanded)");
      return result;
    }

    for (const auto &next : m_graph.getNeighbors(current)) {
      // Dangling edges are a config error reported by validate(); skip them
      if (parent.count(next) || !m_graph.getById(next)) continue;
      parent.emplace(next, current);
      q.push(next);
    }
  }

  LOG_DEBUG("findPath: no route " << startId << " -> " << endId);
  return std::nullopt;
}

///////////////////////////////////////////////////////////////////////////////

std::string PathFinder::locationLabel(const std::string &id) const {
  const Location *loc = m_graph.getById(id);
  if (!loc || loc->buildingId.empty()) {
    return id;
  }
  std::string label = m_graph.buildingName(loc->buildingId);
  if (loc->floor > 0) {
    label += " F" + std::to_string(loc->floor);
  }
  if (!loc->wing.empty()) {
    label += " (" + loc->wing + ")";
  }
  return label;
}

std::string PathFinder::describeRoute(const PathResult &result) const {
  const std::string endLabel = locationLabel(result.endId);
  if (result.distance == 0) {
    return "You are already at " + endLabel + ".";
  }
  const std::string steps = result.distance == 1
                                ? std::string("1 step")
                                : std::to_string(result.distance) + " steps";
  return "Route found: " + steps + " from " + locationLabel(result.startId) +
         " to " + endLabel + ".";
}

TravelEstimate PathFinder::estimateTravelTime(const PathResult &result,
                                              float secondsPerHop) const {
  TravelEstimate est;
  est.seconds = std::max(0.0f, result.distance * secondsPerHop);

  // Round first, then split into minutes and seconds
  char buf[32];
  const long tenths = std::lround(est.seconds * 10.0f);
  if (tenths < 600) {
    std::snprintf(buf, sizeof(buf), "%.1fs", tenths / 10.0);
  } else {
    const long total = std::lround(est.seconds);
    std::snprintf(buf, sizeof(buf), "%ldm %lds", total / 60, total % 60);
  }
  est.formatted = buf;
  return est;
}

bool PathFinder::validatePath(const PathResult &result) const {
  if (result.path.empty()) return false;
  if (result.path.front() != result.startId) return false;
  if (result.path.back() != result.endId) return false;
  if (result.distance != static_cast<int>(result.path.size()) - 1) return false;

  for (const auto &id : result.path) {
    if (!m_graph.getById(id)) return false;
  }
  for (size_t i = 0; i + 1 < result.path.size(); ++i) {
    const auto neighbors = m_graph.getNeighbors(result.path[i]);
    if (std::find(neighbors.begin(), neighbors.end(), result.path[i + 1]) ==
        neighbors.end()) {
      LOG_DEBUG("validatePath: no edge " << result.path[i] << " -> "
                                         << result.path[i + 1]);
      return false;
    }
  }
  return true;
}

} // namespace Routing
} // namespace CampusTour
