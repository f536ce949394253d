#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "Debug.hpp"
#include "LocationGraph.hpp"
#include "PathFinder.hpp"
#include "TestGraphs.hpp"
#include "TestUtil.hpp"

using namespace CampusTour;
using namespace CampusTour::TourType;
using TestGraphs::makeLocation;

static void testBasics() {
  TestUtil::section("findPath basics");
  LocationGraph graph(TestGraphs::campusFixture(), {{"a", "A Block"}, {"x", "X Block"}});
  Routing::PathFinder finder(graph);

  auto same = finder.findPath("a-f1-c-2", "a-f1-c-2");
  CHECK(same.has_value());
  CHECK(same->path == std::vector<std::string>{"a-f1-c-2"});
  CHECK(same->distance == 0);

  CHECK(!finder.findPath("a-f1-c-1", "nowhere"));
  CHECK(!finder.findPath("nowhere", "a-f1-c-1"));
  CHECK(!finder.findPath("a-f1-c-1", "a-f1-island"));
  CHECK(!finder.findPath("a-f1-island", "a-f1-c-1"));

  // Stairs count as one hop like any other edge
  auto upstairs = finder.findPath("a-f1-c-1", "a-f2-c-3");
  CHECK(upstairs.has_value());
  std::vector<std::string> expected = {"a-f1-c-1", "a-f1-c-2", "a-f1-c-3", "a-f2-c-3"};
  CHECK(upstairs->path == expected);
  CHECK(upstairs->distance == 3);
  CHECK(upstairs->startId == "a-f1-c-1");
  CHECK(upstairs->endId == "a-f2-c-3");
  CHECK(finder.validatePath(*upstairs));

  // Every member of a door list is reachable
  auto lab = finder.findPath("a-f1-c-2", "a-f1-lab-2");
  CHECK(lab.has_value() && lab->distance == 2);

  // x-f1-hall only connects back with "left", edges are directed
  auto cross = finder.findPath("x-f1-hall", "a-f1-side");
  CHECK(cross.has_value() && cross->distance == 4);
  CHECK(finder.validatePath(*cross));
}

static void testDirected() {
  TestUtil::section("Directed edges");
  LocationGraph graph({makeLocation("s-f1-a", 0, {{Direction::Forward, "s-f1-b"}}),
                       makeLocation("s-f1-b", 0)});
  Routing::PathFinder finder(graph);
  CHECK(finder.findPath("s-f1-a", "s-f1-b").has_value());
  CHECK(!finder.findPath("s-f1-b", "s-f1-a"));
}

static void testDeterminism() {
  TestUtil::section("Determinism");
  // Two shortest routes to d: via b (forward) and via c (right)
  LocationGraph graph({
      makeLocation("n-f1-a", 0, {{Direction::Right, "n-f1-c"}, {Direction::Forward, "n-f1-b"}}),
      makeLocation("n-f1-b", 0, {{Direction::Right, "n-f1-d"}}),
      makeLocation("n-f1-c", 0, {{Direction::Forward, "n-f1-d"}}),
      makeLocation("n-f1-d", 0),
  });
  Routing::PathFinder finder(graph);
  auto first = finder.findPath("n-f1-a", "n-f1-d");
  CHECK(first.has_value());
  std::vector<std::string> expected = {"n-f1-a", "n-f1-b", "n-f1-d"};
  CHECK(first->path == expected);
  for (int i = 0; i < 10; ++i) {
    auto again = finder.findPath("n-f1-a", "n-f1-d");
    if (!again || again->path != first->path) {
      CHECK(false && "path changed between calls");
      return;
    }
  }
  CHECK(true);
}

// Shortest hop count for every pair by relaxation, independent of the BFS
static std::vector<std::vector<int>> allPairsHops(const LocationGraph &graph) {
  const auto &ids = graph.ids();
  const int n = static_cast<int>(ids.size());
  const int INF = 1 << 20;
  std::vector<std::vector<int>> dist(n, std::vector<int>(n, INF));
  for (int i = 0; i < n; ++i) {
    dist[i][i] = 0;
    for (const auto &next : graph.getNeighbors(ids[i])) {
      for (int j = 0; j < n; ++j) {
        if (ids[j] == next && i != j) dist[i][j] = 1;
      }
    }
  }
  for (int k = 0; k < n; ++k)
    for (int i = 0; i < n; ++i)
      for (int j = 0; j < n; ++j)
        if (dist[i][k] + dist[k][j] < dist[i][j]) dist[i][j] = dist[i][k] + dist[k][j];
  return dist;
}

static void testOptimality() {
  TestUtil::section("BFS optimality on random graphs");
  const Direction kinds[] = {Direction::Forward, Direction::Back, Direction::Left,
                             Direction::Right, Direction::Up, Direction::Door};

  std::mt19937 rng(42);
  int mismatches = 0;
  int invalid = 0;
  int pairs = 0;

  for (int round = 0; round < 5; ++round) {
    const int n = 25;
    std::uniform_int_distribution<int> pick(0, n - 1);
    std::vector<Location> locations;
    for (int i = 0; i < n; ++i) {
      Location loc = makeLocation("r-f1-" + std::to_string(i), 0);
      for (Direction d : kinds) {
        if (rng() % 3 == 0) {
          loc.edges.emplace(d, Edge("r-f1-" + std::to_string(pick(rng))));
        }
      }
      locations.push_back(loc);
    }
    LocationGraph graph(locations);
    Routing::PathFinder finder(graph);
    auto dist = allPairsHops(graph);
    const auto &ids = graph.ids();

    auto startTime = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < n; ++i) {
      for (int j = 0; j < n; ++j) {
        ++pairs;
        auto result = finder.findPath(ids[i], ids[j]);
        bool reachable = dist[i][j] < (1 << 20);
        if (reachable != result.has_value()) {
          ++mismatches;
          continue;
        }
        if (!result) continue;
        if (result->distance != dist[i][j]) ++mismatches;
        if (!finder.validatePath(*result)) ++invalid;
      }
    }
    auto endTime = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime);
    std::cout << "  round " << round << ": " << n * n << " queries in " << duration.count()
              << " μs" << std::endl;
  }
  std::cout << "  " << pairs << " pairs checked" << std::endl;
  CHECK(mismatches == 0);
  CHECK(invalid == 0);
}

static void testDescribeAndEstimate() {
  TestUtil::section("describeRoute / estimateTravelTime");
  Location north = makeLocation("a-f1-c-1", 0, {{Direction::Forward, "a-f1-c-2"}});
  north.wing = "north";
  Location next = makeLocation("a-f1-c-2", 0, {{Direction::Right, "x-f2-hall"}});
  next.wing = "north";
  Location hall = makeLocation("x-f2-hall", 90);
  Location gate = makeLocation("outside-gate", 0, {{Direction::Forward, "a-f1-c-1"}});

  LocationGraph graph({north, next, hall, gate},
                      {{"a", "A Block"}, {"outside", "Outside Campus"}});
  Routing::PathFinder finder(graph);

  auto here = finder.findPath("a-f1-c-1", "a-f1-c-1");
  CHECK(finder.describeRoute(*here) == "You are already at A Block F1 (north).");

  auto one = finder.findPath("a-f1-c-1", "a-f1-c-2");
  CHECK(finder.describeRoute(*one) == "Route found: 1 step from A Block F1 (north) to A Block F1 (north).");

  auto route = finder.findPath("outside-gate", "x-f2-hall");
  CHECK(route.has_value() && route->distance == 3);
  CHECK(finder.describeRoute(*route) == "Route found: 3 steps from Outside Campus to X F2.");

  auto estimate = finder.estimateTravelTime(*route);
  CHECK_NEAR(estimate.seconds, 2.4f);
  CHECK(estimate.formatted == "2.4s");
  CHECK(finder.estimateTravelTime(*here).formatted == "0.0s");
  CHECK(finder.estimateTravelTime(*route, 2.0f).formatted == "6.0s");

  PathResult longWalk;
  longWalk.distance = 80;
  auto slow = finder.estimateTravelTime(longWalk);
  CHECK_NEAR(slow.seconds, 64.0f);
  CHECK(slow.formatted == "1m 4s");

  // Rounding carries into the minutes
  PathResult nearTwoMinutes;
  nearTwoMinutes.distance = 171;
  CHECK(finder.estimateTravelTime(nearTwoMinutes, 0.7f).formatted == "2m 0s");
  PathResult oneHop;
  oneHop.distance = 1;
  CHECK(finder.estimateTravelTime(oneHop, 59.97f).formatted == "1m 0s");
  CHECK(finder.estimateTravelTime(oneHop, 59.9f).formatted == "59.9s");
}

static void testValidatePath() {
  TestUtil::section("validatePath");
  LocationGraph graph(TestGraphs::campusFixture());
  Routing::PathFinder finder(graph);

  PathResult skip{{"a-f1-c-1", "a-f1-c-3"}, 1, "a-f1-c-1", "a-f1-c-3"};
  CHECK(!finder.validatePath(skip));
  PathResult wrongCount{{"a-f1-c-1", "a-f1-c-2"}, 2, "a-f1-c-1", "a-f1-c-2"};
  CHECK(!finder.validatePath(wrongCount));
  PathResult empty;
  CHECK(!finder.validatePath(empty));
  PathResult ok{{"a-f1-c-1", "a-f1-c-2"}, 1, "a-f1-c-1", "a-f1-c-2"};
  CHECK(finder.validatePath(ok));
}

int main(int argc, char **argv) {
  SET_DEBUG("warn");
  std::cout << "=== Path Finder Test ===" << std::endl;

  testBasics();
  testDirected();
  testDeterminism();
  testOptimality();
  testDescribeAndEstimate();
  testValidatePath();

  return TestUtil::summary("PathFinder");
}
