#include <iostream>
#include <string>
#include <vector>

#include "AngleOverrides.hpp"
#include "Debug.hpp"
#include "DirectionResolver.hpp"
#include "LocationGraph.hpp"
#include "OrientationResolver.hpp"
#include "TestGraphs.hpp"
#include "TestUtil.hpp"

using namespace CampusTour;
using namespace CampusTour::TourType;
using CampusTour::Orientation::OrientationResolver;
using CampusTour::Orientation::Resolution;
using CampusTour::Orientation::Strategy;
using TestGraphs::makeLocation;

// Graph + resolvers kept alive together
struct Fixture {
  AngleOverrideTable overrides;
  LocationGraph graph;
  DirectionResolver directions;
  OrientationResolver resolver;

  explicit Fixture(std::vector<Location> locations, AngleOverrideTable table = {},
                   TourConfig config = TourConfig())
      : overrides(std::move(table)), graph(std::move(locations)), directions(overrides),
        resolver(graph, directions, config) {}

  Resolution move(float heading, const std::string &from, const std::string &to,
                  Direction dir) const {
    return resolver.resolve(heading, *graph.getById(from), *graph.getById(to), dir);
  }
};

static void testCorridorGlide() {
  TestUtil::section("Same corridor keeps the relative heading");
  Fixture f({
      makeLocation("a-f1-a", 0, {{Direction::Forward, "a-f1-b"}}),
      makeLocation("a-f1-b", 0, {{Direction::Back, "a-f1-a"}, {Direction::Forward, "a-f1-d"}}),
      makeLocation("a-f1-d", 0, {{Direction::Back, "a-f1-b"}}),
  });
  const Location &a = *f.graph.getById("a-f1-a");
  const Location &b = *f.graph.getById("a-f1-b");
  CHECK(f.resolver.classify(a, b, Direction::Forward) == NavigationType::SameCorridor);

  Resolution straight = f.move(0.0f, "a-f1-a", "a-f1-b", Direction::Forward);
  CHECK(straight.type == NavigationType::SameCorridor);
  CHECK(straight.strategy == Strategy::Preserved);
  CHECK_NEAR(straight.heading, 0.0f);

  CHECK_NEAR(f.move(30.0f, "a-f1-a", "a-f1-b", Direction::Forward).heading, 30.0f);
  CHECK_NEAR(f.move(340.0f, "a-f1-a", "a-f1-b", Direction::Forward).heading, 340.0f);

  // Walking back to a: a has no back edge of its own so the glide comes from step 3
  Resolution back = f.move(30.0f, "a-f1-b", "a-f1-a", Direction::Back);
  CHECK(back.type == NavigationType::SameCorridor);
  CHECK(back.strategy == Strategy::Preserved);
  CHECK_NEAR(back.heading, 30.0f);
}

static void testOppositeBaseHeading() {
  TestUtil::section("Reverse connection across opposite base headings");
  // b's photo faces the other way: its back edge points at 0, same as a's forward
  Fixture f({
      makeLocation("a-f1-p", 0, {{Direction::Forward, "a-f1-q"}}),
      makeLocation("a-f1-q", 180,
                   {{Direction::Back, "a-f1-p"},
                    {Direction::Left, "a-f1-c"},
                    {Direction::Forward, "a-f1-e"}}),
      makeLocation("a-f1-c", 0),
      makeLocation("a-f1-e", 0),
  });
  Resolution r = f.move(0.0f, "a-f1-p", "a-f1-q", Direction::Forward);
  CHECK(r.type == NavigationType::SameBuildingCorner);
  CHECK(r.strategy == Strategy::ReverseConnection);
  CHECK_NEAR(r.heading, 180.0f);
}

static void testCorner() {
  TestUtil::section("X corner turns to the only way on");
  Fixture f({
      makeLocation("a-f1-start", 0, {{Direction::Forward, "a-f1-x"}}),
      makeLocation("a-f1-x", 0, {{Direction::Right, "a-f1-y"}, {Direction::Back, "a-f1-start"}}),
      makeLocation("a-f1-y", 180, {{Direction::Back, "a-f1-x"}}),
  });

  Resolution into = f.move(0.0f, "a-f1-start", "a-f1-x", Direction::Forward);
  CHECK(into.strategy == Strategy::ReverseConnection);
  CHECK_NEAR(into.heading, 90.0f);

  // Continue right from the corner: y only points back at x (0), keep walking away
  Resolution on = f.move(into.heading, "a-f1-x", "a-f1-y", Direction::Right);
  CHECK(on.type == NavigationType::Turn);
  CHECK(f.resolver.effectiveSense(into.heading, *f.graph.getById("a-f1-x"), Direction::Right) ==
        MovementSense::Forward);
  CHECK_NEAR(on.heading, 180.0f);
}

static void testCrossBuilding() {
  TestUtil::section("Cross building");
  Fixture f({
      makeLocation("a-f1-door", 0, {{Direction::Forward, "x-f1-door"}}),
      makeLocation("x-f1-door", 90, {{Direction::Back, "a-f1-door"}, {Direction::Forward, "x-f1-in"}}),
      makeLocation("x-f1-in", 90),
      makeLocation("a-f1-ramp", 0, {{Direction::Forward, "a-f2-ramp"}}),
      makeLocation("a-f2-ramp", 0, {{Direction::Back, "a-f1-ramp"}}),
  });
  Resolution r = f.move(0.0f, "a-f1-door", "x-f1-door", Direction::Forward);
  CHECK(r.type == NavigationType::CrossBuilding);
  CHECK(r.strategy == Strategy::ReverseConnection);
  CHECK_NEAR(r.heading, 90.0f);

  CHECK(f.resolver.classify(*f.graph.getById("a-f1-ramp"), *f.graph.getById("a-f2-ramp"),
                            Direction::Forward) == NavigationType::CrossBuilding);
}

static void testDirectFamilyAndFallback() {
  TestUtil::section("Direct family / fallback");
  Fixture f({
      makeLocation("s-f1-a", 0,
                   {{Direction::Forward, "s-f1-z"},
                    {Direction::Back, "s-f1-z2"},
                    {Direction::ForwardRight, "s-f1-f"},
                    {Direction::BackRight, "s-f1-g"}}),
      makeLocation("s-f1-z", 90, {{Direction::ForwardRight, "s-f1-w"}}),
      makeLocation("s-f1-z2", 90, {{Direction::BackLeft, "s-f1-w"}}),
      makeLocation("s-f1-f", 45, {{Direction::Left, "s-f1-w"}}),
      makeLocation("s-f1-g", 45, {{Direction::Left, "s-f1-w"}}),
      makeLocation("s-f1-w", 0),
  });

  Resolution fwd = f.move(0.0f, "s-f1-a", "s-f1-z", Direction::Forward);
  CHECK(fwd.strategy == Strategy::DirectFamily);
  CHECK_NEAR(fwd.heading, 135.0f);

  Resolution back = f.move(180.0f, "s-f1-a", "s-f1-z2", Direction::Back);
  CHECK(back.strategy == Strategy::DirectFamily);
  CHECK_NEAR(back.heading, 315.0f);

  Resolution lost = f.move(0.0f, "s-f1-a", "s-f1-f", Direction::ForwardRight);
  CHECK(lost.type == NavigationType::SameBuildingCorner);
  CHECK(lost.strategy == Strategy::Fallback);
  CHECK_NEAR(lost.heading, 45.0f);

  Resolution lostBack = f.move(0.0f, "s-f1-a", "s-f1-g", Direction::BackRight);
  CHECK(lostBack.strategy == Strategy::Fallback);
  CHECK_NEAR(lostBack.heading, 225.0f);
}

static void testTurnPreserved() {
  TestUtil::section("Turn keeps the heading relative to forward");
  Fixture f({
      makeLocation("n-f1-a", 0, {{Direction::Forward, "n-f1-b"}, {Direction::Left, "n-f1-t"}}),
      makeLocation("n-f1-b", 0),
      makeLocation("n-f1-t", 90, {{Direction::Forward, "n-f1-u"}}),
      makeLocation("n-f1-u", 90),
  });
  Resolution r = f.move(270.0f, "n-f1-a", "n-f1-t", Direction::Left);
  CHECK(r.type == NavigationType::Turn);
  CHECK(r.strategy == Strategy::Preserved);
  CHECK_NEAR(r.heading, 0.0f);

  CHECK(!f.resolver.preservedOrientation(0.0f, *f.graph.getById("n-f1-b"),
                                         *f.graph.getById("n-f1-t")));
}

static void testEffectiveSense() {
  TestUtil::section("Movement sense of left/right");
  Fixture f({
      makeLocation("n-f1-s", 0, {{Direction::Forward, "n-f1-f"}, {Direction::Left, "n-f1-l"}}),
      makeLocation("n-f1-f", 0),
      makeLocation("n-f1-l", 270, {{Direction::Forward, "n-f1-s"}}),
  });
  const Location &s = *f.graph.getById("n-f1-s");

  // Looking along forward
  CHECK(f.resolver.effectiveSense(10.0f, s, Direction::Left) == MovementSense::Forward);
  // Looking at l, which reaches s with its forward edge: going there walks back
  CHECK(f.resolver.effectiveSense(270.0f, s, Direction::Left) == MovementSense::Backward);
  // Nothing faced: hemisphere of the forward axis
  CHECK(f.resolver.effectiveSense(60.0f, s, Direction::Right) == MovementSense::Forward);
  CHECK(f.resolver.effectiveSense(180.0f, s, Direction::Right) == MovementSense::Backward);

  CHECK(f.resolver.effectiveSense(0.0f, s, Direction::BackLeft) == MovementSense::Backward);
  CHECK(f.resolver.effectiveSense(180.0f, s, Direction::ForwardRight) == MovementSense::Forward);
  CHECK(!f.resolver.effectiveSense(0.0f, s, Direction::Up));
  CHECK(!f.resolver.effectiveSense(0.0f, s, Direction::Floor2));
}

static void testRoundTrip() {
  TestUtil::section("Forward then back returns to the starting heading");
  std::vector<Location> ring;
  for (int i = 0; i < 4; ++i) {
    std::string next = "a-f1-r" + std::to_string((i + 1) % 4);
    std::string prev = "a-f1-r" + std::to_string((i + 3) % 4);
    ring.push_back(makeLocation("a-f1-r" + std::to_string(i), 0,
                                {{Direction::Forward, next}, {Direction::Back, prev}}));
  }
  Fixture f(ring);

  bool allKept = true;
  for (float start : {0.0f, 30.0f, 75.0f, 200.0f, 345.0f}) {
    float heading = start;
    for (int i = 0; i < 3; ++i) {
      heading = f.move(heading, "a-f1-r" + std::to_string(i), "a-f1-r" + std::to_string(i + 1),
                       Direction::Forward)
                    .heading;
    }
    for (int i = 3; i > 0; --i) {
      heading = f.move(heading, "a-f1-r" + std::to_string(i), "a-f1-r" + std::to_string(i - 1),
                       Direction::Back)
                    .heading;
    }
    std::cout << "  " << start << " -> " << heading << std::endl;
    allKept = allKept && TestUtil::near(heading, start);
  }
  CHECK(allKept);
}

static void testCorridorTolerance() {
  TestUtil::section("Corridor tolerance from config");
  std::vector<Location> locations = {
      makeLocation("a-f1-t1", 0, {{Direction::Forward, "a-f1-t2"}}),
      makeLocation("a-f1-t2", 0, {{Direction::Back, "a-f1-t1"}}),
  };
  // 20 degrees off exactly opposite
  AngleOverrideTable skewed({{"a-f1-t2", Direction::Back, 200.0f}});

  Fixture strict(locations, skewed);
  CHECK(strict.resolver.classify(*strict.graph.getById("a-f1-t1"),
                                 *strict.graph.getById("a-f1-t2"),
                                 Direction::Forward) == NavigationType::SameBuildingCorner);

  TourConfig loose;
  loose.corridorTolerance = 30.0f;
  Fixture relaxed(locations, skewed, loose);
  CHECK(relaxed.resolver.classify(*relaxed.graph.getById("a-f1-t1"),
                                  *relaxed.graph.getById("a-f1-t2"),
                                  Direction::Forward) == NavigationType::SameCorridor);
}

static void testNames() {
  TestUtil::section("Names");
  CHECK(std::string(navigationTypeName(NavigationType::SameCorridor)) == "same-corridor");
  CHECK(std::string(navigationTypeName(NavigationType::CrossBuilding)) == "cross-building");
  CHECK(std::string(Orientation::strategyName(Strategy::ReverseConnection)) ==
        "reverse-connection");
  CHECK(OrientationResolver::compatibleDirections(MovementSense::Backward).front() ==
        Direction::Back);
}

int main(int argc, char **argv) {
  SET_DEBUG("debug");
  std::cout << "=== Orientation Continuity Test ===" << std::endl;

  testCorridorGlide();
  testOppositeBaseHeading();
  testCorner();
  testCrossBuilding();
  testDirectFamilyAndFallback();
  testTurnPreserved();
  testEffectiveSense();
  testRoundTrip();
  testCorridorTolerance();
  testNames();

  return TestUtil::summary("OrientationResolver");
}
