#ifndef CAMPUSTOUR_CORE_GRAPHLOADER_HPP_
#define CAMPUSTOUR_CORE_GRAPHLOADER_HPP_

#include <istream>
#include <stdexcept>
#include <string>
#include <utility>

#include "AngleOverrides.hpp"
#include "CampusTourApi.h"
#include "LocationGraph.hpp"
#include "TourConfig.hpp"

namespace CampusTour {

class CAMPUS_TOUR_API GraphLoadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Everything one graph file describes
struct TourData {
  LocationGraph graph;
  AngleOverrideTable overrides; // builtin entries + the file's override lines
  TourConfig config;
};

//
// Graph file format, one statement per line, '#' starts a comment:
//
//   config entry a-f1-north-1
//   building a "A Block"
//   override w-gym-entry door 150
//   location a-f1-north-1
//     image tours/a/f1/north-1.jpg
//     heading 90
//     forward a-f1-north-2
//     door a-f1-lab-1 a-f1-lab-2
//     hotspot door 0.5 0.1 -0.8 a-f1-lab-2
//   end
//   hub x-elevator "X Block Elevator"
//     floor1 x-f1-mid-6
//     button 1 3.193 -1.653 8.826
//   end
//
// Throws GraphLoadError for syntax errors and for anything
// LocationGraph::validate() reports.
//
CAMPUS_TOUR_API TourData parseGraph(std::istream &in,
                                    const std::string &sourceName = "<stream>");
CAMPUS_TOUR_API TourData readGraphFromFile(const std::string &filename);

// "a-f1-north-1" -> ("a", 1); floor is 0 when the id carries none
CAMPUS_TOUR_API std::pair<std::string, int> buildingAndFloorFromId(const std::string &id);

} // namespace CampusTour

#endif /* CAMPUSTOUR_CORE_GRAPHLOADER_HPP_ */
