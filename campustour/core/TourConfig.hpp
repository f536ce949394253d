#pragma once

#include <string>

namespace CampusTour {

struct TourConfig {
  std::string entryLocationId;
  float secondsPerHop = 0.8f;

  // How far from exactly opposite the two ends of a corridor may be
  float corridorTolerance = 15.0f;
  // Camera counts as "looking along" a direction within this window
  float directionTolerance = 15.0f;
  // Directional controls are shown within this window of the camera
  float facingTolerance = 45.0f;

  std::string logLevel = "info";
};

} // namespace CampusTour
