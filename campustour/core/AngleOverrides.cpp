#include "AngleOverrides.hpp"

#include "Debug.hpp"

namespace CampusTour {

using namespace TourType;

AngleOverrideTable::AngleOverrideTable(std::vector<AngleOverride> entries)
    : m_entries(std::move(entries)) {}

AngleOverrideTable AngleOverrideTable::builtin() {
  return AngleOverrideTable({
      {"w-f1-main-entrance", Direction::ForwardLeft, 155.0f},
      {"w-f1-main-2", Direction::Door, 330.0f},
      {"w-f1-main-3", Direction::Door, 330.0f},
      {"w-gym-entry", Direction::Door, 150.0f},
      {"w-gym-entry", Direction::Forward, 220.0f},
  });
}

void AngleOverrideTable::add(const AngleOverride &entry) {
  // Later entries replace earlier ones for the same (location, direction)
  for (auto &existing : m_entries) {
    if (existing.locationId == entry.locationId &&
        existing.direction == entry.direction) {
      LOG_DEBUG("Override " << entry.locationId << "."
                            << directionName(entry.direction) << ": "
                            << existing.angle << " -> " << entry.angle);
      existing.angle = entry.angle;
      return;
    }
  }
  m_entries.push_back(entry);
}

std::optional<float> AngleOverrideTable::find(const std::string &locationId,
                                              Direction dir) const {
  for (const auto &entry : m_entries) {
    if (entry.locationId == locationId && entry.direction == dir) {
      return entry.angle;
    }
  }
  return std::nullopt;
}

} // namespace CampusTour
