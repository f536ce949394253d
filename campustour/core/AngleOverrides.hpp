#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CampusTourApi.h"
#include "TourTypes.hpp"

namespace CampusTour {

// Explicit arrow angles for the few locations whose photo geometry does not
// follow baseHeading + offset.
class CAMPUS_TOUR_API AngleOverrideTable {
public:
  AngleOverrideTable() = default;
  explicit AngleOverrideTable(std::vector<TourType::AngleOverride> entries);

  // The campus' hand-measured entries
  static AngleOverrideTable builtin();

  void add(const TourType::AngleOverride &entry);
  std::optional<float> find(const std::string &locationId,
                            TourType::Direction dir) const;

  const std::vector<TourType::AngleOverride> &entries() const { return m_entries; }

private:
  std::vector<TourType::AngleOverride> m_entries;
};

} // namespace CampusTour
