#ifndef CAMPUSTOUR_CORE_IMAGEREQUESTS_HPP_
#define CAMPUSTOUR_CORE_IMAGEREQUESTS_HPP_

#include <cstddef>
#include <cstdint>
#include <unordered_map>

#include "CampusTourApi.h"
#include "NavigationController.hpp"

namespace CampusTour {

//
// Image loads handed to an outside asset layer, keyed by the token it
// answers with. An answered or dropped token is forgotten.
//
class CAMPUS_TOUR_API ImageRequests {
public:
  int64_t add(ImageLoader::Callback done);

  // false for a token that is unknown, already answered or dropped
  bool answer(int64_t token, bool ok);

  // Forget every outstanding request without answering it
  size_t dropAll();

  size_t size() const { return m_pending.size(); }

private:
  int64_t m_nextToken = 0;
  std::unordered_map<int64_t, ImageLoader::Callback> m_pending;
};

} // namespace CampusTour

#endif /* CAMPUSTOUR_CORE_IMAGEREQUESTS_HPP_ */
