#include "ImageRequests.hpp"

#include <utility>

#include "Debug.hpp"

namespace CampusTour {

int64_t ImageRequests::add(ImageLoader::Callback done) {
  const int64_t token = ++m_nextToken;
  m_pending[token] = std::move(done);
  return token;
}

bool ImageRequests::answer(int64_t token, bool ok) {
  auto it = m_pending.find(token);
  if (it == m_pending.end()) {
    return false;
  }
  // The callback may start the next load
  ImageLoader::Callback done = std::move(it->second);
  m_pending.erase(it);
  if (done) {
    done(ok);
  }
  return true;
}

size_t ImageRequests::dropAll() {
  const size_t dropped = m_pending.size();
  if (dropped > 0) {
    LOG_DEBUG("Dropping " << dropped << " unanswered image request(s)");
  }
  m_pending.clear();
  return dropped;
}

} // namespace CampusTour
