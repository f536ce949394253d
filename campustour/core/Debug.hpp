#ifndef CAMPUSTOUR_CORE_DEBUG_HPP_
#define CAMPUSTOUR_CORE_DEBUG_HPP_

#include <memory>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "CampusTourApi.h"

//
// Stream style logging:
//   LOG_DEBUG("node " << id << " heading " << deg);
// SET_DEBUG takes an spdlog level name ("trace" .. "off"), "ALL" = trace.
//
namespace CampusTour {
namespace Debug {

CAMPUS_TOUR_API std::shared_ptr<spdlog::logger> logger();
CAMPUS_TOUR_API void setLevel(const std::string &level);

} // namespace Debug
} // namespace CampusTour

#define CAMPUSTOUR_LOG_AT(lvl, msg)                                          \
  do {                                                                       \
    auto campustourLogger_ = CampusTour::Debug::logger();                    \
    if (campustourLogger_->should_log(lvl)) {                                \
      std::ostringstream campustourOs_;                                      \
      campustourOs_ << msg;                                                  \
      campustourLogger_->log(lvl, campustourOs_.str());                      \
    }                                                                        \
  } while (0)

#define LOG_TRACE(msg) CAMPUSTOUR_LOG_AT(spdlog::level::trace, msg)
#define LOG_DEBUG(msg) CAMPUSTOUR_LOG_AT(spdlog::level::debug, msg)
#define LOG_INFO(msg) CAMPUSTOUR_LOG_AT(spdlog::level::info, msg)
#define LOG_WARN(msg) CAMPUSTOUR_LOG_AT(spdlog::level::warn, msg)
#define LOG_ERROR(msg) CAMPUSTOUR_LOG_AT(spdlog::level::err, msg)

#define SET_DEBUG(level) CampusTour::Debug::setLevel(level)

#endif /* CAMPUSTOUR_CORE_DEBUG_HPP_ */
