#include "Debug.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace CampusTour {
namespace Debug {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(once, [] {
    instance = spdlog::get("campustour");
    if (!instance) {
      instance = spdlog::stdout_color_mt("campustour");
      instance->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
      instance->set_level(spdlog::level::info);
    }
  });
  return instance;
}

void setLevel(const std::string &level) {
  if (level == "ALL" || level == "all") {
    logger()->set_level(spdlog::level::trace);
    return;
  }
  spdlog::level::level_enum lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (lvl == spdlog::level::off && level != "off") {
    logger()->warn("Unknown log level '{}', keeping {}", level,
                   spdlog::level::to_string_view(logger()->level()));
    return;
  }
  logger()->set_level(lvl);
}

} // namespace Debug
} // namespace CampusTour
