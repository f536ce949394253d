#include "GDCampusTour.hpp"

#include <gdextension_interface.h>
#include <godot_cpp/classes/project_settings.hpp>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/core/error_macros.hpp>
#include <godot_cpp/godot.hpp>
#include <godot_cpp/variant/array.hpp>
#include <godot_cpp/variant/utility_functions.hpp>
#include <godot_cpp/variant/vector3.hpp>

#include "Debug.hpp"
#include "GraphLoader.hpp"

using namespace godot;
using namespace CampusTour;
using namespace CampusTour::TourType;

static String toGodot(const std::string &s) { return String::utf8(s.c_str()); }
static std::string toStd(const String &s) { return std::string(s.utf8().get_data()); }

void SignalImageLoader::load(const std::string &url, Callback done) {
  const int64_t token = m_requests.add(std::move(done));
  LOG_DEBUG("image_requested " << url << " token " << token);
  m_owner->emit_signal("image_requested", toGodot(url), token);
}

/////////////////////////////////////////////////////////

void GDCampusTour::_bind_methods() {
  ClassDB::bind_method(D_METHOD("set_entry", "id"), &GDCampusTour::setEntry);
  ClassDB::bind_method(D_METHOD("set_seconds_per_hop", "seconds"),
                       &GDCampusTour::setSecondsPerHop);
  ClassDB::bind_method(D_METHOD("set_corridor_tolerance", "degrees"),
                       &GDCampusTour::setCorridorTolerance);
  ClassDB::bind_method(D_METHOD("set_direction_tolerance", "degrees"),
                       &GDCampusTour::setDirectionTolerance);
  ClassDB::bind_method(D_METHOD("set_facing_tolerance", "degrees"),
                       &GDCampusTour::setFacingTolerance);
  ClassDB::bind_method(D_METHOD("set_log_level", "level"), &GDCampusTour::setLogLevel);
  ClassDB::bind_method(D_METHOD("load_graph", "path"), &GDCampusTour::loadGraph);

  ClassDB::bind_method(D_METHOD("navigate", "direction"), &GDCampusTour::navigate);
  ClassDB::bind_method(D_METHOD("jump_to", "id"), &GDCampusTour::jumpTo);
  ClassDB::bind_method(D_METHOD("cancel"), &GDCampusTour::cancel);
  ClassDB::bind_method(D_METHOD("image_loaded", "token", "ok"), &GDCampusTour::imageLoaded);

  ClassDB::bind_method(D_METHOD("set_heading", "degrees"), &GDCampusTour::setHeading);
  ClassDB::bind_method(D_METHOD("get_heading"), &GDCampusTour::getHeading);
  ClassDB::bind_method(D_METHOD("get_current_location"), &GDCampusTour::getCurrentLocation);
  ClassDB::bind_method(D_METHOD("is_transitioning"), &GDCampusTour::isTransitioning);

  ClassDB::bind_method(D_METHOD("get_location", "id"), &GDCampusTour::getLocation);
  ClassDB::bind_method(D_METHOD("find_direction_to", "from_id", "target_id"),
                       &GDCampusTour::findDirectionTo);
  ClassDB::bind_method(D_METHOD("directions_facing", "heading"),
                       &GDCampusTour::directionsFacing);
  ClassDB::bind_method(D_METHOD("visible_directions"), &GDCampusTour::visibleDirections);

  ClassDB::bind_method(D_METHOD("plan_route", "id"), &GDCampusTour::planRoute);
  ClassDB::bind_method(D_METHOD("start_route", "id"), &GDCampusTour::startRoute);
  ClassDB::bind_method(D_METHOD("route_step"), &GDCampusTour::routeStep);
  ClassDB::bind_method(D_METHOD("route_skip_to_end"), &GDCampusTour::routeSkipToEnd);
  ClassDB::bind_method(D_METHOD("route_pause"), &GDCampusTour::routePause);
  ClassDB::bind_method(D_METHOD("route_resume"), &GDCampusTour::routeResume);
  ClassDB::bind_method(D_METHOD("route_cancel"), &GDCampusTour::routeCancel);
  ClassDB::bind_method(D_METHOD("set_route_speed", "speed"), &GDCampusTour::setRouteSpeed);
  ClassDB::bind_method(D_METHOD("get_route_delay_ms"), &GDCampusTour::getRouteDelayMs);
  ClassDB::bind_method(D_METHOD("is_route_active"), &GDCampusTour::isRouteActive);

  ADD_SIGNAL(MethodInfo("image_requested", PropertyInfo(Variant::STRING, "url"),
                        PropertyInfo(Variant::INT, "token")));
  ADD_SIGNAL(MethodInfo("location_changed", PropertyInfo(Variant::STRING, "id"),
                        PropertyInfo(Variant::STRING, "image_url"),
                        PropertyInfo(Variant::FLOAT, "heading")));
  ADD_SIGNAL(MethodInfo("navigation_failed", PropertyInfo(Variant::STRING, "message")));
}

GDCampusTour::GDCampusTour() {}

GDCampusTour::~GDCampusTour() {}

GDCampusTour *GDCampusTour::setEntry(const String &id) {
  mEntry = toStd(id);
  LOG_INFO("SET ENTRY: " << *mEntry);
  return this;
}

GDCampusTour *GDCampusTour::setSecondsPerHop(float seconds) {
  mSecondsPerHop = seconds;
  LOG_INFO("SET SECONDS PER HOP: " << seconds);
  return this;
}

GDCampusTour *GDCampusTour::setCorridorTolerance(float degrees) {
  mCorridorTolerance = degrees;
  LOG_INFO("SET CORRIDOR TOLERANCE: " << degrees);
  return this;
}

GDCampusTour *GDCampusTour::setDirectionTolerance(float degrees) {
  mDirectionTolerance = degrees;
  LOG_INFO("SET DIRECTION TOLERANCE: " << degrees);
  return this;
}

GDCampusTour *GDCampusTour::setFacingTolerance(float degrees) {
  mFacingTolerance = degrees;
  LOG_INFO("SET FACING TOLERANCE: " << degrees);
  return this;
}

GDCampusTour *GDCampusTour::setLogLevel(const String &level) {
  mLogLevel = toStd(level);
  SET_DEBUG(*mLogLevel);
  return this;
}

void GDCampusTour::applySettings(TourConfig &config) const {
  if (mEntry) config.entryLocationId = *mEntry;
  if (mSecondsPerHop) config.secondsPerHop = *mSecondsPerHop;
  if (mCorridorTolerance) config.corridorTolerance = *mCorridorTolerance;
  if (mDirectionTolerance) config.directionTolerance = *mDirectionTolerance;
  if (mFacingTolerance) config.facingTolerance = *mFacingTolerance;
  if (mLogLevel) config.logLevel = *mLogLevel;
}

void GDCampusTour::fail(const String &message) {
  UtilityFunctions::push_error(message);
  emit_signal("navigation_failed", message);
}

bool GDCampusTour::loadGraph(const String &path) {
  const std::string file = toStd(ProjectSettings::get_singleton()->globalize_path(path));
  LOG_INFO("=====================================================");
  LOG_INFO("##Load campus graph: " << file);

  try {
    TourData data = readGraphFromFile(file);
    applySettings(data.config);
    loader.dropPending();
    core.initialize(std::move(data));
  } catch (const GraphLoadError &e) {
    LOG_ERROR(e.what());
    fail(toGodot(e.what()));
    return false;
  }

  core.controller().setStateListener([this](const NavigationState &state, const Location &loc) {
    emit_signal("location_changed", toGodot(loc.id), toGodot(loc.imageUrl),
                state.currentHeading);
  });
  core.controller().setErrorListener([this](const std::string &message) {
    emit_signal("navigation_failed", toGodot(message));
  });

  if (const Location *start = core.controller().currentLocation()) {
    emit_signal("location_changed", toGodot(start->id), toGodot(start->imageUrl),
                core.controller().state().currentHeading);
  }
  return true;
}

// ===========================================================================

bool GDCampusTour::navigate(const String &direction) {
  ERR_FAIL_COND_V_MSG(!core.isReady(), false, "navigate: no graph loaded");
  auto dir = parseDirection(toStd(direction));
  if (!dir) {
    fail("Unknown direction: " + direction);
    return false;
  }
  return core.controller().navigate(*dir);
}

bool GDCampusTour::jumpTo(const String &id) {
  ERR_FAIL_COND_V_MSG(!core.isReady(), false, "jump_to: no graph loaded");
  return core.controller().jumpTo(toStd(id));
}

void GDCampusTour::cancel() {
  if (core.isReady()) {
    core.walker().cancel();
    core.controller().cancelPending();
  }
  loader.dropPending();
}

void GDCampusTour::imageLoaded(int64_t token, bool ok) {
  if (!loader.answer(token, ok)) {
    LOG_DEBUG("image_loaded: unknown token " << token);
  }
}

void GDCampusTour::setHeading(float degrees) {
  if (core.isReady()) {
    core.controller().setHeading(degrees);
  }
}

float GDCampusTour::getHeading() const {
  return core.isReady() ? core.controller().state().currentHeading
                        : 0.0f;
}

String GDCampusTour::getCurrentLocation() const {
  if (!core.isReady()) {
    return String();
  }
  return toGodot(core.controller().state().currentLocationId);
}

bool GDCampusTour::isTransitioning() const {
  return core.isReady() &&
         core.controller().state().isTransitioning;
}

// ===========================================================================

static Variant edgeToVariant(const Edge &edge) {
  if (!isMultiple(edge)) {
    return toGodot(firstTarget(edge).value_or(""));
  }
  PackedStringArray list;
  for (const auto &id : targets(edge)) {
    list.push_back(toGodot(id));
  }
  return list;
}

static Vector3 toVector3(const Vec3 &v) { return Vector3(v.x, v.y, v.z); }

Dictionary GDCampusTour::getLocation(const String &id) const {
  Dictionary result;
  const Location *loc = core.isReady() ? core.graph().getById(toStd(id)) : nullptr;
  if (!loc) {
    return result;
  }

  result["id"] = toGodot(loc->id);
  result["image_url"] = toGodot(loc->imageUrl);
  result["base_heading"] = loc->baseHeading;
  result["building"] = toGodot(loc->buildingId);
  result["building_name"] = toGodot(core.graph().buildingName(loc->buildingId));
  result["floor"] = loc->floor;
  result["wing"] = toGodot(loc->wing);
  result["is_hub"] = loc->isHub;
  result["hub_name"] = toGodot(loc->hubName);

  Dictionary edges;
  Dictionary angles;
  for (const auto &[dir, edge] : loc->edges) {
    edges[directionName(dir)] = edgeToVariant(edge);
    angles[directionName(dir)] = core.directions().angleOf(*loc, dir);
  }
  result["edges"] = edges;
  result["angles"] = angles;

  Array hotspots;
  for (const auto &spot : loc->hotspots) {
    Dictionary h;
    h["direction"] = directionName(spot.direction);
    h["position"] = toVector3(spot.position);
    h["destination"] = toGodot(spot.destination);
    hotspots.push_back(h);
  }
  result["hotspots"] = hotspots;

  Array buttons;
  for (const auto &button : loc->floorButtons) {
    Dictionary b;
    b["floor"] = button.floor;
    b["position"] = toVector3(button.position);
    buttons.push_back(b);
  }
  result["floor_buttons"] = buttons;

  PackedStringArray rooms;
  for (const auto &room : loc->nearbyRooms) rooms.push_back(toGodot(room));
  result["nearby_rooms"] = rooms;

  PackedStringArray facilities;
  for (const auto &facility : loc->facilities) facilities.push_back(toGodot(facility));
  result["facilities"] = facilities;

  return result;
}

String GDCampusTour::findDirectionTo(const String &fromId, const String &targetId) const {
  const Location *loc = core.isReady() ? core.graph().getById(toStd(fromId)) : nullptr;
  if (!loc) {
    return String();
  }
  auto dir = core.directions().findDirectionTo(*loc, toStd(targetId));
  return dir ? String(directionName(*dir)) : String();
}

static PackedStringArray toNames(const std::vector<Direction> &dirs) {
  PackedStringArray names;
  for (Direction dir : dirs) {
    names.push_back(directionName(dir));
  }
  return names;
}

PackedStringArray GDCampusTour::directionsFacing(float heading) const {
  if (!core.isReady()) {
    return PackedStringArray();
  }
  const Location *here = core.controller().currentLocation();
  if (!here) {
    return PackedStringArray();
  }
  return toNames(core.directions().directionsFacing(*here, heading, core.config().facingTolerance));
}

PackedStringArray GDCampusTour::visibleDirections() const {
  return toNames(core.visibleDirections());
}

// ===========================================================================

Dictionary GDCampusTour::planRoute(const String &id) const {
  Dictionary result;
  if (!core.isReady()) {
    return result;
  }
  auto plan = core.controller().planRouteTo(toStd(id));
  if (!plan) {
    return result;
  }
  PackedStringArray path;
  for (const auto &step : plan->path.path) {
    path.push_back(toGodot(step));
  }
  result["path"] = path;
  result["distance"] = plan->path.distance;
  result["description"] = toGodot(plan->description);
  result["seconds"] = plan->estimate.seconds;
  result["formatted"] = toGodot(plan->estimate.formatted);
  return result;
}

bool GDCampusTour::startRoute(const String &id) {
  ERR_FAIL_COND_V_MSG(!core.isReady(), false, "start_route: no graph loaded");
  if (!core.startRoute(toStd(id))) {
    fail("No route to " + id);
    return false;
  }
  return true;
}

bool GDCampusTour::routeStep() {
  return core.isReady() && core.walker().step(core.controller());
}

bool GDCampusTour::routeSkipToEnd() {
  return core.isReady() && core.walker().skipToEnd(core.controller());
}

void GDCampusTour::routePause() {
  if (core.isReady()) core.walker().pause();
}

void GDCampusTour::routeResume() {
  if (core.isReady()) core.walker().resume();
}

void GDCampusTour::routeCancel() {
  if (core.isReady()) core.walker().cancel();
}

bool GDCampusTour::setRouteSpeed(const String &speed) {
  ERR_FAIL_COND_V_MSG(!core.isReady(), false, "set_route_speed: no graph loaded");
  const std::string name = toStd(speed.to_lower());
  if (name == "slow") {
    core.walker().setSpeed(Routing::WALK_SLOW);
  } else if (name == "normal") {
    core.walker().setSpeed(Routing::WALK_NORMAL);
  } else if (name == "fast") {
    core.walker().setSpeed(Routing::WALK_FAST);
  } else {
    return false;
  }
  return true;
}

int GDCampusTour::getRouteDelayMs() const {
  return core.isReady() ? core.walker().speed().delayMs
                        : Routing::WALK_NORMAL.delayMs;
}

bool GDCampusTour::isRouteActive() const {
  return core.isReady() && core.walker().isActive();
}
