#ifndef GD_CAMPUS_TOUR_H
#define GD_CAMPUS_TOUR_H

#include <cstdint>
#include <optional>
#include <string>

#include <godot_cpp/classes/ref_counted.hpp>
#include <godot_cpp/variant/dictionary.hpp>
#include <godot_cpp/variant/packed_string_array.hpp>
#include <godot_cpp/variant/string.hpp>

#include "CampusTourApi.h"
#include "CampusTourCore.hpp"
#include "Debug.hpp"
#include "ImageRequests.hpp"

namespace godot {

// Hands image requests to the scene as a signal; the scene answers through
// GDCampusTour::image_loaded with the same token.
class SignalImageLoader : public CampusTour::ImageLoader {
public:
  explicit SignalImageLoader(Object *owner) : m_owner(owner) {}

  void load(const std::string &url, Callback done) override;
  bool answer(int64_t token, bool ok) { return m_requests.answer(token, ok); }
  size_t dropPending() { return m_requests.dropAll(); }

private:
  Object *m_owner;
  CampusTour::ImageRequests m_requests;
};

class CAMPUS_TOUR_API GDCampusTour : public RefCounted {
  GDCLASS(GDCampusTour, RefCounted)

protected:
  static void _bind_methods();

  // Only what the script set explicitly overrides the graph file
  std::optional<std::string> mEntry;
  std::optional<float> mSecondsPerHop;
  std::optional<float> mCorridorTolerance;
  std::optional<float> mDirectionTolerance;
  std::optional<float> mFacingTolerance;
  std::optional<std::string> mLogLevel;

  SignalImageLoader loader{this};
  CampusTour::CampusTourCore core{loader};

public:
  GDCampusTour();
  ~GDCampusTour();

  GDCampusTour *setEntry(const String &id);
  GDCampusTour *setSecondsPerHop(float seconds);
  GDCampusTour *setCorridorTolerance(float degrees);
  GDCampusTour *setDirectionTolerance(float degrees);
  GDCampusTour *setFacingTolerance(float degrees);
  GDCampusTour *setLogLevel(const String &level);

  bool loadGraph(const String &path);

  bool navigate(const String &direction);
  bool jumpTo(const String &id);
  void cancel();
  void imageLoaded(int64_t token, bool ok);

  void setHeading(float degrees);
  float getHeading() const;
  String getCurrentLocation() const;
  bool isTransitioning() const;

  Dictionary getLocation(const String &id) const;
  String findDirectionTo(const String &fromId, const String &targetId) const;
  PackedStringArray directionsFacing(float heading) const;
  PackedStringArray visibleDirections() const;

  Dictionary planRoute(const String &id) const;
  bool startRoute(const String &id);
  bool routeStep();
  bool routeSkipToEnd();
  void routePause();
  void routeResume();
  void routeCancel();
  bool setRouteSpeed(const String &speed);
  int getRouteDelayMs() const;
  bool isRouteActive() const;

private:
  void applySettings(CampusTour::TourConfig &config) const;
  void fail(const String &message);
};

} // namespace godot

#endif
