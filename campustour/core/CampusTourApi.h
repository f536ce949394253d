#pragma once

#ifdef _WIN32
#ifdef CAMPUSTOUR_EXPORTS
#define CAMPUS_TOUR_API __declspec(dllexport)
#else
#define CAMPUS_TOUR_API
#endif
#else
#ifdef CAMPUSTOUR_EXPORTS
#define CAMPUS_TOUR_API __attribute__((visibility("default")))
#else
#define CAMPUS_TOUR_API
#endif
#endif
