#ifndef ARGROUND_COMMON_HPP_
#define ARGROUND_COMMON_HPP_

#include <cstdint>
#include <limits>
#include <string>

namespace arground
{

using TrackableId = uint64_t;

constexpr float GEOM_EPS = 1e-6f;
constexpr float INFINITY_F = std::numeric_limits<float>::infinity();
constexpr TrackableId INVALID_TRACKABLE = std::numeric_limits<TrackableId>::max();

enum class TrackableType
{
  NONE = 0,
  PLANE_WITHIN_POLYGON,
  PLANE_WITHIN_BOUNDS,
  PLANE_WITHIN_INFINITY
};

enum class PoseSource
{
  NONE = 0,
  DETECTION,
  FALLBACK
};

inline std::string toString(TrackableType type)
{
  switch (type)
  {
    case TrackableType::NONE: return "none";
    case TrackableType::PLANE_WITHIN_POLYGON: return "plane_within_polygon";
    case TrackableType::PLANE_WITHIN_BOUNDS: return "plane_within_bounds";
    case TrackableType::PLANE_WITHIN_INFINITY: return "plane_within_infinity";
    default: return "unknown";
  }
}

inline std::string toString(PoseSource source)
{
  switch (source)
  {
    case PoseSource::NONE: return "none";
    case PoseSource::DETECTION: return "detection";
    case PoseSource::FALLBACK: return "fallback";
    default: return "unknown";
  }
}

}

#endif
