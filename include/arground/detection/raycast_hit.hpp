#ifndef ARGROUND_DETECTION_RAYCAST_HIT_HPP_
#define ARGROUND_DETECTION_RAYCAST_HIT_HPP_

#include "arground/geometry/primitives.hpp"
#include "arground/common.hpp"

namespace arground
{
namespace detection
{

struct RaycastHit
{
  geometry::Pose pose;
  float distance = 0.0f;
  TrackableId trackable_id = INVALID_TRACKABLE;
  TrackableType hit_type = TrackableType::NONE;
};

}
}

#endif
