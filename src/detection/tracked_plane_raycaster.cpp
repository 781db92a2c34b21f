#include "arground/detection/tracked_plane_raycaster.hpp"
#include "arground/geometry/intersections.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace arground
{
namespace detection
{

namespace
{

bool acceptsHit(const TrackedPlane& plane,
                const Eigen::Vector3f& point,
                TrackableType filter)
{
  if (filter == TrackableType::PLANE_WITHIN_INFINITY)
  {
    return true;
  }
  
  const Eigen::Vector3f local = plane.center_pose.orientation.conjugate() *
                                (point - plane.center_pose.position);
  const Eigen::Vector2f local_2d(local.x(), local.z());
  
  if (filter == TrackableType::PLANE_WITHIN_BOUNDS)
  {
    return geometry::pointInBounds2D(local_2d, plane.boundary);
  }
  
  if (filter == TrackableType::PLANE_WITHIN_POLYGON)
  {
    return geometry::pointInPolygon2D(local_2d, plane.boundary);
  }
  
  return false;
}

}

void TrackedPlaneRaycaster::setCamera(const camera::CameraState& camera)
{
  camera_ = camera;
  has_camera_ = true;
}

void TrackedPlaneRaycaster::addOrUpdatePlane(const TrackedPlane& plane)
{
  if (plane.id == INVALID_TRACKABLE)
  {
    spdlog::warn("Ignoring tracked plane without a trackable id");
    return;
  }
  
  auto [it, inserted] = planes_.insert_or_assign(plane.id, plane);
  spdlog::debug("Tracked plane {} {} ({} boundary vertices)",
                it->first, inserted ? "added" : "updated", plane.boundary.size());
}

bool TrackedPlaneRaycaster::removePlane(TrackableId id)
{
  bool removed = planes_.erase(id) > 0;
  if (removed)
  {
    spdlog::debug("Tracked plane {} removed", id);
  }
  return removed;
}

void TrackedPlaneRaycaster::clear()
{
  planes_.clear();
}

size_t TrackedPlaneRaycaster::planeCount() const
{
  return planes_.size();
}

const TrackedPlane* TrackedPlaneRaycaster::getPlane(TrackableId id) const
{
  auto it = planes_.find(id);
  return it != planes_.end() ? &it->second : nullptr;
}

std::vector<RaycastHit> TrackedPlaneRaycaster::raycast(const Eigen::Vector2f& screen_point,
                                                       TrackableType filter) const
{
  if (!has_camera_)
  {
    spdlog::error("TrackedPlaneRaycaster queried before a camera was set");
    return {};
  }
  
  return raycast(camera_.screenPointToRay(screen_point), filter);
}

std::vector<RaycastHit> TrackedPlaneRaycaster::raycast(const geometry::Ray& ray,
                                                       TrackableType filter) const
{
  std::vector<RaycastHit> hits;
  
  if (filter == TrackableType::NONE)
  {
    return hits;
  }
  
  for (const auto& [id, plane] : planes_)
  {
    const geometry::Plane surface =
        geometry::Plane::fromNormalAndPoint(plane.normal(), plane.center_pose.position);
    
    float t = 0.0f;
    if (!geometry::intersectRayPlane(ray, surface, t))
    {
      continue;
    }
    
    const Eigen::Vector3f point = ray.getPoint(t);
    if (!acceptsHit(plane, point, filter))
    {
      continue;
    }
    
    RaycastHit hit;
    hit.pose.position = point;
    hit.pose.orientation = plane.center_pose.orientation;
    hit.distance = t;
    hit.trackable_id = id;
    hit.hit_type = filter;
    hits.push_back(hit);
  }
  
  std::sort(hits.begin(), hits.end(), [](const RaycastHit& a, const RaycastHit& b)
  {
    return a.distance < b.distance;
  });
  
  return hits;
}

}
}
