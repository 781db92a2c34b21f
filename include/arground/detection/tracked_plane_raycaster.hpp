#ifndef ARGROUND_DETECTION_TRACKED_PLANE_RAYCASTER_HPP_
#define ARGROUND_DETECTION_TRACKED_PLANE_RAYCASTER_HPP_

#include "arground/detection/plane_detector.hpp"
#include "arground/camera/camera_state.hpp"
#include "arground/geometry/primitives.hpp"
#include <map>
#include <vector>

namespace arground
{
namespace detection
{

// The plane's normal is the local +Y of center_pose. The boundary polygon is
// given in the plane's local (x, z) coordinates.
struct TrackedPlane
{
  TrackableId id = INVALID_TRACKABLE;
  geometry::Pose center_pose;
  std::vector<Eigen::Vector2f> boundary;
  
  Eigen::Vector3f normal() const
  {
    return center_pose.up();
  }
};

class TrackedPlaneRaycaster : public PlaneDetector
{
public:
  TrackedPlaneRaycaster() = default;
  
  void setCamera(const camera::CameraState& camera);
  
  void addOrUpdatePlane(const TrackedPlane& plane);
  bool removePlane(TrackableId id);
  void clear();
  
  size_t planeCount() const;
  const TrackedPlane* getPlane(TrackableId id) const;
  
  std::vector<RaycastHit> raycast(const Eigen::Vector2f& screen_point,
                                  TrackableType filter) const override;
  
  std::vector<RaycastHit> raycast(const geometry::Ray& ray,
                                  TrackableType filter) const;

private:
  camera::CameraState camera_;
  bool has_camera_ = false;
  
  std::map<TrackableId, TrackedPlane> planes_;
};

}
}

#endif
