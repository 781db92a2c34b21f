#ifndef ARGROUND_PLACEMENT_PLACEMENT_RESOLVER_HPP_
#define ARGROUND_PLACEMENT_PLACEMENT_RESOLVER_HPP_

#include "arground/tracking/pose_estimator.hpp"
#include "arground/camera/camera_state.hpp"
#include "arground/geometry/primitives.hpp"
#include "arground/scene/transform_handle.hpp"
#include "arground/config.hpp"
#include <cstddef>

namespace arground
{
namespace placement
{

class PlacementResolver
{
public:
  PlacementResolver(const PlacementConfig& config,
                    const tracking::PoseEstimator& estimator,
                    scene::TransformHandle& target);
  
  // Commits the target transform and returns it. Without a ground pose the
  // target goes fallback_forward_offset ahead of the camera and fallback_drop
  // below it. The target always yaws to the camera's horizontal bearing.
  geometry::Pose placeObject(const camera::CameraState& camera);
  
  geometry::Pose resolve(const camera::CameraState& camera) const;
  
  size_t placementCount() const;
  
  void updateConfig(const PlacementConfig& config);
  const PlacementConfig& getConfig() const;

private:
  PlacementConfig config_;
  const tracking::PoseEstimator& estimator_;
  scene::TransformHandle& target_;
  
  size_t placement_count_ = 0;
};

}
}

#endif
