#include "arground/placement/placement_resolver.hpp"
#include "arground/geometry/rotations.hpp"
#include <spdlog/spdlog.h>

namespace arground
{
namespace placement
{

PlacementResolver::PlacementResolver(const PlacementConfig& config,
                                     const tracking::PoseEstimator& estimator,
                                     scene::TransformHandle& target)
  : config_(config),
    estimator_(estimator),
    target_(target)
{
  spdlog::debug("PlacementResolver initialized with fallback offset={:.1f}m, drop={:.1f}m",
                config_.fallback_forward_offset, config_.fallback_drop);
}

geometry::Pose PlacementResolver::resolve(const camera::CameraState& camera) const
{
  const geometry::Pose ground = estimator_.currentGroundPose();
  
  geometry::Pose placement;
  if (!ground.isIdentity())
  {
    placement.position = ground.position;
  }
  else
  {
    placement.position = camera.position +
                         camera.forward() * config_.fallback_forward_offset -
                         Eigen::Vector3f::UnitY() * config_.fallback_drop;
  }
  placement.orientation = geometry::bearingRotation(camera.forward());
  
  return placement;
}

geometry::Pose PlacementResolver::placeObject(const camera::CameraState& camera)
{
  const geometry::Pose placement = resolve(camera);
  
  target_.setPosition(placement.position);
  target_.setRotation(placement.orientation);
  placement_count_++;
  
  spdlog::info("Object placed at [{:.3f}, {:.3f}, {:.3f}] ({})",
               placement.position.x(), placement.position.y(), placement.position.z(),
               estimator_.hasGround() ? "on ground" : "no ground, camera offset");
  
  return placement;
}

size_t PlacementResolver::placementCount() const
{
  return placement_count_;
}

void PlacementResolver::updateConfig(const PlacementConfig& config)
{
  config_ = config;
  spdlog::info("PlacementResolver config updated");
}

const PlacementConfig& PlacementResolver::getConfig() const
{
  return config_;
}

}
}
