#ifndef ARGROUND_GROUND_TRACKER_HPP_
#define ARGROUND_GROUND_TRACKER_HPP_

#include "arground/tracking/pose_estimator.hpp"
#include "arground/placement/placement_resolver.hpp"
#include "arground/camera/camera_state.hpp"
#include "arground/detection/plane_detector.hpp"
#include "arground/detection/raycast_hit.hpp"
#include "arground/scene/transform_handle.hpp"
#include "arground/config.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arground
{

// placeObject() uses the camera of the last accepted frame.
class GroundTracker
{
public:
  GroundTracker(const ArgroundConfig& config,
                scene::TransformHandle& indicator,
                scene::TransformHandle& target);
  ~GroundTracker();
  
  bool initialize(const camera::CameraState& camera);
  bool isInitialized() const;
  
  PoseSource onFrame(const camera::CameraState& camera,
                     const detection::PlaneDetector& detector);
  
  PoseSource onFrame(const camera::CameraState& camera,
                     const std::vector<detection::RaycastHit>& hits);
  
  void placeObject();
  
  geometry::Pose currentGroundPose() const;
  std::optional<detection::RaycastHit> currentHit() const;
  bool hasGround() const;
  
  const tracking::PoseEstimator& estimator() const;
  const placement::PlacementResolver& resolver() const;
  
  void reset();
  
  bool updateConfig(const ArgroundConfig& config);
  const ArgroundConfig& getConfig() const;
  
  void exportToJSON(const std::string& filename) const;

private:
  struct Implementation;
  std::unique_ptr<Implementation> impl_;
};

}

#endif
