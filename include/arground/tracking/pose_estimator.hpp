#ifndef ARGROUND_TRACKING_POSE_ESTIMATOR_HPP_
#define ARGROUND_TRACKING_POSE_ESTIMATOR_HPP_

#include "arground/camera/camera_state.hpp"
#include "arground/detection/plane_detector.hpp"
#include "arground/detection/raycast_hit.hpp"
#include "arground/geometry/primitives.hpp"
#include "arground/scene/transform_handle.hpp"
#include "arground/config.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arground
{
namespace tracking
{

// A frame whose fallback ray misses the ground plane leaves the pose untouched.
class PoseEstimator
{
public:
  PoseEstimator(const EstimatorConfig& config, scene::TransformHandle& indicator);
  ~PoseEstimator();
  
  PoseSource update(const camera::CameraState& camera,
                    const detection::PlaneDetector& detector);
  
  PoseSource update(const camera::CameraState& camera,
                    const std::vector<detection::RaycastHit>& hits);
  
  geometry::Pose currentGroundPose() const;
  std::optional<detection::RaycastHit> currentHit() const;
  bool hasGround() const;
  PoseSource lastSource() const;
  
  void reset();
  
  struct Stats
  {
    size_t frames_processed = 0;
    size_t detection_frames = 0;
    size_t fallback_frames = 0;
    size_t fallback_misses = 0;
    size_t clamped_fallbacks = 0;
  };
  
  Stats getStats() const;
  void resetStats();
  
  bool updateConfig(const EstimatorConfig& config);
  const EstimatorConfig& getConfig() const;
  
  void exportToJSON(const std::string& filename) const;

private:
  struct Implementation;
  std::unique_ptr<Implementation> impl_;
};

}
}

#endif
