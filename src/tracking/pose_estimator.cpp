#include "arground/tracking/pose_estimator.hpp"
#include "arground/geometry/intersections.hpp"
#include "arground/geometry/rotations.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fstream>

namespace arground
{
namespace tracking
{

struct PoseEstimator::Implementation
{
  EstimatorConfig config;
  scene::TransformHandle& indicator;
  
  geometry::Pose ground_pose = geometry::Pose::identity();
  std::optional<detection::RaycastHit> current_hit;
  PoseSource last_source = PoseSource::NONE;
  
  Stats stats;
  
  Implementation(const EstimatorConfig& cfg, scene::TransformHandle& indicator_handle)
    : config(cfg),
      indicator(indicator_handle)
  {
  }
  
  void updateIndicatorRotation(const camera::CameraState& camera)
  {
    const Eigen::Vector3f bearing = geometry::horizontalBearing(camera.forward());
    if (bearing.isZero())
    {
      spdlog::debug("Camera forward is vertical, indicator bearing undefined");
    }
    indicator.setRotation(geometry::lookRotation(bearing));
  }
  
  PoseSource applyDetection(const detection::RaycastHit& hit)
  {
    ground_pose = hit.pose;
    current_hit = hit;
    indicator.setPosition(ground_pose.position);
    
    stats.detection_frames++;
    spdlog::debug("Ground from trackable {} at [{:.3f}, {:.3f}, {:.3f}], distance {:.2f}m",
                  hit.trackable_id,
                  ground_pose.position.x(), ground_pose.position.y(), ground_pose.position.z(),
                  hit.distance);
    return PoseSource::DETECTION;
  }
  
  PoseSource applyFallback(const camera::CameraState& camera)
  {
    const geometry::Plane ground_plane =
        geometry::Plane::fromNormalAndPoint(Eigen::Vector3f::UnitY(), ground_pose.position);
    const geometry::Ray camera_ray = camera.viewportPointToRay(config.viewport_center);
    
    float enter = 0.0f;
    if (!geometry::intersectRayPlane(camera_ray, ground_plane, enter))
    {
      stats.fallback_misses++;
      spdlog::debug("Fallback ray misses ground plane at height {:.3f}, keeping last pose",
                    ground_pose.position.y());
      return PoseSource::NONE;
    }
    
    if (enter > config.max_fallback_distance)
    {
      stats.clamped_fallbacks++;
      spdlog::debug("Fallback distance {:.2f}m clamped to {:.2f}m",
                    enter, config.max_fallback_distance);
      enter = config.max_fallback_distance;
    }
    
    const Eigen::Vector3f ground_hit = ground_plane.closestPoint(camera_ray.getPoint(enter));
    
    geometry::Pose estimate;
    estimate.position = ground_hit;
    estimate.orientation = geometry::lookRotation(ground_plane.normal);
    
    ground_pose = estimate;
    current_hit.reset();
    indicator.setPosition(ground_pose.position);
    
    stats.fallback_frames++;
    spdlog::debug("Ground from fallback at [{:.3f}, {:.3f}, {:.3f}]",
                  ground_hit.x(), ground_hit.y(), ground_hit.z());
    return PoseSource::FALLBACK;
  }
  
  PoseSource update(const camera::CameraState& camera,
                    const std::vector<detection::RaycastHit>& hits)
  {
    stats.frames_processed++;
    
    updateIndicatorRotation(camera);
    
    if (!hits.empty())
    {
      last_source = applyDetection(hits.front());
    }
    else
    {
      last_source = applyFallback(camera);
    }
    
    return last_source;
  }
  
  nlohmann::json poseToJSON(const geometry::Pose& pose) const
  {
    return {
      {"position", {pose.position.x(), pose.position.y(), pose.position.z()}},
      {"orientation", {pose.orientation.w(), pose.orientation.x(),
                       pose.orientation.y(), pose.orientation.z()}}
    };
  }
  
  nlohmann::json toJSON() const
  {
    nlohmann::json j;
    
    j["config"] = {
      {"max_fallback_distance", config.max_fallback_distance},
      {"viewport_center", {config.viewport_center.x(), config.viewport_center.y()}},
      {"detection_filter", toString(config.detection_filter)}
    };
    
    j["state"]["has_ground"] = !ground_pose.isIdentity();
    j["state"]["last_source"] = toString(last_source);
    j["state"]["ground_pose"] = poseToJSON(ground_pose);
    if (current_hit)
    {
      j["state"]["current_hit"] = {
        {"trackable_id", current_hit->trackable_id},
        {"hit_type", toString(current_hit->hit_type)},
        {"distance", current_hit->distance}
      };
    }
    
    j["statistics"] = {
      {"frames_processed", stats.frames_processed},
      {"detection_frames", stats.detection_frames},
      {"fallback_frames", stats.fallback_frames},
      {"fallback_misses", stats.fallback_misses},
      {"clamped_fallbacks", stats.clamped_fallbacks}
    };
    
    return j;
  }
};

PoseEstimator::PoseEstimator(const EstimatorConfig& config, scene::TransformHandle& indicator)
  : impl_(std::make_unique<Implementation>(config, indicator))
{
  spdlog::info("PoseEstimator initialized with max_fallback_distance={:.1f}m, filter={}",
               config.max_fallback_distance, toString(config.detection_filter));
}

PoseEstimator::~PoseEstimator() = default;

PoseSource PoseEstimator::update(const camera::CameraState& camera,
                                 const detection::PlaneDetector& detector)
{
  const Eigen::Vector2f screen_center =
      camera.viewportToScreenPoint(impl_->config.viewport_center);
  return impl_->update(camera, detector.raycast(screen_center, impl_->config.detection_filter));
}

PoseSource PoseEstimator::update(const camera::CameraState& camera,
                                 const std::vector<detection::RaycastHit>& hits)
{
  return impl_->update(camera, hits);
}

geometry::Pose PoseEstimator::currentGroundPose() const
{
  return impl_->ground_pose;
}

std::optional<detection::RaycastHit> PoseEstimator::currentHit() const
{
  return impl_->current_hit;
}

bool PoseEstimator::hasGround() const
{
  return !impl_->ground_pose.isIdentity();
}

PoseSource PoseEstimator::lastSource() const
{
  return impl_->last_source;
}

void PoseEstimator::reset()
{
  impl_->ground_pose = geometry::Pose::identity();
  impl_->current_hit.reset();
  impl_->last_source = PoseSource::NONE;
  spdlog::info("PoseEstimator reset, ground pose cleared");
}

PoseEstimator::Stats PoseEstimator::getStats() const
{
  return impl_->stats;
}

void PoseEstimator::resetStats()
{
  impl_->stats = Stats();
}

bool PoseEstimator::updateConfig(const EstimatorConfig& config)
{
  if (!validateEstimatorConfig(config))
  {
    spdlog::error("PoseEstimator: rejected max_fallback_distance={}, keeping {:.1f}m",
                  config.max_fallback_distance, impl_->config.max_fallback_distance);
    return false;
  }
  
  impl_->config = config;
  spdlog::info("PoseEstimator config updated");
  return true;
}

const EstimatorConfig& PoseEstimator::getConfig() const
{
  return impl_->config;
}

void PoseEstimator::exportToJSON(const std::string& filename) const
{
  std::ofstream file(filename);
  if (file.is_open())
  {
    file << impl_->toJSON().dump(2);
    spdlog::info("PoseEstimator exported to {}", filename);
  }
  else
  {
    spdlog::error("Failed to export PoseEstimator to {}", filename);
  }
}

}
}
