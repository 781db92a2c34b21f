#include "arground/ground_tracker.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fstream>

namespace arground
{

struct GroundTracker::Implementation
{
  ArgroundConfig config;
  
  tracking::PoseEstimator estimator;
  placement::PlacementResolver resolver;
  
  camera::CameraState camera;
  bool initialized = false;
  
  Implementation(const ArgroundConfig& cfg,
                 scene::TransformHandle& indicator,
                 scene::TransformHandle& target)
    : config(cfg),
      estimator(cfg.estimator, indicator),
      resolver(cfg.placement, estimator, target)
  {
  }
  
  bool checkReady(const char* operation) const
  {
    if (!initialized)
    {
      spdlog::error("GroundTracker::{} called before initialize()", operation);
      return false;
    }
    return true;
  }
  
  bool acceptCamera(const camera::CameraState& frame_camera)
  {
    if (!frame_camera.isValid())
    {
      spdlog::error("GroundTracker rejected invalid camera state ({}x{}, fov {:.1f})",
                    frame_camera.intrinsics.viewport_width,
                    frame_camera.intrinsics.viewport_height,
                    frame_camera.intrinsics.vertical_fov_deg);
      return false;
    }
    camera = frame_camera;
    return true;
  }
};

GroundTracker::GroundTracker(const ArgroundConfig& config,
                             scene::TransformHandle& indicator,
                             scene::TransformHandle& target)
  : impl_(std::make_unique<Implementation>(config, indicator, target))
{
}

GroundTracker::~GroundTracker() = default;

bool GroundTracker::initialize(const camera::CameraState& camera)
{
  if (!impl_->acceptCamera(camera))
  {
    return false;
  }
  
  impl_->initialized = true;
  spdlog::info("GroundTracker initialized, viewport {}x{}, fov {:.1f}°",
               camera.intrinsics.viewport_width, camera.intrinsics.viewport_height,
               camera.intrinsics.vertical_fov_deg);
  return true;
}

bool GroundTracker::isInitialized() const
{
  return impl_->initialized;
}

PoseSource GroundTracker::onFrame(const camera::CameraState& camera,
                                  const detection::PlaneDetector& detector)
{
  if (!impl_->checkReady("onFrame") || !impl_->acceptCamera(camera))
  {
    return PoseSource::NONE;
  }
  return impl_->estimator.update(impl_->camera, detector);
}

PoseSource GroundTracker::onFrame(const camera::CameraState& camera,
                                  const std::vector<detection::RaycastHit>& hits)
{
  if (!impl_->checkReady("onFrame") || !impl_->acceptCamera(camera))
  {
    return PoseSource::NONE;
  }
  return impl_->estimator.update(impl_->camera, hits);
}

void GroundTracker::placeObject()
{
  if (!impl_->checkReady("placeObject"))
  {
    return;
  }
  impl_->resolver.placeObject(impl_->camera);
}

geometry::Pose GroundTracker::currentGroundPose() const
{
  return impl_->estimator.currentGroundPose();
}

std::optional<detection::RaycastHit> GroundTracker::currentHit() const
{
  return impl_->estimator.currentHit();
}

bool GroundTracker::hasGround() const
{
  return impl_->estimator.hasGround();
}

const tracking::PoseEstimator& GroundTracker::estimator() const
{
  return impl_->estimator;
}

const placement::PlacementResolver& GroundTracker::resolver() const
{
  return impl_->resolver;
}

void GroundTracker::reset()
{
  impl_->estimator.reset();
  impl_->estimator.resetStats();
}

bool GroundTracker::updateConfig(const ArgroundConfig& config)
{
  if (!impl_->estimator.updateConfig(config.estimator))
  {
    return false;
  }
  
  impl_->config = config;
  impl_->resolver.updateConfig(config.placement);
  return true;
}

const ArgroundConfig& GroundTracker::getConfig() const
{
  return impl_->config;
}

void GroundTracker::exportToJSON(const std::string& filename) const
{
  const auto stats = impl_->estimator.getStats();
  const auto pose = impl_->estimator.currentGroundPose();
  const auto& placement_cfg = impl_->config.placement;
  
  nlohmann::json j;
  
  j["initialized"] = impl_->initialized;
  j["has_ground"] = impl_->estimator.hasGround();
  j["last_source"] = toString(impl_->estimator.lastSource());
  j["ground_pose"] = {
    {"position", {pose.position.x(), pose.position.y(), pose.position.z()}},
    {"orientation", {pose.orientation.w(), pose.orientation.x(),
                     pose.orientation.y(), pose.orientation.z()}}
  };
  
  j["config"]["estimator"] = {
    {"max_fallback_distance", impl_->config.estimator.max_fallback_distance},
    {"viewport_center", {impl_->config.estimator.viewport_center.x(),
                         impl_->config.estimator.viewport_center.y()}},
    {"detection_filter", toString(impl_->config.estimator.detection_filter)}
  };
  j["config"]["placement"] = {
    {"fallback_forward_offset", placement_cfg.fallback_forward_offset},
    {"fallback_drop", placement_cfg.fallback_drop}
  };
  
  j["statistics"] = {
    {"frames_processed", stats.frames_processed},
    {"detection_frames", stats.detection_frames},
    {"fallback_frames", stats.fallback_frames},
    {"fallback_misses", stats.fallback_misses},
    {"clamped_fallbacks", stats.clamped_fallbacks},
    {"placements", impl_->resolver.placementCount()}
  };
  
  std::ofstream file(filename);
  if (!file.is_open())
  {
    spdlog::error("Failed to export GroundTracker to {}", filename);
    return;
  }
  file << j.dump(2);
  spdlog::info("GroundTracker exported to {}", filename);
}

}
