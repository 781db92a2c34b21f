#include "arground/ground_tracker.hpp"
#include "arground/detection/tracked_plane_raycaster.hpp"
#include "arground/scene/scene_transform.hpp"
#include "arground/config.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <string>

namespace
{

constexpr arground::TrackableId FLOOR_ID = 1;
constexpr int FRAME_COUNT = 90;

arground::detection::TrackedPlane makeFloor()
{
  arground::detection::TrackedPlane floor;
  floor.id = FLOOR_ID;
  floor.center_pose.position = Eigen::Vector3f(0.0f, 0.0f, 3.0f);
  floor.boundary = {
    Eigen::Vector2f(-2.0f, -2.0f),
    Eigen::Vector2f(2.0f, -2.0f),
    Eigen::Vector2f(2.0f, 2.0f),
    Eigen::Vector2f(-2.0f, 2.0f)
  };
  return floor;
}

// Pans from right to left while slowly raising the view toward the horizon.
arground::camera::CameraState cameraAt(int frame)
{
  const float s = static_cast<float>(frame) / (FRAME_COUNT - 1);
  const float yaw = (0.5f - s) * 1.2f;
  const float pitch = -0.6f + 0.6f * s;
  
  const Eigen::Vector3f forward(std::sin(yaw) * std::cos(pitch),
                                std::sin(pitch),
                                std::cos(yaw) * std::cos(pitch));
  return arground::camera::CameraState::lookingAlong(Eigen::Vector3f(0.0f, 1.5f, 0.0f), forward);
}

}

int main(int argc, char** argv)
{
  spdlog::set_level(spdlog::level::debug);
  
  arground::ArgroundConfig config;
  if (argc > 1 && !arground::loadConfigFromJSON(argv[1], config))
  {
    return 1;
  }
  
  arground::scene::SceneTransform indicator;
  arground::scene::SceneTransform target;
  arground::GroundTracker tracker(config, indicator, target);
  
  arground::detection::TrackedPlaneRaycaster raycaster;
  raycaster.addOrUpdatePlane(makeFloor());
  
  if (!tracker.initialize(cameraAt(0)))
  {
    return 1;
  }
  
  for (int frame = 0; frame < FRAME_COUNT; ++frame)
  {
    if (frame == FRAME_COUNT / 3)
    {
      spdlog::info("Frame {}: floor tracking lost", frame);
      raycaster.removePlane(FLOOR_ID);
    }
    
    const auto camera = cameraAt(frame);
    raycaster.setCamera(camera);
    
    const auto source = tracker.onFrame(camera, raycaster);
    const auto& p = indicator.position();
    spdlog::info("Frame {:3d}: {:9s} indicator [{:.2f}, {:.2f}, {:.2f}]",
                 frame, arground::toString(source), p.x(), p.y(), p.z());
    
    if (frame == FRAME_COUNT / 6 || frame == FRAME_COUNT - 1)
    {
      tracker.placeObject();
    }
  }
  
  const auto& t = target.position();
  spdlog::info("Target at [{:.2f}, {:.2f}, {:.2f}]", t.x(), t.y(), t.z());
  
  if (argc > 2)
  {
    tracker.exportToJSON(argv[2]);
  }
  
  return 0;
}
