#include "arground/camera/camera_state.hpp"
#include "arground/geometry/rotations.hpp"
#include <cmath>

namespace arground
{
namespace camera
{

namespace
{

constexpr float DEG_TO_RAD = static_cast<float>(M_PI) / 180.0f;

}

CameraState CameraState::lookingAlong(const Eigen::Vector3f& position,
                                      const Eigen::Vector3f& forward,
                                      const CameraIntrinsics& intrinsics)
{
  CameraState state;
  state.position = position;
  state.orientation = geometry::lookRotation(forward);
  state.intrinsics = intrinsics;
  return state;
}

bool CameraState::isValid() const
{
  if (intrinsics.viewport_width <= 0 || intrinsics.viewport_height <= 0)
  {
    return false;
  }
  
  if (intrinsics.vertical_fov_deg <= 0.0f || intrinsics.vertical_fov_deg >= 180.0f)
  {
    return false;
  }
  
  if (intrinsics.near_clip <= 0.0f || intrinsics.far_clip <= intrinsics.near_clip)
  {
    return false;
  }
  
  if (!position.allFinite() || !orientation.coeffs().allFinite())
  {
    return false;
  }
  
  return std::abs(orientation.norm() - 1.0f) < 1e-3f;
}

Eigen::Vector2f CameraState::viewportToScreenPoint(const Eigen::Vector2f& viewport) const
{
  return Eigen::Vector2f(viewport.x() * intrinsics.viewport_width,
                         viewport.y() * intrinsics.viewport_height);
}

Eigen::Vector2f CameraState::screenToViewportPoint(const Eigen::Vector2f& screen) const
{
  return Eigen::Vector2f(screen.x() / intrinsics.viewport_width,
                         screen.y() / intrinsics.viewport_height);
}

geometry::Ray CameraState::viewportPointToRay(const Eigen::Vector2f& viewport) const
{
  const float tan_half = std::tan(0.5f * intrinsics.vertical_fov_deg * DEG_TO_RAD);
  const float ndc_x = 2.0f * viewport.x() - 1.0f;
  const float ndc_y = 2.0f * viewport.y() - 1.0f;
  
  const Eigen::Vector3f far_point_local(ndc_x * tan_half * aspect() * intrinsics.far_clip,
                                        ndc_y * tan_half * intrinsics.far_clip,
                                        intrinsics.far_clip);
  
  geometry::Ray ray;
  ray.origin = position;
  ray.direction = (orientation * far_point_local).normalized();
  return ray;
}

geometry::Ray CameraState::screenPointToRay(const Eigen::Vector2f& screen) const
{
  return viewportPointToRay(screenToViewportPoint(screen));
}

}
}
