#ifndef ARGROUND_CAMERA_CAMERA_STATE_HPP_
#define ARGROUND_CAMERA_CAMERA_STATE_HPP_

#include "arground/geometry/primitives.hpp"
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace arground
{
namespace camera
{

struct CameraIntrinsics
{
  int viewport_width = 1920;
  int viewport_height = 1080;
  float vertical_fov_deg = 60.0f;
  float near_clip = 0.1f;
  float far_clip = 100.0f;
};

// Looks along local +Z. Viewport (0,0) is bottom-left.
struct CameraState
{
  Eigen::Vector3f position = Eigen::Vector3f::Zero();
  Eigen::Quaternionf orientation = Eigen::Quaternionf::Identity();
  CameraIntrinsics intrinsics;
  
  static CameraState lookingAlong(const Eigen::Vector3f& position,
                                  const Eigen::Vector3f& forward,
                                  const CameraIntrinsics& intrinsics = CameraIntrinsics());
  
  Eigen::Vector3f forward() const
  {
    return orientation * Eigen::Vector3f::UnitZ();
  }
  
  Eigen::Vector3f up() const
  {
    return orientation * Eigen::Vector3f::UnitY();
  }
  
  Eigen::Vector3f right() const
  {
    return orientation * Eigen::Vector3f::UnitX();
  }
  
  float aspect() const
  {
    return static_cast<float>(intrinsics.viewport_width) /
           static_cast<float>(intrinsics.viewport_height);
  }
  
  bool isValid() const;
  
  Eigen::Vector2f viewportToScreenPoint(const Eigen::Vector2f& viewport) const;
  Eigen::Vector2f screenToViewportPoint(const Eigen::Vector2f& screen) const;
  
  // Ray starts at the camera position and passes through the viewport point
  // on the far clip plane.
  geometry::Ray viewportPointToRay(const Eigen::Vector2f& viewport) const;
  geometry::Ray screenPointToRay(const Eigen::Vector2f& screen) const;
};

}
}

#endif
