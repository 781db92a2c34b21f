#ifndef ARGROUND_SCENE_SCENE_TRANSFORM_HPP_
#define ARGROUND_SCENE_SCENE_TRANSFORM_HPP_

#include "arground/scene/transform_handle.hpp"
#include "arground/geometry/primitives.hpp"
#include <cstddef>

namespace arground
{
namespace scene
{

// In-memory transform, counts writes so callers can tell which fields a
// frame touched.
class SceneTransform : public TransformHandle
{
public:
  void setPosition(const Eigen::Vector3f& position) override
  {
    pose_.position = position;
    ++position_writes_;
  }
  
  void setRotation(const Eigen::Quaternionf& rotation) override
  {
    pose_.orientation = rotation;
    ++rotation_writes_;
  }
  
  const Eigen::Vector3f& position() const
  {
    return pose_.position;
  }
  
  const Eigen::Quaternionf& rotation() const
  {
    return pose_.orientation;
  }
  
  const geometry::Pose& pose() const
  {
    return pose_;
  }
  
  size_t positionWrites() const
  {
    return position_writes_;
  }
  
  size_t rotationWrites() const
  {
    return rotation_writes_;
  }

private:
  geometry::Pose pose_;
  size_t position_writes_ = 0;
  size_t rotation_writes_ = 0;
};

}
}

#endif
