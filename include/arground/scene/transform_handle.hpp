#ifndef ARGROUND_SCENE_TRANSFORM_HANDLE_HPP_
#define ARGROUND_SCENE_TRANSFORM_HANDLE_HPP_

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace arground
{
namespace scene
{

class TransformHandle
{
public:
  virtual ~TransformHandle() = default;
  
  virtual void setPosition(const Eigen::Vector3f& position) = 0;
  virtual void setRotation(const Eigen::Quaternionf& rotation) = 0;
};

}
}

#endif
