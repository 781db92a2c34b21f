#include "arground/geometry/rotations.hpp"
#include "arground/common.hpp"
#include <Eigen/Dense>
#include <cmath>

namespace arground
{
namespace geometry
{

Eigen::Quaternionf lookRotation(const Eigen::Vector3f& forward,
                                const Eigen::Vector3f& up)
{
  if (forward.squaredNorm() < GEOM_EPS * GEOM_EPS)
  {
    return Eigen::Quaternionf::Identity();
  }
  
  const Eigen::Vector3f f = forward.normalized();
  
  Eigen::Vector3f right = up.cross(f);
  if (right.squaredNorm() < GEOM_EPS)
  {
    const Eigen::Vector3f ref = std::abs(f.x()) < 0.9f ?
        Eigen::Vector3f::UnitX() : Eigen::Vector3f::UnitZ();
    right = ref - f * f.dot(ref);
  }
  right.normalize();
  
  const Eigen::Vector3f local_up = f.cross(right);
  
  Eigen::Matrix3f basis;
  basis.col(0) = right;
  basis.col(1) = local_up;
  basis.col(2) = f;
  
  Eigen::Quaternionf q(basis);
  q.normalize();
  return q;
}

Eigen::Vector3f horizontalBearing(const Eigen::Vector3f& forward)
{
  Eigen::Vector3f flat(forward.x(), 0.0f, forward.z());
  if (flat.squaredNorm() < GEOM_EPS * GEOM_EPS)
  {
    return Eigen::Vector3f::Zero();
  }
  return flat.normalized();
}

Eigen::Quaternionf bearingRotation(const Eigen::Vector3f& forward)
{
  return lookRotation(horizontalBearing(forward));
}

}
}
