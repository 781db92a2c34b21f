#ifndef ARGROUND_GEOMETRY_PRIMITIVES_HPP_
#define ARGROUND_GEOMETRY_PRIMITIVES_HPP_

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace arground
{
namespace geometry
{

struct Pose
{
  Eigen::Vector3f position = Eigen::Vector3f::Zero();
  Eigen::Quaternionf orientation = Eigen::Quaternionf::Identity();
  
  static Pose identity()
  {
    return Pose();
  }
  
  bool isIdentity() const
  {
    return *this == identity();
  }
  
  Eigen::Vector3f forward() const
  {
    return orientation * Eigen::Vector3f::UnitZ();
  }
  
  Eigen::Vector3f up() const
  {
    return orientation * Eigen::Vector3f::UnitY();
  }
  
  bool operator==(const Pose& other) const
  {
    return position == other.position &&
           orientation.coeffs() == other.orientation.coeffs();
  }
  
  bool operator!=(const Pose& other) const
  {
    return !(*this == other);
  }
};

struct Ray
{
  Eigen::Vector3f origin;
  Eigen::Vector3f direction;
  
  Eigen::Vector3f getPoint(float t) const
  {
    return origin + direction * t;
  }
};

// Points p on the plane satisfy normal.dot(p) + distance == 0.
struct Plane
{
  Eigen::Vector3f normal;
  float distance;
  
  static Plane fromNormalAndPoint(const Eigen::Vector3f& normal,
                                  const Eigen::Vector3f& point)
  {
    Plane plane;
    plane.normal = normal.normalized();
    plane.distance = -plane.normal.dot(point);
    return plane;
  }
  
  float signedDistance(const Eigen::Vector3f& point) const
  {
    return normal.dot(point) + distance;
  }
  
  Eigen::Vector3f closestPoint(const Eigen::Vector3f& point) const
  {
    return point - normal * signedDistance(point);
  }
};

}
}

#endif
