#ifndef ARGROUND_GEOMETRY_INTERSECTIONS_HPP_
#define ARGROUND_GEOMETRY_INTERSECTIONS_HPP_

#include "arground/geometry/primitives.hpp"
#include "arground/common.hpp"
#include <cmath>
#include <vector>

namespace arground
{
namespace geometry
{

// Returns false when the ray is parallel to the plane or the plane lies
// behind the ray origin. t_out is still written in the second case.
inline bool intersectRayPlane(const Ray& ray, const Plane& plane, float& t_out)
{
  const float denom = ray.direction.dot(plane.normal);
  const float num = -ray.origin.dot(plane.normal) - plane.distance;
  
  if (std::abs(denom) < GEOM_EPS)
  {
    t_out = 0.0f;
    return false;
  }
  
  t_out = num / denom;
  return t_out > 0.0f;
}

inline bool pointInPolygon2D(const Eigen::Vector2f& point,
                             const std::vector<Eigen::Vector2f>& polygon)
{
  if (polygon.size() < 3)
  {
    return false;
  }
  
  bool inside = false;
  for (size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++)
  {
    const Eigen::Vector2f& a = polygon[i];
    const Eigen::Vector2f& b = polygon[j];
    
    if ((a.y() > point.y()) != (b.y() > point.y()))
    {
      float x_cross = (b.x() - a.x()) * (point.y() - a.y()) / (b.y() - a.y()) + a.x();
      if (point.x() < x_cross)
      {
        inside = !inside;
      }
    }
  }
  
  return inside;
}

inline bool pointInBounds2D(const Eigen::Vector2f& point,
                            const std::vector<Eigen::Vector2f>& polygon)
{
  if (polygon.empty())
  {
    return false;
  }
  
  Eigen::Vector2f min_pt = polygon[0];
  Eigen::Vector2f max_pt = polygon[0];
  for (const auto& p : polygon)
  {
    min_pt = min_pt.cwiseMin(p);
    max_pt = max_pt.cwiseMax(p);
  }
  
  return (point.array() >= min_pt.array()).all() &&
         (point.array() <= max_pt.array()).all();
}

}
}

#endif
