#ifndef ARGROUND_DETECTION_PLANE_DETECTOR_HPP_
#define ARGROUND_DETECTION_PLANE_DETECTOR_HPP_

#include "arground/detection/raycast_hit.hpp"
#include "arground/common.hpp"
#include <Eigen/Core>
#include <vector>

namespace arground
{
namespace detection
{

class PlaneDetector
{
public:
  virtual ~PlaneDetector() = default;
  
  virtual std::vector<RaycastHit> raycast(const Eigen::Vector2f& screen_point,
                                          TrackableType filter) const = 0;
};

}
}

#endif
