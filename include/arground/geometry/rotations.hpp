#ifndef ARGROUND_GEOMETRY_ROTATIONS_HPP_
#define ARGROUND_GEOMETRY_ROTATIONS_HPP_

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace arground
{
namespace geometry
{

// Zero forward yields identity.
Eigen::Quaternionf lookRotation(const Eigen::Vector3f& forward,
                                const Eigen::Vector3f& up = Eigen::Vector3f::UnitY());

// forward with its vertical component removed, normalized. Zero when forward
// is vertical.
Eigen::Vector3f horizontalBearing(const Eigen::Vector3f& forward);

Eigen::Quaternionf bearingRotation(const Eigen::Vector3f& forward);

}
}

#endif
