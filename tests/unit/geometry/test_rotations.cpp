#include <gtest/gtest.h>
#include "arground/geometry/rotations.hpp"
#include <cmath>
#include <vector>

namespace arground
{
namespace geometry
{

namespace
{

void expectVectorNear(const Eigen::Vector3f& actual, const Eigen::Vector3f& expected, float tol = 1e-5f)
{
  EXPECT_NEAR(actual.x(), expected.x(), tol);
  EXPECT_NEAR(actual.y(), expected.y(), tol);
  EXPECT_NEAR(actual.z(), expected.z(), tol);
}

}

TEST(LookRotationTest, ForwardZIsIdentity)
{
  Eigen::Quaternionf q = lookRotation(Eigen::Vector3f::UnitZ());
  EXPECT_NEAR(q.angularDistance(Eigen::Quaternionf::Identity()), 0.0f, 1e-5f);
}

TEST(LookRotationTest, MapsLocalAxes)
{
  Eigen::Quaternionf q = lookRotation(Eigen::Vector3f::UnitX());
  expectVectorNear(q * Eigen::Vector3f::UnitZ(), Eigen::Vector3f::UnitX());
  expectVectorNear(q * Eigen::Vector3f::UnitY(), Eigen::Vector3f::UnitY());
  expectVectorNear(q * Eigen::Vector3f::UnitX(), -Eigen::Vector3f::UnitZ());
  
  Eigen::Vector3f pitched(0, -1, 1);
  Eigen::Quaternionf p = lookRotation(pitched);
  expectVectorNear(p * Eigen::Vector3f::UnitZ(), pitched.normalized());
  EXPECT_GT((p * Eigen::Vector3f::UnitY()).y(), 0.0f);
  EXPECT_NEAR((p * Eigen::Vector3f::UnitX()).y(), 0.0f, 1e-5f);
}

TEST(LookRotationTest, IgnoresForwardLength)
{
  Eigen::Quaternionf a = lookRotation(Eigen::Vector3f(3, -2, 1));
  Eigen::Quaternionf b = lookRotation(Eigen::Vector3f(3, -2, 1) * 0.01f);
  EXPECT_NEAR(a.angularDistance(b), 0.0f, 1e-5f);
  EXPECT_NEAR(a.norm(), 1.0f, 1e-5f);
}

TEST(LookRotationTest, ForwardAlongUpKeepsWorldXAsRight)
{
  Eigen::Quaternionf up = lookRotation(Eigen::Vector3f::UnitY());
  expectVectorNear(up * Eigen::Vector3f::UnitZ(), Eigen::Vector3f::UnitY());
  expectVectorNear(up * Eigen::Vector3f::UnitY(), -Eigen::Vector3f::UnitZ());
  expectVectorNear(up * Eigen::Vector3f::UnitX(), Eigen::Vector3f::UnitX());
  
  Eigen::Quaternionf down = lookRotation(-Eigen::Vector3f::UnitY());
  expectVectorNear(down * Eigen::Vector3f::UnitZ(), -Eigen::Vector3f::UnitY());
  expectVectorNear(down * Eigen::Vector3f::UnitY(), Eigen::Vector3f::UnitZ());
}

TEST(LookRotationTest, ZeroForwardIsIdentity)
{
  Eigen::Quaternionf q = lookRotation(Eigen::Vector3f::Zero());
  EXPECT_TRUE(q.coeffs().isApprox(Eigen::Quaternionf::Identity().coeffs()));
}

TEST(BearingTest, DropsVerticalComponent)
{
  expectVectorNear(horizontalBearing(Eigen::Vector3f(1, -5, 1)),
                   Eigen::Vector3f(1, 0, 1).normalized());
  expectVectorNear(horizontalBearing(Eigen::Vector3f(0, 0.3f, -2)),
                   -Eigen::Vector3f::UnitZ());
  EXPECT_TRUE(horizontalBearing(Eigen::Vector3f(0, -1, 0)).isZero());
}

TEST(BearingTest, RotationFacesBearingAndStaysUpright)
{
  const std::vector<Eigen::Vector3f> forwards = {
    Eigen::Vector3f(0, 0, 1),
    Eigen::Vector3f(1, -0.3f, 0),
    Eigen::Vector3f(-1, 0.8f, -1),
    Eigen::Vector3f(0.2f, -0.95f, 0.4f),
    Eigen::Vector3f(-3, -1, 2)
  };
  
  for (const auto& forward : forwards)
  {
    Eigen::Quaternionf q = bearingRotation(forward);
    Eigen::Vector3f expected = Eigen::Vector3f(forward.x(), 0, forward.z()).normalized();
    
    expectVectorNear(q * Eigen::Vector3f::UnitZ(), expected);
    expectVectorNear(q * Eigen::Vector3f::UnitY(), Eigen::Vector3f::UnitY());
  }
}

TEST(BearingTest, IndependentOfPitch)
{
  Eigen::Quaternionf low = bearingRotation(Eigen::Vector3f(1, -0.9f, 1));
  Eigen::Quaternionf high = bearingRotation(Eigen::Vector3f(1, 0.5f, 1));
  EXPECT_NEAR(low.angularDistance(high), 0.0f, 1e-5f);
}

}
}
