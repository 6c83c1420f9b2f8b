#include <gtest/gtest.h>

#include <vector>

#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"
#include "xpbd-sim/src/Physics/RigidBody/ConvexHull.hpp"
#include "xpbd-sim/src/Physics/RigidBody/InertialCalculations.hpp"
#include "xpbd-sim/src/Utils/BodyFactory.hpp"

using namespace xpbd_sim;

TEST(InertialCalculationsTest, SolidSphere)
{
  Eigen::Matrix3d const inertia =
    InertialCalculations::computeSphereInertia(2.0, 0.5);

  EXPECT_DOUBLE_EQ(inertia(0, 0), 0.2);
  EXPECT_DOUBLE_EQ(inertia(1, 1), 0.2);
  EXPECT_DOUBLE_EQ(inertia(2, 2), 0.2);
  EXPECT_DOUBLE_EQ(inertia(0, 1), 0.0);
}

TEST(InertialCalculationsTest, SingleSphereColliderUsesSolidSphere)
{
  std::vector<Collider> colliders{Collider::sphere(1.0)};
  Eigen::Matrix3d const inertia =
    InertialCalculations::computeInertiaTensor(colliders, 5.0);

  EXPECT_DOUBLE_EQ(inertia(0, 0), 2.0);
  EXPECT_DOUBLE_EQ(inertia(2, 2), 2.0);
}

TEST(InertialCalculationsTest, CubeVerticesAsPointMasses)
{
  std::vector<Collider> colliders{Collider::convexHull(
    ConvexHull{BodyFactory::boxVertices(0.5, 0.5, 0.5),
               BodyFactory::boxIndices()})};

  Eigen::Matrix3d const inertia =
    InertialCalculations::computePointMassInertia(colliders, 1.0);

  // Each of the 8 corners carries m/8 at distance^2 = 2 h^2 from every axis
  EXPECT_NEAR(inertia(0, 0), 0.5, 1e-12);
  EXPECT_NEAR(inertia(1, 1), 0.5, 1e-12);
  EXPECT_NEAR(inertia(2, 2), 0.5, 1e-12);
  EXPECT_NEAR(inertia(0, 1), 0.0, 1e-12);
  EXPECT_NEAR(inertia(1, 2), 0.0, 1e-12);
}
