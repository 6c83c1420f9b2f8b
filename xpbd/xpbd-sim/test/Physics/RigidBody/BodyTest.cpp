#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include <Eigen/Geometry>

#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"
#include "xpbd-sim/src/Utils/BodyFactory.hpp"

using namespace xpbd_sim;

namespace
{

Body makeBody(double mass, const MaterialProperties& material, bool isStatic)
{
  return Body{Coordinate{0.0, 0.0, 0.0},
              Eigen::Quaterniond::Identity(),
              Vector3D{1.0, 1.0, 1.0},
              mass,
              std::vector<Collider>{Collider::sphere(0.5)},
              material,
              isStatic};
}

}  // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TEST(BodyTest, StaticBodyIsImmovable)
{
  auto const body = BodyFactory::makeBox(1.0, 1.0, 1.0, true);

  EXPECT_TRUE(body.isFixed());
  EXPECT_DOUBLE_EQ(body.getInverseMass(), 0.0);
  EXPECT_TRUE(body.getInverseInertiaTensor().isZero());
  EXPECT_TRUE(body.getWorldInverseInertiaTensor().isZero());
}

TEST(BodyTest, DynamicBodyInvertsMassProperties)
{
  auto const body = makeBody(4.0, MaterialProperties{}, false);

  EXPECT_DOUBLE_EQ(body.getInverseMass(), 0.25);
  Eigen::Matrix3d const product =
    body.getInertiaTensor() * body.getInverseInertiaTensor();
  EXPECT_TRUE(product.isIdentity(1e-12));
}

TEST(BodyTest, NonPositiveMassThrows)
{
  EXPECT_THROW(makeBody(0.0, MaterialProperties{}, false),
               std::invalid_argument);
  EXPECT_THROW(makeBody(-1.0, MaterialProperties{}, false),
               std::invalid_argument);
}

TEST(BodyTest, StaticBodyAcceptsZeroMass)
{
  EXPECT_NO_THROW(makeBody(0.0, MaterialProperties{}, true));
}

TEST(BodyTest, EmptyColliderListThrows)
{
  EXPECT_THROW((Body{Coordinate{},
                     Eigen::Quaterniond::Identity(),
                     Vector3D{1.0, 1.0, 1.0},
                     1.0,
                     std::vector<Collider>{},
                     MaterialProperties{},
                     false}),
               std::invalid_argument);
}

TEST(BodyTest, MaterialOutOfRangeThrows)
{
  MaterialProperties bouncy;
  bouncy.restitution = 1.5;
  EXPECT_THROW(makeBody(1.0, bouncy, false), std::invalid_argument);

  MaterialProperties sticky;
  sticky.staticFriction = -0.1;
  EXPECT_THROW(makeBody(1.0, sticky, false), std::invalid_argument);
}

TEST(BodyTest, DynamicFrictionAboveStaticIsAccepted)
{
  MaterialProperties slippery;
  slippery.staticFriction = 0.2;
  slippery.dynamicFriction = 0.8;
  EXPECT_NO_THROW(makeBody(1.0, slippery, false));
}

TEST(BodyTest, SetRotationNormalizes)
{
  auto body = makeBody(1.0, MaterialProperties{}, false);
  body.setRotation(Eigen::Quaterniond{2.0, 0.0, 0.0, 0.0});
  EXPECT_NEAR(body.getRotation().norm(), 1.0, 1e-12);
}

// ============================================================================
// Mutators
// ============================================================================

TEST(BodyTest, PushAndTurnWakeTheBody)
{
  auto body = makeBody(1.0, MaterialProperties{}, false);
  body.setActive(false);
  body.setDeactivationTime(3.0);

  body.push(Vector3D{1.0, 0.0, 0.0});
  EXPECT_TRUE(body.isActive());
  EXPECT_DOUBLE_EQ(body.getDeactivationTime(), 0.0);
  EXPECT_DOUBLE_EQ(body.getLinearVelocity().x(), 1.0);

  body.setActive(false);
  body.turn(Vector3D{0.0, 2.0, 0.0});
  EXPECT_TRUE(body.isActive());
  EXPECT_DOUBLE_EQ(body.getAngularVelocity().y(), 2.0);
}

TEST(BodyTest, StopAndRestZeroVelocities)
{
  auto body = makeBody(1.0, MaterialProperties{}, false);
  body.setLinearVelocity(Vector3D{1.0, 2.0, 3.0});
  body.setAngularVelocity(Vector3D{4.0, 5.0, 6.0});

  body.stop();
  EXPECT_TRUE(body.getLinearVelocity().isZero());
  EXPECT_FALSE(body.getAngularVelocity().isZero());

  body.rest();
  EXPECT_TRUE(body.getAngularVelocity().isZero());
}

TEST(BodyTest, FixedBodyIgnoresVelocityMutators)
{
  auto body = makeBody(1.0, MaterialProperties{}, true);

  body.push(Vector3D{3.0, 0.0, 0.0});
  body.turn(Vector3D{0.0, 1.0, 0.0});
  body.setLinearVelocity(Vector3D{1.0, 2.0, 3.0});
  body.setAngularVelocity(Vector3D{4.0, 5.0, 6.0});

  EXPECT_TRUE(body.getLinearVelocity().isZero());
  EXPECT_TRUE(body.getAngularVelocity().isZero());
}

TEST(BodyTest, LocalFrameForceIsRotatedIntoWorld)
{
  auto body = makeBody(1.0, MaterialProperties{}, false);
  body.setRotation(Eigen::Quaterniond{
    Eigen::AngleAxisd{M_PI / 2.0, Eigen::Vector3d::UnitZ()}});
  body.setActive(false);

  body.addForce(Coordinate{1.0, 0.0, 0.0}, Vector3D{0.0, 1.0, 0.0}, true);

  ASSERT_EQ(body.getForces().size(), 1u);
  const auto& entry = body.getForces().front();
  EXPECT_NEAR(entry.applicationPoint.y(), 1.0, 1e-12);
  EXPECT_NEAR(entry.force.x(), -1.0, 1e-12);
  EXPECT_TRUE(body.isActive());
}

TEST(BodyTest, WorldFrameForceIsStoredAsGiven)
{
  auto body = makeBody(1.0, MaterialProperties{}, false);
  body.setRotation(Eigen::Quaterniond{
    Eigen::AngleAxisd{M_PI / 2.0, Eigen::Vector3d::UnitZ()}});

  body.addForce(Coordinate{1.0, 0.0, 0.0}, Vector3D{0.0, 1.0, 0.0}, false);

  const auto& entry = body.getForces().front();
  EXPECT_DOUBLE_EQ(entry.applicationPoint.x(), 1.0);
  EXPECT_DOUBLE_EQ(entry.force.y(), 1.0);
}

TEST(BodyTest, GravityDoesNotWake)
{
  auto body = makeBody(2.0, MaterialProperties{}, false);
  body.setActive(false);

  body.applyGravity(10.0);

  EXPECT_FALSE(body.isActive());
  ASSERT_EQ(body.getForces().size(), 1u);
  EXPECT_DOUBLE_EQ(body.getForces().front().force.y(), -20.0);

  body.clearForces();
  EXPECT_TRUE(body.getForces().empty());
}

TEST(BodyTest, WorldInertiaFollowsRotation)
{
  auto body = BodyFactory::makeBox(1.0, 0.5, 0.25, false);
  body.setRotation(Eigen::Quaterniond{
    Eigen::AngleAxisd{M_PI / 2.0, Eigen::Vector3d::UnitZ()}});

  Eigen::Matrix3d const local = body.getInertiaTensor();
  Eigen::Matrix3d const world = body.getWorldInertiaTensor();

  // A quarter turn about Z swaps the X and Y principal moments
  EXPECT_NEAR(world(0, 0), local(1, 1), 1e-12);
  EXPECT_NEAR(world(1, 1), local(0, 0), 1e-12);
  EXPECT_NEAR(world(2, 2), local(2, 2), 1e-12);
}

TEST(BodyTest, LocalToWorld)
{
  auto body = makeBody(1.0, MaterialProperties{}, false);
  body.setPosition(Coordinate{1.0, 0.0, 0.0});
  body.setRotation(Eigen::Quaterniond{
    Eigen::AngleAxisd{M_PI / 2.0, Eigen::Vector3d::UnitZ()}});

  Coordinate const p = body.localToWorld(Coordinate{1.0, 0.0, 0.0});
  EXPECT_NEAR(p.x(), 1.0, 1e-12);
  EXPECT_NEAR(p.y(), 1.0, 1e-12);
}

TEST(BodyTest, BoundingRadiusOfSphere)
{
  auto const body = BodyFactory::makeSphere(0.75, false);
  EXPECT_DOUBLE_EQ(body.getBoundingRadius(), 0.75);
}
