#include <gtest/gtest.h>

#include <cmath>

#include <Eigen/Geometry>

#include "xpbd-sim/src/Physics/Collision/ContactManifold.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"
#include "xpbd-sim/src/Physics/RigidBody/ConvexHull.hpp"
#include "xpbd-sim/src/Utils/BodyFactory.hpp"

using namespace xpbd_sim;

namespace
{

Collider makeBoxAt(double half,
                   const Coordinate& position,
                   const Eigen::Quaterniond& rotation =
                     Eigen::Quaterniond::Identity())
{
  auto collider = Collider::convexHull(ConvexHull{
    BodyFactory::boxVertices(half, half, half), BodyFactory::boxIndices()});
  collider.update(position, rotation);
  return collider;
}

Collider makeSphereAt(double radius, const Coordinate& position)
{
  auto collider = Collider::sphere(radius);
  collider.update(position, Eigen::Quaterniond::Identity());
  return collider;
}

}  // anonymous namespace

// ============================================================================
// Face-face clipping
// ============================================================================

TEST(ContactManifoldTest, StackedBoxesGiveFourContacts)
{
  auto const a = makeBoxAt(0.5, Coordinate{0.0, 0.0, 0.0});
  auto const b = makeBoxAt(0.5, Coordinate{0.02, 0.9, 0.03});

  auto const contacts =
    contact_manifold::generate(a, b, Vector3D{0.0, 1.0, 0.0}, 0.1);

  ASSERT_EQ(contacts.size(), 4u);
  for (const auto& contact : contacts)
  {
    EXPECT_NEAR(contact.normal.y(), -1.0, 1e-12);
    EXPECT_NEAR(contact.depth(), 0.1, 1e-9);

    // Points lie on the overlap of the two footprints
    EXPECT_LE(contact.pointA.x(), 0.5 + 1e-9);
    EXPECT_GE(contact.pointA.x(), -0.48 - 1e-9);
    EXPECT_LE(contact.pointA.z(), 0.5 + 1e-9);
    EXPECT_GE(contact.pointA.z(), -0.47 - 1e-9);
  }
}

TEST(ContactManifoldTest, SmallBoxOnLargeBoxKeepsItsOwnCorners)
{
  auto const floor = makeBoxAt(2.0, Coordinate{0.0, -2.0, 0.0});
  auto const box = makeBoxAt(0.25, Coordinate{0.3, 0.2, -0.4});

  auto const contacts =
    contact_manifold::generate(box, floor, Vector3D{0.0, -1.0, 0.0}, 0.05);

  ASSERT_EQ(contacts.size(), 4u);
  for (const auto& contact : contacts)
  {
    // Box is A, floor is B: the normal points up from the floor
    EXPECT_NEAR(contact.normal.y(), 1.0, 1e-12);
    EXPECT_NEAR(contact.pointA.y(), -0.05, 1e-9);
    EXPECT_NEAR(contact.pointB.y(), 0.0, 1e-9);
    EXPECT_NEAR(std::abs(contact.pointA.x() - 0.3), 0.25, 1e-9);
  }
}

TEST(ContactManifoldTest, CrossedEdgesGiveSingleContact)
{
  // A is rotated 45 degrees about X, B 45 degrees about Z, so the lowest
  // edge of B (along Z) crosses the highest edge of A (along X)
  Eigen::Quaterniond const aboutX{
    Eigen::AngleAxisd{M_PI / 4.0, Eigen::Vector3d::UnitX()}};
  Eigen::Quaterniond const aboutZ{
    Eigen::AngleAxisd{M_PI / 4.0, Eigen::Vector3d::UnitZ()}};

  double const reach = std::sqrt(0.5);
  auto const a = makeBoxAt(0.5, Coordinate{0.0, 0.0, 0.0}, aboutX);
  auto const b =
    makeBoxAt(0.5, Coordinate{0.0, 2.0 * reach - 0.1, 0.0}, aboutZ);

  auto const contacts =
    contact_manifold::generate(a, b, Vector3D{0.0, 1.0, 0.0}, 0.1);

  ASSERT_EQ(contacts.size(), 1u);
  EXPECT_NEAR(contacts[0].depth(), 0.1, 1e-9);
  EXPECT_NEAR(contacts[0].pointA.y(), reach, 1e-9);
  EXPECT_NEAR(contacts[0].pointB.y(), reach - 0.1, 1e-9);
}

// ============================================================================
// Spheres
// ============================================================================

TEST(ContactManifoldTest, SphereOnBox)
{
  auto const box = makeBoxAt(0.5, Coordinate{0.0, 0.0, 0.0});
  auto const sphere = makeSphereAt(0.5, Coordinate{0.1, 0.9, 0.2});

  auto const contacts =
    contact_manifold::generate(sphere, box, Vector3D{0.0, -1.0, 0.0}, 0.1);

  ASSERT_EQ(contacts.size(), 1u);
  EXPECT_NEAR(contacts[0].pointA.y(), 0.4, 1e-12);
  EXPECT_NEAR(contacts[0].pointB.y(), 0.5, 1e-12);
  EXPECT_NEAR(contacts[0].normal.y(), 1.0, 1e-12);
  EXPECT_NEAR(contacts[0].depth(), 0.1, 1e-12);
}

TEST(ContactManifoldTest, BoxUnderSphere)
{
  auto const box = makeBoxAt(0.5, Coordinate{0.0, 0.0, 0.0});
  auto const sphere = makeSphereAt(0.5, Coordinate{0.1, 0.9, 0.2});

  auto const contacts =
    contact_manifold::generate(box, sphere, Vector3D{0.0, 1.0, 0.0}, 0.1);

  ASSERT_EQ(contacts.size(), 1u);
  EXPECT_NEAR(contacts[0].pointB.y(), 0.4, 1e-12);
  EXPECT_NEAR(contacts[0].pointA.y(), 0.5, 1e-12);
  EXPECT_NEAR(contacts[0].normal.y(), -1.0, 1e-12);
}
