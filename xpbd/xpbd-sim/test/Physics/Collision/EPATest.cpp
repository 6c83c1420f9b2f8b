#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include <Eigen/Geometry>

#include "xpbd-sim/src/Physics/Collision/EPA.hpp"
#include "xpbd-sim/src/Physics/Collision/GJK.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"
#include "xpbd-sim/src/Physics/RigidBody/ConvexHull.hpp"
#include "xpbd-sim/src/Utils/BodyFactory.hpp"

using namespace xpbd_sim;

namespace
{

Collider makeBoxAt(double half, const Coordinate& position)
{
  auto collider = Collider::convexHull(ConvexHull{
    BodyFactory::boxVertices(half, half, half), BodyFactory::boxIndices()});
  collider.update(position, Eigen::Quaterniond::Identity());
  return collider;
}

std::optional<PenetrationResult> penetration(const Collider& a,
                                             const Collider& b)
{
  GJK gjk{a, b};
  if (!gjk.intersects())
  {
    return std::nullopt;
  }
  EPA epa{a, b};
  return epa.computePenetration(gjk.getSimplex());
}

}  // anonymous namespace

TEST(EPATest, BoxesOverlappingAlongX)
{
  auto const a = makeBoxAt(0.5, Coordinate{0.0, 0.0, 0.0});
  auto const b = makeBoxAt(0.5, Coordinate{0.8, 0.05, 0.03});

  auto const result = penetration(a, b);
  ASSERT_TRUE(result.has_value());

  EXPECT_NEAR(result->depth, 0.2, 1e-3);
  EXPECT_NEAR(std::abs(result->normal.x()), 1.0, 1e-3);
  // Normal points from A toward B
  EXPECT_GT(result->normal.x(), 0.0);
}

TEST(EPATest, BoxesOverlappingAlongY)
{
  auto const a = makeBoxAt(0.5, Coordinate{0.0, 0.0, 0.0});
  auto const b = makeBoxAt(0.5, Coordinate{0.03, -0.7, 0.02});

  auto const result = penetration(a, b);
  ASSERT_TRUE(result.has_value());

  EXPECT_NEAR(result->depth, 0.3, 1e-3);
  EXPECT_NEAR(result->normal.y(), -1.0, 1e-3);
}

TEST(EPATest, DepthIsNonNegativeAndNormalIsUnit)
{
  auto const a = makeBoxAt(1.0, Coordinate{0.0, 0.0, 0.0});
  auto const b = makeBoxAt(0.5, Coordinate{0.9, 0.8, 0.7});

  auto const result = penetration(a, b);
  ASSERT_TRUE(result.has_value());

  EXPECT_GE(result->depth, 0.0);
  EXPECT_NEAR(result->normal.norm(), 1.0, 1e-9);
}

TEST(EPATest, SimplexMustBeTetrahedron)
{
  auto const a = makeBoxAt(0.5, Coordinate{0.0, 0.0, 0.0});
  auto const b = makeBoxAt(0.5, Coordinate{0.8, 0.0, 0.0});

  EPA epa{a, b};
  std::vector<Coordinate> const triangle{Coordinate{1.0, 0.0, 0.0},
                                         Coordinate{0.0, 1.0, 0.0},
                                         Coordinate{0.0, 0.0, 1.0}};
  EXPECT_THROW((void)epa.computePenetration(triangle), std::invalid_argument);
}

// ============================================================================
// Failure paths
// ============================================================================

TEST(EPATest, CoplanarSimplexGivesNoResult)
{
  auto const a = makeBoxAt(0.5, Coordinate{0.0, 0.0, 0.0});
  auto const b = makeBoxAt(0.5, Coordinate{0.8, 0.0, 0.0});

  // Flat simplex through the origin: no face can be oriented
  EPA epa{a, b};
  std::vector<Coordinate> const flat{Coordinate{1.0, 0.0, 0.0},
                                     Coordinate{0.0, 1.0, 0.0},
                                     Coordinate{-1.0, -1.0, 0.0},
                                     Coordinate{0.5, 0.5, 0.0}};
  EXPECT_FALSE(epa.computePenetration(flat).has_value());
}

TEST(EPATest, ExhaustedIterationBudgetGivesNoResult)
{
  auto const a = makeBoxAt(0.5, Coordinate{0.0, 0.0, 0.0});
  auto const b = makeBoxAt(0.5, Coordinate{0.8, 0.05, 0.03});

  GJK gjk{a, b};
  ASSERT_TRUE(gjk.intersects());

  EPA epa{a, b};
  EXPECT_FALSE(epa.computePenetration(gjk.getSimplex(), 0).has_value());
}

TEST(EPATest, ZeroToleranceNeverConverges)
{
  auto const a = makeBoxAt(0.5, Coordinate{0.0, 0.0, 0.0});
  auto const b = makeBoxAt(0.5, Coordinate{0.8, 0.05, 0.03});

  GJK gjk{a, b};
  ASSERT_TRUE(gjk.intersects());

  EPA epa{a, b, 0.0};
  EXPECT_FALSE(epa.computePenetration(gjk.getSimplex(), 20).has_value());
}
