#include <gtest/gtest.h>

#include <cmath>
#include <variant>
#include <vector>

#include <Eigen/Geometry>

#include "xpbd-sim/src/Physics/Constraints/Constraint.hpp"
#include "xpbd-sim/src/Physics/Constraints/ConstraintCorrection.hpp"
#include "xpbd-sim/src/Physics/Constraints/PositionalConstraint.hpp"
#include "xpbd-sim/src/Utils/BodyFactory.hpp"

using namespace xpbd_sim;

namespace
{

Body sphereAt(const Coordinate& position, bool isStatic = false)
{
  auto body = BodyFactory::makeSphere(0.5, isStatic);
  body.setPosition(position);
  return body;
}

Coordinate const kOrigin{0.0, 0.0, 0.0};

}  // anonymous namespace

// ============================================================================
// PositionalConstraint
// ============================================================================

TEST(PositionalConstraintTest, RigidLinkReachesTargetDistance)
{
  auto b1 = sphereAt(Coordinate{3.0, 0.0, 0.0});
  auto b2 = sphereAt(kOrigin);
  PositionalConstraint constraint{
    kOrigin, kOrigin, 0.0, Vector3D{2.0, 0.0, 0.0}};

  constraint.solve(b1, b2, 0.1);

  // Equal masses share the correction
  EXPECT_NEAR(b1.getPosition().x(), 2.5, 1e-12);
  EXPECT_NEAR(b2.getPosition().x(), 0.5, 1e-12);
  EXPECT_NEAR(constraint.getLambda(), -0.5, 1e-12);
}

TEST(PositionalConstraintTest, ComplianceSoftensTheCorrection)
{
  auto b1 = sphereAt(Coordinate{3.0, 0.0, 0.0});
  auto b2 = sphereAt(kOrigin);
  PositionalConstraint constraint{
    kOrigin, kOrigin, 1.0, Vector3D{2.0, 0.0, 0.0}};

  constraint.solve(b1, b2, 0.1);

  double const offset = b1.getPosition().x() - b2.getPosition().x();
  EXPECT_NEAR(offset, 3.0 - 2.0 / 102.0, 1e-12);
}

TEST(PositionalConstraintTest, FixedBodyDoesNotMove)
{
  auto b1 = sphereAt(Coordinate{0.0, 3.0, 0.0});
  auto b2 = sphereAt(kOrigin, true);
  PositionalConstraint constraint{
    kOrigin, kOrigin, 0.0, Vector3D{0.0, 2.0, 0.0}};

  constraint.solve(b1, b2, 0.1);

  EXPECT_NEAR(b1.getPosition().y(), 2.0, 1e-12);
  EXPECT_TRUE(b2.getPosition().isApprox(kOrigin));
}

TEST(PositionalConstraintTest, OffsetAttachmentRotatesBody)
{
  auto b1 = sphereAt(Coordinate{0.0, -1.5, 0.0});
  auto b2 = sphereAt(kOrigin, true);
  PositionalConstraint constraint{Coordinate{0.5, 0.0, 0.0},
                                  kOrigin,
                                  0.0,
                                  Vector3D{0.0, -1.0, 0.0}};

  for (int i = 0; i < 50; ++i)
  {
    constraint.solve(b1, b2, 0.1);
  }

  Coordinate const attachment = b1.localToWorld(Coordinate{0.5, 0.0, 0.0});
  EXPECT_NEAR(attachment.x(), 0.0, 1e-4);
  EXPECT_NEAR(attachment.y(), -1.0, 1e-4);
  EXPECT_FALSE(b1.getRotation().isApprox(Eigen::Quaterniond::Identity()));
}

TEST(PositionalConstraintTest, SatisfiedConstraintIsNoOp)
{
  auto b1 = sphereAt(Coordinate{2.0, 0.0, 0.0});
  auto b2 = sphereAt(kOrigin);
  PositionalConstraint constraint{
    kOrigin, kOrigin, 0.0, Vector3D{2.0, 0.0, 0.0}};

  constraint.solve(b1, b2, 0.1);

  EXPECT_EQ(constraint.getLambda(), 0.0);
  EXPECT_TRUE(b1.getPosition().isApprox(Coordinate{2.0, 0.0, 0.0}));
}

TEST(PositionalConstraintTest, TwoFixedBodiesAreSkipped)
{
  auto b1 = sphereAt(Coordinate{3.0, 0.0, 0.0}, true);
  auto b2 = sphereAt(kOrigin, true);
  PositionalConstraint constraint{
    kOrigin, kOrigin, 0.0, Vector3D{2.0, 0.0, 0.0}};

  constraint.solve(b1, b2, 0.1);

  EXPECT_EQ(constraint.getLambda(), 0.0);
  EXPECT_TRUE(b1.getPosition().isApprox(Coordinate{3.0, 0.0, 0.0}));
}

// ============================================================================
// Constraint dispatch
// ============================================================================

TEST(ConstraintTest, SolvePositionsDispatchesByIndex)
{
  std::vector<Body> bodies;
  bodies.push_back(sphereAt(kOrigin, true));
  bodies.push_back(sphereAt(Coordinate{0.0, -3.0, 0.0}));

  auto constraint =
    Constraint::positional(0, 1, kOrigin, kOrigin, 0.0, Vector3D{0.0, 1.0, 0.0});
  constraint.solvePositions(bodies, 0.1);

  EXPECT_NEAR(bodies[1].getPosition().y(), -1.0, 1e-12);
  EXPECT_FALSE(constraint.isCollision());
}

TEST(ConstraintTest, InvalidIndicesAreSkipped)
{
  std::vector<Body> bodies;
  bodies.push_back(sphereAt(Coordinate{3.0, 0.0, 0.0}));

  auto outOfRange =
    Constraint::positional(0, 4, kOrigin, kOrigin, 0.0, Vector3D{1.0, 0.0, 0.0});
  auto selfLink =
    Constraint::positional(0, 0, kOrigin, kOrigin, 0.0, Vector3D{1.0, 0.0, 0.0});

  outOfRange.solvePositions(bodies, 0.1);
  selfLink.solvePositions(bodies, 0.1);

  EXPECT_TRUE(bodies[0].getPosition().isApprox(Coordinate{3.0, 0.0, 0.0}));
}

TEST(ConstraintTest, ResetLambdasClearsAccumulatedMultiplier)
{
  std::vector<Body> bodies;
  bodies.push_back(sphereAt(Coordinate{3.0, 0.0, 0.0}));
  bodies.push_back(sphereAt(kOrigin));

  auto constraint =
    Constraint::positional(0, 1, kOrigin, kOrigin, 0.0, Vector3D{2.0, 0.0, 0.0});
  constraint.solvePositions(bodies, 0.1);
  ASSERT_NE(std::get<PositionalConstraint>(constraint.getData()).getLambda(),
            0.0);

  constraint.resetLambdas();

  EXPECT_EQ(std::get<PositionalConstraint>(constraint.getData()).getLambda(),
            0.0);
}

// ============================================================================
// Correction primitives
// ============================================================================

TEST(ConstraintCorrectionTest, RotateByVectorSmallAngle)
{
  auto const q = constraint_correction::rotateByVector(
    Eigen::Quaterniond::Identity(), Vector3D{0.0, 0.0, 0.01});

  EXPECT_NEAR(q.norm(), 1.0, 1e-12);
  EXPECT_NEAR(2.0 * std::atan2(q.z(), q.w()), 0.01, 1e-6);
}

TEST(ConstraintCorrectionTest, ZeroErrorGivesZeroMultiplier)
{
  auto const b1 = sphereAt(kOrigin);
  auto const b2 = sphereAt(kOrigin);
  Vector3D const zero{0.0, 0.0, 0.0};

  EXPECT_EQ(constraint_correction::positionalDeltaLambda(
              b1, b2, zero, zero, zero, 0.0, 0.0, 0.1),
            0.0);
  EXPECT_EQ(
    constraint_correction::angularDeltaLambda(b1, b2, zero, 0.0, 0.0, 0.1),
    0.0);
}
