#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "xpbd-sim/src/Physics/Simulation.hpp"
#include "xpbd-sim/src/Utils/BodyFactory.hpp"

using namespace xpbd_sim;

namespace
{

constexpr double kFrame = 1.0 / 60.0;

SimulationConfig substepped()
{
  SimulationConfig config;
  config.numSubsteps = 10;
  return config;
}

void run(std::vector<Body>& bodies,
         int frames,
         const std::vector<Constraint>& constraints = {},
         const SimulationConfig& config = SimulationConfig{})
{
  for (int i = 0; i < frames; ++i)
  {
    simulate(bodies, kFrame, constraints, config);
  }
}

/// Fixed unit box at the origin and a ball of radius 0.5 just above it
std::vector<Body> ballOverBox()
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeBox(0.5, 0.5, 0.5, true));
  bodies.push_back(BodyFactory::makeSphere(0.5, false));
  bodies[1].setPosition(Coordinate{0.1, 1.05, 0.2});
  return bodies;
}

}  // anonymous namespace

TEST(SimulationTest, FreeFallWithDefaultSettings)
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeSphere(0.5, false));

  simulate(bodies, 0.1);

  EXPECT_NEAR(bodies[0].getLinearVelocity().y(), -1.0, 1e-12);
  EXPECT_NEAR(bodies[0].getPosition().y(), -0.1, 1e-12);
  EXPECT_TRUE(bodies[0].getForces().empty());
}

TEST(SimulationTest, NonPositiveStepOnlyClearsForces)
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeSphere(0.5, false));
  bodies[0].addForce(
    Coordinate{0.0, 0.0, 0.0}, Vector3D{5.0, 0.0, 0.0}, false);

  simulate(bodies, 0.0);

  EXPECT_TRUE(bodies[0].getPosition().isApprox(Coordinate{0.0, 0.0, 0.0}));
  EXPECT_TRUE(bodies[0].getForces().empty());
}

TEST(SimulationTest, UserForcesLastOneFrame)
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeSphere(0.5, false));
  bodies[0].addForce(
    Coordinate{0.0, 0.0, 0.0}, Vector3D{10.0, 0.0, 0.0}, false);

  SimulationConfig config;
  config.gravity = 0.0;
  simulate(bodies, 0.1, {}, config);
  simulate(bodies, 0.1, {}, config);

  EXPECT_NEAR(bodies[0].getLinearVelocity().x(), 1.0, 1e-12);
}

TEST(SimulationTest, InvalidConfigThrows)
{
  std::vector<Body> bodies;
  SimulationConfig config;
  config.numSubsteps = 0;

  EXPECT_THROW(simulate(bodies, kFrame, {}, config), std::invalid_argument);
}

TEST(SimulationTest, BallComesToRestOnBox)
{
  auto bodies = ballOverBox();

  run(bodies, 120);

  EXPECT_NEAR(bodies[1].getPosition().y(), 1.0, 0.05);
  EXPECT_LT(bodies[1].getLinearVelocity().norm(), 0.1);
  EXPECT_TRUE(bodies[0].getPosition().isApprox(Coordinate{0.0, 0.0, 0.0}));
}

TEST(SimulationTest, BallComesToRestOnStaticSphere)
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeSphere(2.0, true));
  bodies.push_back(BodyFactory::makeSphere(0.5, false));
  bodies[1].setPosition(Coordinate{0.0, 2.6, 0.0});

  run(bodies, 120);

  EXPECT_NEAR(bodies[1].getPosition().y(), 2.5, 0.05);
  EXPECT_NEAR(bodies[1].getPosition().x(), 0.0, 1e-6);
}

TEST(SimulationTest, BoxComesToRestOnBox)
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeBox(2.0, 0.5, 2.0, true));
  bodies.push_back(BodyFactory::makeBox(0.25, 0.25, 0.25, false));
  bodies[1].setPosition(Coordinate{0.1, 0.8, -0.2});

  run(bodies, 120, {}, substepped());

  EXPECT_NEAR(bodies[1].getPosition().y(), 0.75, 0.05);
  EXPECT_NEAR(bodies[1].getPosition().x(), 0.1, 0.05);
}

TEST(SimulationTest, PushedStaticGroundDoesNotDragItsContacts)
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeBox(5.0, 0.5, 5.0, true));
  bodies.push_back(BodyFactory::makeBox(0.25, 0.25, 0.25, false));
  bodies[1].setPosition(Coordinate{0.0, 0.75, 0.0});

  bodies[0].push(Vector3D{3.0, 0.0, 0.0});
  run(bodies, 60, {}, substepped());

  EXPECT_TRUE(bodies[0].getPosition().isApprox(Coordinate{0.0, 0.0, 0.0}));
  EXPECT_TRUE(bodies[0].getLinearVelocity().isZero());
  EXPECT_NEAR(bodies[1].getPosition().x(), 0.0, 0.05);
  EXPECT_LT(bodies[1].getLinearVelocity().norm(), 0.1);
}

TEST(SimulationTest, RestingBallFallsAsleepAndWakesOnPush)
{
  auto bodies = ballOverBox();

  run(bodies, 180);
  ASSERT_FALSE(bodies[1].isActive());

  Coordinate const restingPosition = bodies[1].getPosition();
  run(bodies, 10);
  EXPECT_TRUE(bodies[1].getPosition().isApprox(restingPosition));

  bodies[1].push(Vector3D{0.5, 0.0, 0.0});
  run(bodies, 1);
  EXPECT_TRUE(bodies[1].isActive());
  EXPECT_GT(bodies[1].getPosition().x(), restingPosition.x());
}

TEST(SimulationTest, TouchingBallsShareAnIsland)
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeBox(3.0, 0.5, 3.0, true));
  bodies.push_back(BodyFactory::makeSphere(0.5, false));
  bodies.push_back(BodyFactory::makeSphere(0.5, false));
  bodies[1].setPosition(Coordinate{-0.5, 1.0, 0.1});
  bodies[2].setPosition(Coordinate{0.55, 1.0, 0.1});

  run(bodies, 180);
  ASSERT_FALSE(bodies[1].isActive());
  ASSERT_FALSE(bodies[2].isActive());

  bodies[1].push(Vector3D{-0.5, 0.0, 0.0});
  run(bodies, 1);

  EXPECT_TRUE(bodies[1].isActive());
  EXPECT_TRUE(bodies[2].isActive());
}

TEST(SimulationTest, PendulumKeepsItsLength)
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeSphere(0.1, true));
  bodies.push_back(BodyFactory::makeSphere(0.1, false));
  bodies[1].setPosition(Coordinate{1.0, 0.0, 0.0});

  std::vector<Constraint> const constraints{
    Constraint::sphericalJoint(0,
                               1,
                               Coordinate{0.0, 0.0, 0.0},
                               Coordinate{-1.0, 0.0, 0.0},
                               JointAxis::PositiveY,
                               JointAxis::PositiveY,
                               JointAxis::PositiveX,
                               JointAxis::PositiveX,
                               0.0,
                               M_PI,
                               -M_PI,
                               M_PI)};

  SimulationConfig config = substepped();
  config.numPositionIterations = 10;
  run(bodies, 30, constraints, config);

  EXPECT_NEAR(bodies[1].getPosition().norm(), 1.0, 1e-3);
  EXPECT_LT(bodies[1].getPosition().y(), -0.2);
}

TEST(SimulationTest, RigidlyLinkedBodiesMoveTogether)
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeSphere(0.25, false));
  bodies.push_back(BodyFactory::makeSphere(0.25, false));
  bodies[1].setPosition(Coordinate{1.0, 0.0, 0.0});
  bodies[0].push(Vector3D{0.0, 0.0, 2.0});

  std::vector<Constraint> const constraints{
    Constraint::positional(0,
                           1,
                           Coordinate{0.0, 0.0, 0.0},
                           Coordinate{0.0, 0.0, 0.0},
                           0.0,
                           Vector3D{-1.0, 0.0, 0.0}),
    Constraint::mutualOrientation(0, 1, 0.0)};

  run(bodies, 30, constraints);

  Vector3D const offset = bodies[0].getPosition() - bodies[1].getPosition();
  EXPECT_NEAR(offset.x(), -1.0, 1e-6);
  EXPECT_NEAR(offset.z(), 0.0, 1e-6);
  EXPECT_GT(bodies[1].getPosition().z(), 0.0);
}
