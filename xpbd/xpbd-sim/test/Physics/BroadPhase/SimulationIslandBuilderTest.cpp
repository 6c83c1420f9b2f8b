#include <gtest/gtest.h>

#include <vector>

#include "xpbd-sim/src/Physics/BroadPhase/SimulationIslandBuilder.hpp"
#include "xpbd-sim/src/Utils/BodyFactory.hpp"

using namespace xpbd_sim;

namespace
{

// Body 0 is a fixed floor, bodies 1..n are dynamic spheres
std::vector<Body> floorAndSpheres(size_t sphereCount)
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeBox(5.0, 0.5, 5.0, true));
  for (size_t i = 0; i < sphereCount; ++i)
  {
    bodies.push_back(BodyFactory::makeSphere(0.5, false));
  }
  return bodies;
}

Constraint tether(size_t a, size_t b)
{
  return Constraint::positional(a,
                                b,
                                Vector3D{0.0, 0.0, 0.0},
                                Vector3D{0.0, 0.0, 0.0},
                                0.0,
                                Vector3D{0.0, 1.0, 0.0});
}

}  // anonymous namespace

TEST(SimulationIslandBuilderTest, IsolatedBodiesFormSingletons)
{
  auto const bodies = floorAndSpheres(3);

  auto const islands = SimulationIslandBuilder::buildIslands(bodies, {}, {});

  ASSERT_EQ(islands.size(), 3u);
  EXPECT_EQ(islands[0].bodyIndices, (std::vector<size_t>{1}));
  EXPECT_EQ(islands[1].bodyIndices, (std::vector<size_t>{2}));
  EXPECT_EQ(islands[2].bodyIndices, (std::vector<size_t>{3}));
}

TEST(SimulationIslandBuilderTest, FixedBodyDoesNotJoinIslands)
{
  auto const bodies = floorAndSpheres(3);
  std::vector<BodyPair> const pairs{{0, 1}, {0, 2}, {0, 3}, {1, 2}};

  auto const islands =
    SimulationIslandBuilder::buildIslands(bodies, pairs, {});

  ASSERT_EQ(islands.size(), 2u);
  EXPECT_EQ(islands[0].bodyIndices, (std::vector<size_t>{1, 2}));
  EXPECT_EQ(islands[1].bodyIndices, (std::vector<size_t>{3}));
}

TEST(SimulationIslandBuilderTest, ConstraintsMergeIslands)
{
  auto const bodies = floorAndSpheres(3);
  std::vector<BodyPair> const pairs{{1, 2}};
  std::vector<Constraint> const constraints{tether(2, 3)};

  auto const islands =
    SimulationIslandBuilder::buildIslands(bodies, pairs, constraints);

  ASSERT_EQ(islands.size(), 1u);
  EXPECT_EQ(islands[0].bodyIndices, (std::vector<size_t>{1, 2, 3}));
}

TEST(SimulationIslandBuilderTest, OutOfRangeConstraintIsIgnored)
{
  auto const bodies = floorAndSpheres(2);
  std::vector<Constraint> const constraints{tether(1, 7)};

  auto const islands =
    SimulationIslandBuilder::buildIslands(bodies, {}, constraints);

  ASSERT_EQ(islands.size(), 2u);
}

TEST(SimulationIslandBuilderTest, TransitiveChainIsOneIsland)
{
  auto const bodies = floorAndSpheres(5);
  std::vector<BodyPair> const pairs{{1, 2}, {4, 5}, {2, 3}, {3, 4}};

  auto const islands =
    SimulationIslandBuilder::buildIslands(bodies, pairs, {});

  ASSERT_EQ(islands.size(), 1u);
  EXPECT_EQ(islands[0].bodyIndices, (std::vector<size_t>{1, 2, 3, 4, 5}));
}
