#include <benchmark/benchmark.h>

#include <random>
#include <vector>

#include <Eigen/Geometry>

#include "xpbd-sim/src/Physics/Collision/CollisionHandler.hpp"
#include "xpbd-sim/src/Physics/Collision/EPA.hpp"
#include "xpbd-sim/src/Physics/Collision/GJK.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"
#include "xpbd-sim/src/Physics/RigidBody/ConvexHull.hpp"

using namespace xpbd_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Points on the unit sphere, fixed seed for reproducibility
std::vector<Coordinate> generateRandomPointCloud(size_t count)
{
  static std::mt19937 rng{42};
  std::normal_distribution<double> dist{0.0, 1.0};

  std::vector<Coordinate> points;
  points.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    Vector3D direction{dist(rng), dist(rng), dist(rng)};
    points.emplace_back(direction.safeNormalized());
  }
  return points;
}

Collider generateRandomHull(size_t pointCount, const Coordinate& position)
{
  auto collider =
    Collider::convexHull(ConvexHull::fromPointCloud(
      generateRandomPointCloud(pointCount)));
  collider.update(position, Eigen::Quaterniond::Identity());
  return collider;
}

}  // namespace

// ============================================================================
// GJK
// ============================================================================

/**
 * @brief GJK overlap test between two random hulls that overlap.
 */
static void BM_GJK_Overlapping(benchmark::State& state)
{
  auto const pointCount = static_cast<size_t>(state.range(0));
  auto const a = generateRandomHull(pointCount, Coordinate{0.0, 0.0, 0.0});
  auto const b = generateRandomHull(pointCount, Coordinate{1.5, 0.1, 0.05});

  for (auto _ : state)
  {
    GJK gjk{a, b};
    bool result = gjk.intersects();
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(static_cast<long long>(pointCount));
}
BENCHMARK(BM_GJK_Overlapping)
  ->Arg(16)
  ->Arg(64)
  ->Arg(256)
  ->Arg(1024)
  ->Complexity();

/**
 * @brief GJK early exit for separated hulls.
 */
static void BM_GJK_Separated(benchmark::State& state)
{
  auto const pointCount = static_cast<size_t>(state.range(0));
  auto const a = generateRandomHull(pointCount, Coordinate{0.0, 0.0, 0.0});
  auto const b = generateRandomHull(pointCount, Coordinate{3.0, 0.5, 0.0});

  for (auto _ : state)
  {
    GJK gjk{a, b};
    bool result = gjk.intersects();
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(static_cast<long long>(pointCount));
}
BENCHMARK(BM_GJK_Separated)->Arg(16)->Arg(256)->Complexity();

// ============================================================================
// EPA and full narrow phase
// ============================================================================

static void BM_EPA_Penetration(benchmark::State& state)
{
  auto const pointCount = static_cast<size_t>(state.range(0));
  auto const a = generateRandomHull(pointCount, Coordinate{0.0, 0.0, 0.0});
  auto const b = generateRandomHull(pointCount, Coordinate{1.5, 0.1, 0.05});

  GJK gjk{a, b};
  if (!gjk.intersects())
  {
    state.SkipWithError("Hulls do not overlap");
    return;
  }
  auto const simplex = gjk.getSimplex();

  for (auto _ : state)
  {
    EPA epa{a, b};
    auto result = epa.computePenetration(simplex);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_EPA_Penetration)->Arg(16)->Arg(64)->Arg(256);

static void BM_CollisionHandler_Contacts(benchmark::State& state)
{
  auto const pointCount = static_cast<size_t>(state.range(0));
  auto const a = generateRandomHull(pointCount, Coordinate{0.0, 0.0, 0.0});
  auto const b = generateRandomHull(pointCount, Coordinate{1.5, 0.1, 0.05});
  CollisionHandler const handler;

  for (auto _ : state)
  {
    auto contacts = handler.getContacts(a, b);
    benchmark::DoNotOptimize(contacts);
  }
}
BENCHMARK(BM_CollisionHandler_Contacts)->Arg(16)->Arg(64)->Arg(256);
