// Full simulate() loop over stacks and piles of bodies: gravity, broad
// phase, islands, narrow phase and the XPBD solve.

#include <benchmark/benchmark.h>

#include <random>
#include <utility>
#include <vector>

#include "xpbd-sim/src/Physics/Simulation.hpp"
#include "xpbd-sim/src/Utils/BodyFactory.hpp"

using namespace xpbd_sim;

// ============================================================================
// Helpers
// ============================================================================

namespace
{

constexpr int kFramesPerIteration = 20;   // Frames to step per iteration
constexpr double kFrame = 1.0 / 60.0;     // Frame length [s]
constexpr double kFloorHalfSize = 50.0;   // Floor half-extent [m]
constexpr unsigned int kRandomSeed = 42;  // Fixed seed for reproducibility

// Fixed floor with its top face at y = 0
Body makeFloor()
{
  auto floor = BodyFactory::makeBox(kFloorHalfSize, 0.5, kFloorHalfSize, true);
  floor.setPosition(Coordinate{0.0, -0.5, 0.0});
  return floor;
}

std::vector<Body> createSpherePile(size_t count)
{
  std::mt19937 rng{kRandomSeed};
  std::uniform_real_distribution<double> spread{-3.0, 3.0};

  std::vector<Body> bodies;
  bodies.push_back(makeFloor());
  for (size_t i = 0; i < count; ++i)
  {
    auto sphere = BodyFactory::makeSphere(0.5, false);
    sphere.setPosition(Coordinate{
      spread(rng), 0.6 + 1.1 * static_cast<double>(i), spread(rng)});
    bodies.push_back(std::move(sphere));
  }
  return bodies;
}

std::vector<Body> createBoxStack(size_t height)
{
  std::vector<Body> bodies;
  bodies.push_back(makeFloor());
  for (size_t i = 0; i < height; ++i)
  {
    auto box = BodyFactory::makeBox(0.5, 0.5, 0.5, false);
    box.setPosition(Coordinate{0.01 * static_cast<double>(i % 3),
                               0.5 + 1.0 * static_cast<double>(i),
                               0.02});
    bodies.push_back(std::move(box));
  }
  return bodies;
}

std::vector<Body> createChain(size_t links, std::vector<Constraint>& joints)
{
  std::vector<Body> bodies;
  bodies.push_back(BodyFactory::makeSphere(0.1, true));
  for (size_t i = 1; i <= links; ++i)
  {
    auto link = BodyFactory::makeSphere(0.1, false);
    link.setPosition(Coordinate{0.3 * static_cast<double>(i), 0.0, 0.0});
    bodies.push_back(std::move(link));

    joints.push_back(Constraint::sphericalJoint(i - 1,
                                                i,
                                                Coordinate{0.15, 0.0, 0.0},
                                                Coordinate{-0.15, 0.0, 0.0},
                                                JointAxis::PositiveY,
                                                JointAxis::PositiveY,
                                                JointAxis::PositiveX,
                                                JointAxis::PositiveX,
                                                0.0,
                                                1.0,
                                                -0.5,
                                                0.5));
  }
  return bodies;
}

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

static void BM_Simulate_SpherePile(benchmark::State& state)
{
  auto const count = static_cast<size_t>(state.range(0));
  SimulationConfig config;
  config.numSubsteps = 4;

  for (auto _ : state)
  {
    state.PauseTiming();
    auto bodies = createSpherePile(count);
    state.ResumeTiming();

    for (int f = 0; f < kFramesPerIteration; ++f)
    {
      simulate(bodies, kFrame, {}, config);
    }
    benchmark::DoNotOptimize(bodies.data());
  }
  state.SetComplexityN(static_cast<long long>(count));
}
BENCHMARK(BM_Simulate_SpherePile)
  ->Arg(4)
  ->Arg(16)
  ->Arg(64)
  ->Complexity();

static void BM_Simulate_BoxStack(benchmark::State& state)
{
  auto const height = static_cast<size_t>(state.range(0));
  SimulationConfig config;
  config.numSubsteps = 10;

  for (auto _ : state)
  {
    state.PauseTiming();
    auto bodies = createBoxStack(height);
    state.ResumeTiming();

    for (int f = 0; f < kFramesPerIteration; ++f)
    {
      simulate(bodies, kFrame, {}, config);
    }
    benchmark::DoNotOptimize(bodies.data());
  }
}
BENCHMARK(BM_Simulate_BoxStack)->Arg(2)->Arg(5)->Arg(10);

static void BM_Simulate_JointChain(benchmark::State& state)
{
  auto const links = static_cast<size_t>(state.range(0));
  SimulationConfig config;
  config.numSubsteps = 10;
  config.enableCollisions = false;

  for (auto _ : state)
  {
    state.PauseTiming();
    std::vector<Constraint> joints;
    auto bodies = createChain(links, joints);
    state.ResumeTiming();

    for (int f = 0; f < kFramesPerIteration; ++f)
    {
      simulate(bodies, kFrame, joints, config);
    }
    benchmark::DoNotOptimize(bodies.data());
  }
}
BENCHMARK(BM_Simulate_JointChain)->Arg(5)->Arg(20)->Arg(50);
