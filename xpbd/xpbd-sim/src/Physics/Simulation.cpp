#include "xpbd-sim/src/Physics/Simulation.hpp"

#include "xpbd-sim/src/Physics/Integration/XPBDSolver.hpp"

namespace xpbd_sim
{

void simulate(std::vector<Body>& bodies, double dt)
{
  simulate(bodies, dt, std::vector<Constraint>{}, SimulationConfig{});
}

void simulate(std::vector<Body>& bodies,
              double dt,
              const std::vector<Constraint>& externalConstraints)
{
  simulate(bodies, dt, externalConstraints, SimulationConfig{});
}

void simulate(std::vector<Body>& bodies,
              double dt,
              const std::vector<Constraint>& externalConstraints,
              const SimulationConfig& config)
{
  XPBDSolver const solver{config};

  for (auto& body : bodies)
  {
    body.updateColliders();
    if (!body.isFixed())
    {
      body.applyGravity(config.gravity);
    }
  }

  solver.step(bodies, externalConstraints, dt);

  for (auto& body : bodies)
  {
    body.clearForces();
  }
}

}  // namespace xpbd_sim
