#ifndef XPBD_SIM_PHYSICS_SIMULATION_HPP
#define XPBD_SIM_PHYSICS_SIMULATION_HPP

#include <vector>

#include "xpbd-sim/src/Physics/Constraints/Constraint.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"
#include "xpbd-sim/src/Physics/SimulationConfig.hpp"

namespace xpbd_sim
{

/**
 * @brief Advance a set of bodies by one frame.
 *
 * Refreshes every collider, queues gravity (0, -g m, 0) on every non-fixed
 * body without waking it, runs the XPBD solver and finally clears every
 * body's force accumulator. A non-positive dt leaves the bodies untouched
 * apart from the cleared forces.
 *
 * @param bodies All bodies; external constraints address them by index
 * @param dt Frame length [s]
 * @param externalConstraints Joints and other persistent constraints.
 *        Their multipliers are reset each substep on a private copy.
 * @param config Solver settings
 * @throws std::invalid_argument if config is invalid
 */
void simulate(std::vector<Body>& bodies, double dt);

void simulate(std::vector<Body>& bodies,
              double dt,
              const std::vector<Constraint>& externalConstraints);

void simulate(std::vector<Body>& bodies,
              double dt,
              const std::vector<Constraint>& externalConstraints,
              const SimulationConfig& config);

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_SIMULATION_HPP
