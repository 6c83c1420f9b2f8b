#ifndef XPBD_SIM_PHYSICS_INTEGRATOR_HPP
#define XPBD_SIM_PHYSICS_INTEGRATOR_HPP

#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"

namespace xpbd_sim
{

/**
 * @brief Abstract interface for the unconstrained half of an XPBD substep.
 *
 * predict() advances a body with its external forces before the
 * constraints are projected; reconstructVelocities() derives the velocities
 * from the projected pose afterwards. Swapping the implementation changes
 * the integration scheme without touching the constraint solver.
 *
 * Implementations are stateless.
 */
class Integrator
{
public:
  virtual ~Integrator() = default;

  /**
   * @brief Advance velocity and pose by h under the body's queued forces.
   */
  virtual void predict(Body& body, double h) const = 0;

  /**
   * @brief Replace the velocities with the pose change since the previous
   * snapshot divided by h.
   */
  virtual void reconstructVelocities(Body& body, double h) const = 0;

protected:
  Integrator() = default;
  Integrator(const Integrator&) = default;
  Integrator& operator=(const Integrator&) = default;
  Integrator(Integrator&&) noexcept = default;
  Integrator& operator=(Integrator&&) noexcept = default;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_INTEGRATOR_HPP
