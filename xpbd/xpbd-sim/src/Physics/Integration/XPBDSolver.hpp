#ifndef XPBD_SIM_PHYSICS_XPBD_SOLVER_HPP
#define XPBD_SIM_PHYSICS_XPBD_SOLVER_HPP

#include <memory>
#include <vector>

#include "xpbd-sim/src/Physics/BroadPhase/BroadPhase.hpp"
#include "xpbd-sim/src/Physics/BroadPhase/SimulationIslandBuilder.hpp"
#include "xpbd-sim/src/Physics/Collision/CollisionHandler.hpp"
#include "xpbd-sim/src/Physics/Constraints/Constraint.hpp"
#include "xpbd-sim/src/Physics/Integration/Integrator.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"
#include "xpbd-sim/src/Physics/SimulationConfig.hpp"

namespace xpbd_sim
{

/**
 * @brief Substepped XPBD solver.
 *
 * One step(dt) call:
 * 1. Broad phase over all bodies, islands from the candidate pairs and the
 *    external constraints, and the per-island sleep update with dt.
 * 2. numSubsteps substeps of h = dt / numSubsteps, each of which
 *    a. snapshots every body's pose and predicts the awake, non-fixed ones;
 *    b. copies the external constraints with zeroed multipliers and adds a
 *       collision constraint per contact of every broad-phase pair that
 *       has an awake body;
 *    c. runs numPositionIterations Gauss-Seidel passes over that list;
 *    d. rebuilds the velocities of awake bodies from their pose change;
 *    e. runs the velocity-level friction and restitution pass.
 *
 * The caller's external constraint list is never modified. Forces are read
 * but not cleared; clearing belongs to the caller (see simulate()).
 */
class XPBDSolver
{
public:
  /**
   * @throws std::invalid_argument if numSubsteps or numPositionIterations
   *         is zero
   */
  explicit XPBDSolver(const SimulationConfig& config = SimulationConfig{});

  /**
   * @param integrator Predictor used for step 2a (ownership transferred)
   * @throws std::invalid_argument for an invalid config or null integrator
   */
  XPBDSolver(const SimulationConfig& config,
             std::unique_ptr<Integrator> integrator);

  /**
   * @brief Advance every body by dt. A non-positive dt does nothing.
   */
  void step(std::vector<Body>& bodies,
            const std::vector<Constraint>& externalConstraints,
            double dt) const;

  /**
   * @brief Sleep bookkeeping for one frame.
   *
   * A body whose linear and angular speeds are both below the thresholds
   * accumulates dt of deactivation time, otherwise its timer resets. An
   * island goes to sleep only when every body in it has been below the
   * thresholds for at least the configured deactivation time; otherwise
   * the whole island is set active.
   */
  void updateSleep(std::vector<Body>& bodies,
                   const std::vector<SimulationIslandBuilder::Island>& islands,
                   double dt) const;

  [[nodiscard]] const SimulationConfig& getConfig() const
  {
    return config_;
  }

  XPBDSolver(const XPBDSolver&) = delete;
  XPBDSolver& operator=(const XPBDSolver&) = delete;
  XPBDSolver(XPBDSolver&&) noexcept = default;
  XPBDSolver& operator=(XPBDSolver&&) noexcept = default;
  ~XPBDSolver() = default;

private:
  void substep(std::vector<Body>& bodies,
               const std::vector<BodyPair>& pairs,
               const std::vector<Constraint>& externalConstraints,
               double h) const;

  void appendCollisionConstraints(std::vector<Body>& bodies,
                                  const std::vector<BodyPair>& pairs,
                                  std::vector<Constraint>& constraints) const;

  SimulationConfig config_;
  std::unique_ptr<Integrator> integrator_;
  CollisionHandler collisionHandler_;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_XPBD_SOLVER_HPP
