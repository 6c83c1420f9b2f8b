#ifndef XPBD_SIM_PHYSICS_SIMULATION_CONFIG_HPP
#define XPBD_SIM_PHYSICS_SIMULATION_CONFIG_HPP

#include <cstdint>

namespace xpbd_sim
{

/**
 * @brief Tunables of one simulate() call.
 *
 * Defaults reproduce a single-substep, single-iteration solver with
 * collisions on and gravity of 10 m/s^2 along -Y.
 */
struct SimulationConfig
{
  double gravity{10.0};                 ///< Downward acceleration [m/s^2]
  uint32_t numSubsteps{1};              ///< Substeps per call, >= 1
  uint32_t numPositionIterations{1};    ///< Gauss-Seidel passes, >= 1
  bool enableCollisions{true};
  double broadPhaseSlack{0.1};          ///< Bounding-sphere margin [m]
  double linearSleepThreshold{0.10};    ///< [m/s]
  double angularSleepThreshold{0.10};   ///< [rad/s]
  double deactivationTime{1.0};         ///< Time below thresholds before sleep [s]
  double epaTolerance{1e-4};
  int maxCollisionIterations{100};      ///< GJK and EPA iteration cap
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_SIMULATION_CONFIG_HPP
