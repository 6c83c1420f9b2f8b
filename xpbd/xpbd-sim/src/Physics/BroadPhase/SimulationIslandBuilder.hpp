#ifndef XPBD_SIM_PHYSICS_SIMULATION_ISLAND_BUILDER_HPP
#define XPBD_SIM_PHYSICS_SIMULATION_ISLAND_BUILDER_HPP

#include <cstddef>
#include <vector>

#include "xpbd-sim/src/Physics/BroadPhase/BroadPhase.hpp"
#include "xpbd-sim/src/Physics/Constraints/Constraint.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"

namespace xpbd_sim
{

/**
 * @brief Groups bodies into simulation islands for sleep decisions.
 *
 * Union-find over body indices. Two non-fixed bodies are joined when they
 * form a broad-phase pair or share an external constraint. Fixed bodies
 * never join anything and appear in no island, so a shared floor does not
 * couple the sleep state of the bodies resting on it.
 *
 * Every non-fixed body appears in exactly one island; isolated bodies form
 * singleton islands.
 *
 * Complexity: O(n + p) union-find operations for n bodies and p pairs.
 */
class SimulationIslandBuilder
{
public:
  struct Island
  {
    std::vector<size_t> bodyIndices;  ///< Sorted ascending
  };

  /**
   * @brief Partition the non-fixed bodies into islands.
   *
   * @param bodies All bodies
   * @param pairs Broad-phase candidate pairs
   * @param constraints External constraints; indices out of range are
   *        ignored
   * @return Islands ordered by their smallest body index
   */
  [[nodiscard]] static std::vector<Island> buildIslands(
    const std::vector<Body>& bodies,
    const std::vector<BodyPair>& pairs,
    const std::vector<Constraint>& constraints);

  SimulationIslandBuilder() = delete;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_SIMULATION_ISLAND_BUILDER_HPP
