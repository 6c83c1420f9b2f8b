#ifndef XPBD_SIM_PHYSICS_BROAD_PHASE_HPP
#define XPBD_SIM_PHYSICS_BROAD_PHASE_HPP

#include <cstddef>
#include <vector>

#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"

namespace xpbd_sim
{

/**
 * @brief Unordered pair of body indices with first < second.
 */
struct BodyPair
{
  size_t first;
  size_t second;

  bool operator==(const BodyPair& other) const
  {
    return first == other.first && second == other.second;
  }
};

namespace broad_phase
{

/**
 * @brief Bounding-sphere pair test over all bodies.
 *
 * A pair (i, j), i < j, is emitted when the distance between the body
 * positions is at most r_i + r_j + slack, where r is the body's bounding
 * radius. Every unordered pair is visited exactly once, so the output holds
 * no duplicates and no self-pairs. Fixed-fixed pairs are still reported;
 * the solver skips them.
 *
 * O(n^2) in the number of bodies.
 *
 * @param bodies All bodies of the simulation
 * @param slack Extra margin absorbing one step of motion
 * @return Candidate pairs in lexicographic order
 */
std::vector<BodyPair> findCandidatePairs(const std::vector<Body>& bodies,
                                         double slack = 0.1);

}  // namespace broad_phase

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_BROAD_PHASE_HPP
