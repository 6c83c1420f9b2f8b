#ifndef XPBD_SIM_PHYSICS_COLLISION_HANDLER_HPP
#define XPBD_SIM_PHYSICS_COLLISION_HANDLER_HPP

#include <vector>

#include "xpbd-sim/src/Physics/Collision/CollisionResult.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"

namespace xpbd_sim
{

/**
 * @brief Narrow phase front end: colliders in, contacts out.
 *
 * - Two spheres are resolved in closed form without GJK or EPA.
 * - Otherwise GJK decides overlap, EPA finds the penetration axis and
 *   depth, and contact_manifold turns that axis into contact points.
 *
 * Any failure (no overlap, EPA non-convergence, degenerate polytope) yields
 * an empty contact list so the pair is simply skipped for this substep.
 */
class CollisionHandler
{
public:
  /**
   * @param epaTolerance EPA convergence tolerance
   * @param maxIterations Iteration cap for both GJK and EPA
   */
  explicit CollisionHandler(double epaTolerance = 1e-4,
                            int maxIterations = 100);

  [[nodiscard]] std::vector<Contact> getContacts(
    const Collider& colliderA,
    const Collider& colliderB) const;

  /**
   * @brief Contacts between every collider of A and every collider of B.
   */
  [[nodiscard]] std::vector<Contact> getContacts(const Body& bodyA,
                                                 const Body& bodyB) const;

  CollisionHandler(const CollisionHandler&) = default;
  CollisionHandler(CollisionHandler&&) noexcept = default;
  CollisionHandler& operator=(const CollisionHandler&) = default;
  CollisionHandler& operator=(CollisionHandler&&) noexcept = default;
  ~CollisionHandler() = default;

private:
  static std::vector<Contact> sphereSphere(const Collider& colliderA,
                                           const Collider& colliderB);

  double epaTolerance_;
  int maxIterations_;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_COLLISION_HANDLER_HPP
