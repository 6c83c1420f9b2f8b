#ifndef XPBD_SIM_PHYSICS_CONTACT_MANIFOLD_HPP
#define XPBD_SIM_PHYSICS_CONTACT_MANIFOLD_HPP

#include <vector>

#include "xpbd-sim/src/DataTypes/Vector3D.hpp"
#include "xpbd-sim/src/Physics/Collision/CollisionResult.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"

namespace xpbd_sim
{

/**
 * @brief Expands a single penetration axis into a set of contact points.
 *
 * Sphere cases produce one contact from the sphere's support point. Two
 * hulls are clipped:
 *
 * - The face of each hull that best matches the axis is found among the
 *   faces around its support vertex, and the best edge pair is found among
 *   the edges leaving the two support vertices.
 * - If the edge pair fits the axis clearly better than both faces, a single
 *   contact is built from the closest points of the two edge lines.
 * - Otherwise the better-fitting face is the reference face. The other
 *   hull's face (incident) is clipped against the planes of the reference
 *   face's neighbours (Sutherland-Hodgman), then points in front of the
 *   reference plane are dropped. Each surviving point yields one contact.
 *
 * All geometry is read from the colliders' world-space copy.
 */
namespace contact_manifold
{

/**
 * @brief Build the contact set for two overlapping colliders.
 *
 * @param colliderA First collider
 * @param colliderB Second collider
 * @param normalAtoB Unit penetration axis pointing from A toward B
 * @param depth Penetration depth along the axis
 * @return Contacts whose normal points from B toward A; empty if clipping
 *         leaves nothing
 */
std::vector<Contact> generate(const Collider& colliderA,
                              const Collider& colliderB,
                              const Vector3D& normalAtoB,
                              double depth);

}  // namespace contact_manifold

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_CONTACT_MANIFOLD_HPP
