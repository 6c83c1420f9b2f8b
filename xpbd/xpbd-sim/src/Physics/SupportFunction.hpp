#ifndef XPBD_SIM_PHYSICS_SUPPORT_FUNCTION_HPP
#define XPBD_SIM_PHYSICS_SUPPORT_FUNCTION_HPP

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Vector3D.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"

namespace xpbd_sim
{

/**
 * @brief Support queries shared by GJK, EPA and the contact manifold.
 *
 * All queries read the world-space copy of the collider, so the owning body
 * must have refreshed its colliders for the current pose.
 */
namespace support_function
{

/**
 * @brief Point of the collider farthest along a world direction.
 *
 * For a sphere this is centre + radius * unit(direction); a zero direction
 * returns the centre. For a hull it is the transformed vertex with the
 * largest projection.
 */
Coordinate support(const Collider& collider, const Vector3D& direction);

/**
 * @brief Support of the Minkowski difference A - B.
 *
 * support(A, dir) - support(B, -dir)
 */
Coordinate supportMinkowski(const Collider& a,
                            const Collider& b,
                            const Vector3D& direction);

}  // namespace support_function

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_SUPPORT_FUNCTION_HPP
