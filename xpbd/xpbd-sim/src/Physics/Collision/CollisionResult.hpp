#ifndef XPBD_SIM_PHYSICS_COLLISION_RESULT_HPP
#define XPBD_SIM_PHYSICS_COLLISION_RESULT_HPP

#include <utility>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Vector3D.hpp"

namespace xpbd_sim
{

/**
 * @brief One contact between two colliders, in world space.
 *
 * pointA lies on (or inside) A, pointB on (or inside) B. The normal is a
 * unit vector pointing from B toward A, so for a penetrating contact
 * (pointA - pointB).dot(normal) is minus the penetration depth.
 *
 * Contacts are rebuilt every substep and never cached across frames.
 */
struct Contact
{
  Coordinate pointA;
  Coordinate pointB;
  Vector3D normal;

  Contact() = default;

  Contact(Coordinate pA, Coordinate pB, Vector3D n)
    : pointA{std::move(pA)}, pointB{std::move(pB)}, normal{std::move(n)}
  {
  }

  /// Penetration along the normal (positive when overlapping)
  [[nodiscard]] double depth() const
  {
    return -(pointA - pointB).dot(normal);
  }
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_COLLISION_RESULT_HPP
