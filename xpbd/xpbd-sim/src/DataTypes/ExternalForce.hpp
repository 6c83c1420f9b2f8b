#ifndef XPBD_SIM_DATATYPES_EXTERNAL_FORCE_HPP
#define XPBD_SIM_DATATYPES_EXTERNAL_FORCE_HPP

#include <vector>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Vector3D.hpp"

namespace xpbd_sim
{

/**
 * @brief A single external force contribution applied to a rigid body.
 *
 * Stored in world axes. The application point is the offset from the body's
 * centre of mass, so the torque about the centre of mass is
 * applicationPoint x force. Multiple entries are collected per step; use
 * totalForce()/totalTorque() for the net result.
 */
struct ExternalForce
{
  Coordinate applicationPoint{0.0, 0.0, 0.0};
  Vector3D force{0.0, 0.0, 0.0};

  /**
   * @brief Sum of all individual forces.
   */
  static Vector3D totalForce(const std::vector<ExternalForce>& forces)
  {
    Vector3D result{0.0, 0.0, 0.0};
    for (const auto& f : forces)
    {
      result += f.force;
    }
    return result;
  }

  /**
   * @brief Sum of the torques about the centre of mass.
   */
  static Vector3D totalTorque(const std::vector<ExternalForce>& forces)
  {
    Vector3D result{0.0, 0.0, 0.0};
    for (const auto& f : forces)
    {
      result += f.applicationPoint.cross(f.force);
    }
    return result;
  }
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_DATATYPES_EXTERNAL_FORCE_HPP
