#ifndef XPBD_SIM_PHYSICS_JOINT_AXIS_HPP
#define XPBD_SIM_PHYSICS_JOINT_AXIS_HPP

#include <cstdint>
#include <optional>

#include <Eigen/Geometry>

#include "xpbd-sim/src/DataTypes/Vector3D.hpp"

namespace xpbd_sim
{

/**
 * @brief Body-frame unit axis used to anchor joint directions.
 */
enum class JointAxis : uint8_t
{
  PositiveX,
  NegativeX,
  PositiveY,
  NegativeY,
  PositiveZ,
  NegativeZ
};

namespace joint_axis
{

/// Unit vector of the axis in the body frame
[[nodiscard]] Vector3D localAxis(JointAxis axis);

/// The body-frame axis rotated into world axes
[[nodiscard]] Vector3D worldAxis(const Eigen::Quaterniond& rotation,
                                 JointAxis axis);

/**
 * @brief Angular limit correction between two axes about a rotation axis.
 *
 * Measures the signed angle phi from n1 to n2 about n, mapped into
 * (-pi, pi]. When phi lies inside [lower, upper] no correction is needed.
 * Otherwise n1 is rotated by the clamped angle about n and the axis-angle
 * error n1' x n2 is returned; it rotates body 1 back onto the limit.
 *
 * @param n Unit rotation axis
 * @param n1 Unit axis on body 1, orthogonal to n
 * @param n2 Unit axis on body 2, orthogonal to n
 * @param lower Lower limit [rad]
 * @param upper Upper limit [rad]
 * @return Correction vector, or std::nullopt when within limits
 */
[[nodiscard]] std::optional<Vector3D> limitAngle(const Vector3D& n,
                                                 const Vector3D& n1,
                                                 const Vector3D& n2,
                                                 double lower,
                                                 double upper);

}  // namespace joint_axis

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_JOINT_AXIS_HPP
