#ifndef XPBD_SIM_DATATYPES_VECTOR3D_HPP
#define XPBD_SIM_DATATYPES_VECTOR3D_HPP

#include "xpbd-sim/src/DataTypes/Vec3DBase.hpp"
#include "xpbd-sim/src/DataTypes/Vec3FormatterBase.hpp"

namespace xpbd_sim
{

/**
 * @brief Generic 3D vector type
 *
 * Thin wrapper around Eigen::Vector3d used for directions, normals,
 * velocities, forces and axis-angle corrections. Positions use Coordinate.
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Vector3D final : detail::Vec3DBase<Vector3D>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vector3D(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  Vector3D(const Vector3D&) = default;
  Vector3D(Vector3D&&) noexcept = default;
  Vector3D& operator=(const Vector3D&) = default;
  Vector3D& operator=(Vector3D&&) noexcept = default;
  ~Vector3D() = default;
};

}  // namespace xpbd_sim

template <>
struct fmt::formatter<xpbd_sim::Vector3D>
  : xpbd_sim::detail::Vec3FormatterBase<xpbd_sim::Vector3D>
{
};

#endif  // XPBD_SIM_DATATYPES_VECTOR3D_HPP
