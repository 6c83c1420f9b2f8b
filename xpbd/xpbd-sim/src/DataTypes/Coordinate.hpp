#ifndef XPBD_SIM_DATATYPES_COORDINATE_HPP
#define XPBD_SIM_DATATYPES_COORDINATE_HPP

#include "xpbd-sim/src/DataTypes/Vec3DBase.hpp"
#include "xpbd-sim/src/DataTypes/Vec3FormatterBase.hpp"

namespace xpbd_sim
{

/**
 * @brief A point in 3D space (world or body-local, depending on context).
 *
 * Use Vector3D for directions, velocities and forces.
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  Coordinate(const Coordinate&) = default;
  Coordinate(Coordinate&&) noexcept = default;
  Coordinate& operator=(const Coordinate&) = default;
  Coordinate& operator=(Coordinate&&) noexcept = default;
  ~Coordinate() = default;
};

}  // namespace xpbd_sim

template <>
struct fmt::formatter<xpbd_sim::Coordinate>
  : xpbd_sim::detail::Vec3FormatterBase<xpbd_sim::Coordinate>
{
};

#endif  // XPBD_SIM_DATATYPES_COORDINATE_HPP
