// Base CRTP template for 3D vector types

#ifndef XPBD_SIM_DATATYPES_VEC3D_BASE_HPP
#define XPBD_SIM_DATATYPES_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace xpbd_sim::detail
{

/**
 * @brief CRTP base class for 3D vector types
 *
 * Inherits from Eigen::Vector3d so every value type keeps the full Eigen
 * expression API (dot, cross, norm, arithmetic) while remaining a distinct
 * C++ type. Coordinate is a point, Vector3D a direction or rate; both
 * are built on this base. Derived types use this as:
 *
 *   struct MyVec3Type final : Vec3DBase<MyVec3Type> { ... };
 *
 * @tparam Derived The derived type (CRTP pattern)
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  static constexpr Eigen::Index X = 0;
  static constexpr Eigen::Index Y = 1;
  static constexpr Eigen::Index Z = 2;

  Vec3DBase() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::Vector3d& vec) : Eigen::Vector3d{vec}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Vec3DBase& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return *this;
  }

  /**
   * @brief Unit vector in the same direction, or zero when the length is
   * below tolerance.
   *
   * Eigen's normalized() leaves near-zero vectors unchanged; callers in the
   * collision code need an explicit zero instead. A zero result is the
   * degenerate signal those callers test for:
   * - EPA rejects a face whose cross product is zero (collinear points).
   * - ContactManifold skips parallel edge pairs.
   * - The sphere support point collapses to the centre for a zero direction.
   * - Concentric spheres fall back to a fixed separation axis.
   * - ConvexHull never merges a zero-area triangle into a coplanar face.
   */
  [[nodiscard]] Derived safeNormalized(double tolerance = 1e-12) const
  {
    double const length = this->norm();
    if (length <= tolerance)
    {
      return Derived{0.0, 0.0, 0.0};
    }
    return Derived{*this / length};
  }

  Vec3DBase(const Vec3DBase&) = default;
  Vec3DBase(Vec3DBase&&) noexcept = default;
  Vec3DBase& operator=(const Vec3DBase&) = default;
  Vec3DBase& operator=(Vec3DBase&&) noexcept = default;
  ~Vec3DBase() = default;
};

}  // namespace xpbd_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // XPBD_SIM_DATATYPES_VEC3D_BASE_HPP
