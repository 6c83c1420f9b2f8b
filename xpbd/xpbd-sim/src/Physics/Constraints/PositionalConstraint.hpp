#ifndef XPBD_SIM_PHYSICS_POSITIONAL_CONSTRAINT_HPP
#define XPBD_SIM_PHYSICS_POSITIONAL_CONSTRAINT_HPP

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Vector3D.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"

namespace xpbd_sim
{

/**
 * @brief Keeps two attachment points at a fixed world-space offset.
 *
 * With attachment points p_i = x_i + R_i r_i, the constraint drives
 *
 *   C = (p1 - p2) - distance
 *
 * to zero. A zero distance vector welds the two attachment points; a
 * positive compliance turns the constraint into a soft spring.
 */
class PositionalConstraint
{
public:
  /**
   * @param r1Local Attachment point on body 1 in its body frame
   * @param r2Local Attachment point on body 2 in its body frame
   * @param compliance Inverse stiffness [m/N], 0 for a rigid link
   * @param distance Target value of p1 - p2 in world axes
   */
  PositionalConstraint(const Coordinate& r1Local,
                       const Coordinate& r2Local,
                       double compliance,
                       const Vector3D& distance);

  void solve(Body& b1, Body& b2, double h);

  void resetLambdas()
  {
    lambda_ = 0.0;
  }

  [[nodiscard]] double getLambda() const
  {
    return lambda_;
  }

  [[nodiscard]] double getCompliance() const
  {
    return compliance_;
  }

  [[nodiscard]] const Vector3D& getDistance() const
  {
    return distance_;
  }

  PositionalConstraint(const PositionalConstraint&) = default;
  PositionalConstraint& operator=(const PositionalConstraint&) = default;
  PositionalConstraint(PositionalConstraint&&) noexcept = default;
  PositionalConstraint& operator=(PositionalConstraint&&) noexcept = default;
  ~PositionalConstraint() = default;

private:
  Coordinate r1Local_;
  Coordinate r2Local_;
  double compliance_;
  Vector3D distance_;
  double lambda_{0.0};
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_POSITIONAL_CONSTRAINT_HPP
