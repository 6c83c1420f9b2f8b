#ifndef XPBD_SIM_PHYSICS_COLLISION_CONSTRAINT_HPP
#define XPBD_SIM_PHYSICS_COLLISION_CONSTRAINT_HPP

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Vector3D.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"

namespace xpbd_sim
{

/**
 * @brief Non-penetration constraint for one contact point.
 *
 * Created fresh each substep from a Contact. The contact points are stored
 * in each body's local frame at creation time and are re-expressed in
 * world space on every solver iteration, so they follow the bodies as the
 * iterations move them.
 *
 * Position level (solve()):
 * - Penetration s = (p1 - p2) . n, with n pointing from body 2 toward
 *   body 1. When s < 0 the correction n * s is applied with zero
 *   compliance and accumulated into lambdaN.
 * - Static friction: the tangential relative motion of the contact points
 *   over the substep is removed while |lambdaT| stays within
 *   mu_s * |lambdaN|. Both multipliers are non-positive.
 *
 * Velocity level (solveVelocity()):
 * - Coulomb dynamic friction, clamped to mu_d * |lambdaN| / h.
 * - Restitution against the pre-solve normal velocity with e = e1 * e2.
 *   Approach speeds at or below restitutionThreshold are treated as
 *   resting contact (e = 0).
 *
 * Friction coefficients are the mean of the two materials.
 */
class CollisionConstraint
{
public:
  /**
   * @param r1Local Contact point on body 1 in its body frame
   * @param r2Local Contact point on body 2 in its body frame
   * @param normal Unit contact normal from body 2 toward body 1
   */
  CollisionConstraint(const Coordinate& r1Local,
                      const Coordinate& r2Local,
                      const Vector3D& normal);

  void solve(Body& b1, Body& b2, double h);

  /**
   * @param restitutionThreshold Approach speed [m/s] at or below which
   *        restitution is suppressed
   */
  void solveVelocity(Body& b1,
                     Body& b2,
                     double h,
                     double restitutionThreshold = 0.0) const;

  void resetLambdas()
  {
    lambdaN_ = 0.0;
    lambdaT_ = 0.0;
  }

  [[nodiscard]] double getLambdaN() const
  {
    return lambdaN_;
  }

  [[nodiscard]] double getLambdaT() const
  {
    return lambdaT_;
  }

  [[nodiscard]] const Vector3D& getNormal() const
  {
    return normal_;
  }

  [[nodiscard]] const Coordinate& getR1Local() const
  {
    return r1Local_;
  }

  [[nodiscard]] const Coordinate& getR2Local() const
  {
    return r2Local_;
  }

  CollisionConstraint(const CollisionConstraint&) = default;
  CollisionConstraint& operator=(const CollisionConstraint&) = default;
  CollisionConstraint(CollisionConstraint&&) noexcept = default;
  CollisionConstraint& operator=(CollisionConstraint&&) noexcept = default;
  ~CollisionConstraint() = default;

private:
  Coordinate r1Local_;
  Coordinate r2Local_;
  Vector3D normal_;
  double lambdaN_{0.0};
  double lambdaT_{0.0};
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_COLLISION_CONSTRAINT_HPP
