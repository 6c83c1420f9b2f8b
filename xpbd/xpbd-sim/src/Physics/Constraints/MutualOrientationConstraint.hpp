#ifndef XPBD_SIM_PHYSICS_MUTUAL_ORIENTATION_CONSTRAINT_HPP
#define XPBD_SIM_PHYSICS_MUTUAL_ORIENTATION_CONSTRAINT_HPP

#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"

namespace xpbd_sim
{

/**
 * @brief Drives the relative rotation of two bodies toward identity.
 *
 * Error vector: 2 vec(q2 q1^-1), with the quaternion sign chosen so that
 * w >= 0 and the shorter rotation is taken.
 */
class MutualOrientationConstraint
{
public:
  explicit MutualOrientationConstraint(double compliance);

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

  MutualOrientationConstraint(const MutualOrientationConstraint&) = default;
  MutualOrientationConstraint& operator=(const MutualOrientationConstraint&) =
    default;
  MutualOrientationConstraint(MutualOrientationConstraint&&) noexcept = default;
  MutualOrientationConstraint& operator=(
    MutualOrientationConstraint&&) noexcept = default;
  ~MutualOrientationConstraint() = default;

private:
  double compliance_;
  double lambda_{0.0};
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_MUTUAL_ORIENTATION_CONSTRAINT_HPP
