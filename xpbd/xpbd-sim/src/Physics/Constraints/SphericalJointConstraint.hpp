#ifndef XPBD_SIM_PHYSICS_SPHERICAL_JOINT_CONSTRAINT_HPP
#define XPBD_SIM_PHYSICS_SPHERICAL_JOINT_CONSTRAINT_HPP

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Physics/Constraints/JointAxis.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"

namespace xpbd_sim
{

/**
 * @brief Ball-and-socket joint with swing and twist limits.
 *
 * All three parts are rigid (zero compliance):
 * - the attachment points p1 and p2 are pulled together;
 * - swing: the angle between the swing axes n1 and n2, measured about
 *   normalize(n1 x n2), is kept within [swingLower, swingUpper];
 * - twist: the twist axes are projected onto the plane orthogonal to
 *   normalize(a1 + a2), where a_i are the swing axes, and the angle between
 *   the projections is kept within [twistLower, twistUpper].
 *
 * Swing and twist are skipped while their reference axis is degenerate.
 */
class SphericalJointConstraint
{
public:
  struct Axes
  {
    JointAxis swing1;
    JointAxis swing2;
    JointAxis twist1;
    JointAxis twist2;
  };

  struct Limits
  {
    double swingLower;
    double swingUpper;
    double twistLower;
    double twistUpper;
  };

  /**
   * @throws std::invalid_argument if a lower limit exceeds its upper limit
   */
  SphericalJointConstraint(const Coordinate& r1Local,
                           const Coordinate& r2Local,
                           const Axes& axes,
                           const Limits& limits);

  void solve(Body& b1, Body& b2, double h);

  void resetLambdas()
  {
    lambdaPosition_ = 0.0;
    lambdaSwing_ = 0.0;
    lambdaTwist_ = 0.0;
  }

  [[nodiscard]] const Axes& getAxes() const
  {
    return axes_;
  }

  [[nodiscard]] const Limits& getLimits() const
  {
    return limits_;
  }

  [[nodiscard]] double getLambdaPosition() const
  {
    return lambdaPosition_;
  }

  [[nodiscard]] double getLambdaSwing() const
  {
    return lambdaSwing_;
  }

  [[nodiscard]] double getLambdaTwist() const
  {
    return lambdaTwist_;
  }

  SphericalJointConstraint(const SphericalJointConstraint&) = default;
  SphericalJointConstraint& operator=(const SphericalJointConstraint&) =
    default;
  SphericalJointConstraint(SphericalJointConstraint&&) noexcept = default;
  SphericalJointConstraint& operator=(SphericalJointConstraint&&) noexcept =
    default;
  ~SphericalJointConstraint() = default;

private:
  void solvePosition(Body& b1, Body& b2, double h);
  void solveSwing(Body& b1, Body& b2, double h);
  void solveTwist(Body& b1, Body& b2, double h);

  Coordinate r1Local_;
  Coordinate r2Local_;
  Axes axes_;
  Limits limits_;

  double lambdaPosition_{0.0};
  double lambdaSwing_{0.0};
  double lambdaTwist_{0.0};
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_SPHERICAL_JOINT_CONSTRAINT_HPP
