#ifndef XPBD_SIM_PHYSICS_HINGE_JOINT_CONSTRAINT_HPP
#define XPBD_SIM_PHYSICS_HINGE_JOINT_CONSTRAINT_HPP

#include <optional>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Physics/Constraints/JointAxis.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"

namespace xpbd_sim
{

/**
 * @brief Revolute joint between two bodies.
 *
 * Each solve runs, in order:
 * 1. Aligned-axes angular constraint: error a1 x a2 between the two
 *    aligned axes in world space, with the joint compliance.
 * 2. Attachment positional constraint: p1 - p2, rigid.
 * 3. Optional angle limit: the signed angle between the limit axes of the
 *    two bodies, measured about body 1's aligned axis, is clamped to
 *    [lowerLimit, upperLimit]. Rigid.
 */
class HingeJointConstraint
{
public:
  struct Limit
  {
    JointAxis axis1;
    JointAxis axis2;
    double lower;
    double upper;
  };

  /**
   * @throws std::invalid_argument if limit->lower > limit->upper
   */
  HingeJointConstraint(const Coordinate& r1Local,
                       const Coordinate& r2Local,
                       double compliance,
                       JointAxis alignedAxis1,
                       JointAxis alignedAxis2,
                       std::optional<Limit> limit = std::nullopt);

  void solve(Body& b1, Body& b2, double h);

  void resetLambdas()
  {
    lambdaAligned_ = 0.0;
    lambdaPosition_ = 0.0;
    lambdaLimit_ = 0.0;
  }

  [[nodiscard]] bool isLimited() const
  {
    return limit_.has_value();
  }

  [[nodiscard]] const std::optional<Limit>& getLimit() const
  {
    return limit_;
  }

  [[nodiscard]] double getLambdaAligned() const
  {
    return lambdaAligned_;
  }

  [[nodiscard]] double getLambdaPosition() const
  {
    return lambdaPosition_;
  }

  [[nodiscard]] double getLambdaLimit() const
  {
    return lambdaLimit_;
  }

  HingeJointConstraint(const HingeJointConstraint&) = default;
  HingeJointConstraint& operator=(const HingeJointConstraint&) = default;
  HingeJointConstraint(HingeJointConstraint&&) noexcept = default;
  HingeJointConstraint& operator=(HingeJointConstraint&&) noexcept = default;
  ~HingeJointConstraint() = default;

private:
  Coordinate r1Local_;
  Coordinate r2Local_;
  double compliance_;
  JointAxis alignedAxis1_;
  JointAxis alignedAxis2_;
  std::optional<Limit> limit_;

  double lambdaAligned_{0.0};
  double lambdaPosition_{0.0};
  double lambdaLimit_{0.0};
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_HINGE_JOINT_CONSTRAINT_HPP
