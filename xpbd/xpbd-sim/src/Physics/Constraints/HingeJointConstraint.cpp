#include "xpbd-sim/src/Physics/Constraints/HingeJointConstraint.hpp"

#include <stdexcept>
#include <string>

#include "xpbd-sim/src/Physics/Constraints/ConstraintCorrection.hpp"

namespace xpbd_sim
{

HingeJointConstraint::HingeJointConstraint(const Coordinate& r1Local,
                                           const Coordinate& r2Local,
                                           double compliance,
                                           JointAxis alignedAxis1,
                                           JointAxis alignedAxis2,
                                           std::optional<Limit> limit)
  : r1Local_{r1Local},
    r2Local_{r2Local},
    compliance_{compliance},
    alignedAxis1_{alignedAxis1},
    alignedAxis2_{alignedAxis2},
    limit_{limit}
{
  if (limit_ && limit_->lower > limit_->upper)
  {
    throw std::invalid_argument(
      "Hinge lower limit must not exceed upper limit, got [" +
      std::to_string(limit_->lower) + ", " + std::to_string(limit_->upper) +
      "]");
  }
}

void HingeJointConstraint::solve(Body& b1, Body& b2, double h)
{
  // ===== Aligned axes =====

  Vector3D const a1 = joint_axis::worldAxis(b1.getRotation(), alignedAxis1_);
  Vector3D const a2 = joint_axis::worldAxis(b2.getRotation(), alignedAxis2_);
  Vector3D const alignError = a1.cross(a2);

  double deltaLambda = constraint_correction::angularDeltaLambda(
    b1, b2, alignError, compliance_, lambdaAligned_, h);
  constraint_correction::applyAngular(b1, b2, alignError, deltaLambda);
  lambdaAligned_ += deltaLambda;

  // ===== Attachment points =====

  Vector3D const r1World = b1.getRotation() * r1Local_;
  Vector3D const r2World = b2.getRotation() * r2Local_;
  Vector3D const deltaX =
    (b1.getPosition() + r1World) - (b2.getPosition() + r2World);

  deltaLambda = constraint_correction::positionalDeltaLambda(
    b1, b2, r1World, r2World, deltaX, 0.0, lambdaPosition_, h);
  constraint_correction::applyPositional(
    b1, b2, r1World, r2World, deltaX, deltaLambda);
  lambdaPosition_ += deltaLambda;

  // ===== Angle limit =====

  if (!limit_)
  {
    return;
  }

  Vector3D const n = joint_axis::worldAxis(b1.getRotation(), alignedAxis1_);
  Vector3D const n1 = joint_axis::worldAxis(b1.getRotation(), limit_->axis1);
  Vector3D const n2 = joint_axis::worldAxis(b2.getRotation(), limit_->axis2);

  auto const limitError =
    joint_axis::limitAngle(n, n1, n2, limit_->lower, limit_->upper);
  if (!limitError)
  {
    return;
  }

  deltaLambda = constraint_correction::angularDeltaLambda(
    b1, b2, *limitError, 0.0, lambdaLimit_, h);
  constraint_correction::applyAngular(b1, b2, *limitError, deltaLambda);
  lambdaLimit_ += deltaLambda;
}

}  // namespace xpbd_sim
