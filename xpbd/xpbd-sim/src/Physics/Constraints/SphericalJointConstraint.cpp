#include "xpbd-sim/src/Physics/Constraints/SphericalJointConstraint.hpp"

#include <stdexcept>
#include <string>

#include "xpbd-sim/src/Physics/Constraints/ConstraintCorrection.hpp"

namespace xpbd_sim
{

SphericalJointConstraint::SphericalJointConstraint(const Coordinate& r1Local,
                                                   const Coordinate& r2Local,
                                                   const Axes& axes,
                                                   const Limits& limits)
  : r1Local_{r1Local}, r2Local_{r2Local}, axes_{axes}, limits_{limits}
{
  if (limits_.swingLower > limits_.swingUpper)
  {
    throw std::invalid_argument(
      "Spherical joint swing lower limit exceeds upper limit: " +
      std::to_string(limits_.swingLower) + " > " +
      std::to_string(limits_.swingUpper));
  }
  if (limits_.twistLower > limits_.twistUpper)
  {
    throw std::invalid_argument(
      "Spherical joint twist lower limit exceeds upper limit: " +
      std::to_string(limits_.twistLower) + " > " +
      std::to_string(limits_.twistUpper));
  }
}

void SphericalJointConstraint::solve(Body& b1, Body& b2, double h)
{
  solvePosition(b1, b2, h);
  solveSwing(b1, b2, h);
  solveTwist(b1, b2, h);
}

void SphericalJointConstraint::solvePosition(Body& b1, Body& b2, double h)
{
  Vector3D const r1World = b1.getRotation() * r1Local_;
  Vector3D const r2World = b2.getRotation() * r2Local_;
  Vector3D const deltaX =
    (b1.getPosition() + r1World) - (b2.getPosition() + r2World);

  double const deltaLambda = constraint_correction::positionalDeltaLambda(
    b1, b2, r1World, r2World, deltaX, 0.0, lambdaPosition_, h);
  constraint_correction::applyPositional(
    b1, b2, r1World, r2World, deltaX, deltaLambda);
  lambdaPosition_ += deltaLambda;
}

void SphericalJointConstraint::solveSwing(Body& b1, Body& b2, double h)
{
  Vector3D const n1 = joint_axis::worldAxis(b1.getRotation(), axes_.swing1);
  Vector3D const n2 = joint_axis::worldAxis(b2.getRotation(), axes_.swing2);

  Vector3D const swingAxis = n1.cross(n2);
  double const length = swingAxis.norm();
  if (length <= constraint_correction::kErrorEpsilon)
  {
    return;
  }

  auto const swingError = joint_axis::limitAngle(swingAxis / length,
                                                 n1,
                                                 n2,
                                                 limits_.swingLower,
                                                 limits_.swingUpper);
  if (!swingError)
  {
    return;
  }

  double const deltaLambda = constraint_correction::angularDeltaLambda(
    b1, b2, *swingError, 0.0, lambdaSwing_, h);
  constraint_correction::applyAngular(b1, b2, *swingError, deltaLambda);
  lambdaSwing_ += deltaLambda;
}

void SphericalJointConstraint::solveTwist(Body& b1, Body& b2, double h)
{
  Vector3D const a1 = joint_axis::worldAxis(b1.getRotation(), axes_.swing1);
  Vector3D const a2 = joint_axis::worldAxis(b2.getRotation(), axes_.swing2);
  Vector3D const z1 = joint_axis::worldAxis(b1.getRotation(), axes_.twist1);
  Vector3D const z2 = joint_axis::worldAxis(b2.getRotation(), axes_.twist2);

  Vector3D n = a1 + a2;
  double const length = n.norm();
  if (length <= constraint_correction::kErrorEpsilon)
  {
    return;
  }
  n /= length;

  // Project the twist axes onto the plane orthogonal to n
  Vector3D n1 = z1 - n * n.dot(z1);
  Vector3D n2 = z2 - n * n.dot(z2);
  double const n1Length = n1.norm();
  double const n2Length = n2.norm();
  if (n1Length <= constraint_correction::kErrorEpsilon ||
      n2Length <= constraint_correction::kErrorEpsilon)
  {
    return;
  }
  n1 /= n1Length;
  n2 /= n2Length;

  auto const twistError = joint_axis::limitAngle(
    n, n1, n2, limits_.twistLower, limits_.twistUpper);
  if (!twistError)
  {
    return;
  }

  double const deltaLambda = constraint_correction::angularDeltaLambda(
    b1, b2, *twistError, 0.0, lambdaTwist_, h);
  constraint_correction::applyAngular(b1, b2, *twistError, deltaLambda);
  lambdaTwist_ += deltaLambda;
}

}  // namespace xpbd_sim
