#include "xpbd-sim/src/Physics/Constraints/MutualOrientationConstraint.hpp"

#include <Eigen/Geometry>

#include "xpbd-sim/src/Physics/Constraints/ConstraintCorrection.hpp"

namespace xpbd_sim
{

MutualOrientationConstraint::MutualOrientationConstraint(double compliance)
  : compliance_{compliance}
{
}

void MutualOrientationConstraint::solve(Body& b1, Body& b2, double h)
{
  Eigen::Quaterniond const relative =
    b2.getRotation() * b1.getRotation().conjugate();

  Vector3D deltaQ = 2.0 * relative.vec();
  if (relative.w() < 0.0)
  {
    deltaQ = -deltaQ;
  }

  double const deltaLambda = constraint_correction::angularDeltaLambda(
    b1, b2, deltaQ, compliance_, lambda_, h);
  constraint_correction::applyAngular(b1, b2, deltaQ, deltaLambda);
  lambda_ += deltaLambda;
}

}  // namespace xpbd_sim
