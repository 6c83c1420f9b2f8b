#include "xpbd-sim/src/Physics/Constraints/PositionalConstraint.hpp"

#include "xpbd-sim/src/Physics/Constraints/ConstraintCorrection.hpp"

namespace xpbd_sim
{

PositionalConstraint::PositionalConstraint(const Coordinate& r1Local,
                                           const Coordinate& r2Local,
                                           double compliance,
                                           const Vector3D& distance)
  : r1Local_{r1Local},
    r2Local_{r2Local},
    compliance_{compliance},
    distance_{distance}
{
}

void PositionalConstraint::solve(Body& b1, Body& b2, double h)
{
  Vector3D const r1World = b1.getRotation() * r1Local_;
  Vector3D const r2World = b2.getRotation() * r2Local_;

  Vector3D const attachmentOffset =
    (b1.getPosition() + r1World) - (b2.getPosition() + r2World);
  Vector3D const deltaX = attachmentOffset - distance_;

  double const deltaLambda = constraint_correction::positionalDeltaLambda(
    b1, b2, r1World, r2World, deltaX, compliance_, lambda_, h);
  constraint_correction::applyPositional(
    b1, b2, r1World, r2World, deltaX, deltaLambda);
  lambda_ += deltaLambda;
}

}  // namespace xpbd_sim
