#include "xpbd-sim/src/Physics/Constraints/CollisionConstraint.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "xpbd-sim/src/Physics/Constraints/ConstraintCorrection.hpp"

namespace xpbd_sim
{

namespace
{

/// Velocity of the material point at world offset r
Vector3D pointVelocity(const Vector3D& linear,
                       const Vector3D& angular,
                       const Vector3D& r)
{
  return linear + angular.cross(r);
}

}  // anonymous namespace

CollisionConstraint::CollisionConstraint(const Coordinate& r1Local,
                                         const Coordinate& r2Local,
                                         const Vector3D& normal)
  : r1Local_{r1Local}, r2Local_{r2Local}, normal_{normal}
{
}

void CollisionConstraint::solve(Body& b1, Body& b2, double h)
{
  Vector3D r1World = b1.getRotation() * r1Local_;
  Vector3D r2World = b2.getRotation() * r2Local_;
  Coordinate p1 = b1.getPosition() + r1World;
  Coordinate p2 = b2.getPosition() + r2World;

  double const separation = (p1 - p2).dot(normal_);
  if (separation >= 0.0)
  {
    return;
  }

  // ===== Normal (non-penetration) =====

  Vector3D const deltaX = normal_ * separation;
  double const deltaLambdaN = constraint_correction::positionalDeltaLambda(
    b1, b2, r1World, r2World, deltaX, 0.0, lambdaN_, h);
  constraint_correction::applyPositional(
    b1, b2, r1World, r2World, deltaX, deltaLambdaN);
  lambdaN_ += deltaLambdaN;

  // ===== Static friction =====

  r1World = b1.getRotation() * r1Local_;
  r2World = b2.getRotation() * r2Local_;
  p1 = b1.getPosition() + r1World;
  p2 = b2.getPosition() + r2World;

  Coordinate const p1Previous =
    b1.getPreviousPosition() + b1.getPreviousRotation() * r1Local_;
  Coordinate const p2Previous =
    b2.getPreviousPosition() + b2.getPreviousRotation() * r2Local_;

  Vector3D const deltaP = (p1 - p1Previous) - (p2 - p2Previous);
  Vector3D const deltaPTangent = deltaP - normal_ * deltaP.dot(normal_);

  double const deltaLambdaT = constraint_correction::positionalDeltaLambda(
    b1, b2, r1World, r2World, deltaPTangent, 0.0, lambdaT_, h);

  double const staticFriction = 0.5 * (b1.getMaterial().staticFriction +
                                       b2.getMaterial().staticFriction);

  // Both multipliers are non-positive, so the Coulomb cone
  // |lambdaT| <= mu_s |lambdaN| reads lambdaT > mu_s * lambdaN
  if (lambdaT_ + deltaLambdaT > staticFriction * lambdaN_)
  {
    constraint_correction::applyPositional(
      b1, b2, r1World, r2World, deltaPTangent, deltaLambdaT);
    lambdaT_ += deltaLambdaT;
  }
}

void CollisionConstraint::solveVelocity(Body& b1,
                                        Body& b2,
                                        double h,
                                        double restitutionThreshold) const
{
  Vector3D const r1World = b1.getRotation() * r1Local_;
  Vector3D const r2World = b2.getRotation() * r2Local_;

  Vector3D const relativeVelocity =
    pointVelocity(b1.getLinearVelocity(), b1.getAngularVelocity(), r1World) -
    pointVelocity(b2.getLinearVelocity(), b2.getAngularVelocity(), r2World);
  double const normalVelocity = normal_.dot(relativeVelocity);
  Vector3D const tangentVelocity = relativeVelocity - normal_ * normalVelocity;

  Vector3D deltaV{0.0, 0.0, 0.0};

  // ===== Dynamic friction =====

  double const tangentSpeed = tangentVelocity.norm();
  if (tangentSpeed > 0.0)
  {
    double const dynamicFriction = 0.5 * (b1.getMaterial().dynamicFriction +
                                          b2.getMaterial().dynamicFriction);
    double const normalForce = lambdaN_ / h;
    double const reduction =
      std::min(dynamicFriction * std::abs(normalForce), tangentSpeed);
    deltaV -= tangentVelocity * (reduction / tangentSpeed);
  }

  // ===== Restitution =====

  Vector3D const previousRelativeVelocity =
    pointVelocity(b1.getPreviousLinearVelocity(),
                  b1.getPreviousAngularVelocity(),
                  r1World) -
    pointVelocity(b2.getPreviousLinearVelocity(),
                  b2.getPreviousAngularVelocity(),
                  r2World);
  double const previousNormalVelocity = normal_.dot(previousRelativeVelocity);
  double const restitution =
    std::abs(previousNormalVelocity) <= restitutionThreshold
      ? 0.0
      : b1.getMaterial().restitution * b2.getMaterial().restitution;

  deltaV += normal_ * (-normalVelocity +
                       std::max(-restitution * previousNormalVelocity, 0.0));

  // ===== Distribute =====

  Eigen::Matrix3d const inverseInertia1 = b1.getWorldInverseInertiaTensor();
  Eigen::Matrix3d const inverseInertia2 = b2.getWorldInverseInertiaTensor();
  Vector3D const r1CrossN = r1World.cross(normal_);
  Vector3D const r2CrossN = r2World.cross(normal_);
  double const w1 =
    b1.getInverseMass() + r1CrossN.dot(inverseInertia1 * r1CrossN);
  double const w2 =
    b2.getInverseMass() + r2CrossN.dot(inverseInertia2 * r2CrossN);

  if (w1 + w2 == 0.0)
  {
    spdlog::error("Velocity solve between two immovable bodies, skipped");
    return;
  }

  Vector3D const impulse = deltaV / (w1 + w2);

  if (!b1.isFixed())
  {
    b1.setLinearVelocity(b1.getLinearVelocity() +
                         impulse * b1.getInverseMass());
    b1.setAngularVelocity(b1.getAngularVelocity() +
                          inverseInertia1 * r1World.cross(impulse));
  }

  if (!b2.isFixed())
  {
    b2.setLinearVelocity(b2.getLinearVelocity() -
                         impulse * b2.getInverseMass());
    b2.setAngularVelocity(b2.getAngularVelocity() -
                          inverseInertia2 * r2World.cross(impulse));
  }
}

}  // namespace xpbd_sim
