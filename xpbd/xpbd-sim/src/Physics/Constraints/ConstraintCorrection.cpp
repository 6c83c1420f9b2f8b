#include "xpbd-sim/src/Physics/Constraints/ConstraintCorrection.hpp"

#include <spdlog/spdlog.h>

namespace xpbd_sim::constraint_correction
{

namespace
{

double positionalInverseMass(const Body& body,
                             const Vector3D& rWorld,
                             const Vector3D& n)
{
  Vector3D const rCrossN = rWorld.cross(n);
  return body.getInverseMass() +
         rCrossN.dot(body.getWorldInverseInertiaTensor() * rCrossN);
}

double angularInverseMass(const Body& body, const Vector3D& n)
{
  return n.dot(body.getWorldInverseInertiaTensor() * n);
}

double deltaLambda(double error,
                   double w1,
                   double w2,
                   double compliance,
                   double lambda,
                   double h)
{
  double const alphaTilde = compliance / (h * h);
  double const denominator = w1 + w2 + alphaTilde;
  if (denominator == 0.0)
  {
    spdlog::error(
      "XPBD correction between two immovable bodies (w1 + w2 == 0), skipped");
    return 0.0;
  }
  return (-error - alphaTilde * lambda) / denominator;
}

}  // anonymous namespace

Eigen::Quaterniond rotateByVector(const Eigen::Quaterniond& q,
                                  const Vector3D& rotationVector)
{
  Eigen::Quaterniond const spin{
    0.0, rotationVector.x(), rotationVector.y(), rotationVector.z()};
  Eigen::Quaterniond result = q;
  result.coeffs() += 0.5 * (spin * q).coeffs();
  result.normalize();
  return result;
}

double positionalDeltaLambda(const Body& b1,
                             const Body& b2,
                             const Vector3D& r1World,
                             const Vector3D& r2World,
                             const Vector3D& deltaX,
                             double compliance,
                             double lambda,
                             double h)
{
  double const c = deltaX.norm();
  if (c <= kErrorEpsilon)
  {
    return 0.0;
  }

  Vector3D const n = deltaX / c;
  return deltaLambda(c,
                     positionalInverseMass(b1, r1World, n),
                     positionalInverseMass(b2, r2World, n),
                     compliance,
                     lambda,
                     h);
}

void applyPositional(Body& b1,
                     Body& b2,
                     const Vector3D& r1World,
                     const Vector3D& r2World,
                     const Vector3D& deltaX,
                     double deltaLambda)
{
  double const c = deltaX.norm();
  if (c <= kErrorEpsilon)
  {
    return;
  }

  Vector3D const p = (deltaLambda / c) * deltaX;

  if (!b1.isFixed())
  {
    b1.setPosition(b1.getPosition() + p * b1.getInverseMass());
    Vector3D const spin = b1.getWorldInverseInertiaTensor() * r1World.cross(p);
    b1.setRotation(rotateByVector(b1.getRotation(), spin));
  }

  if (!b2.isFixed())
  {
    b2.setPosition(b2.getPosition() - p * b2.getInverseMass());
    Vector3D const spin = b2.getWorldInverseInertiaTensor() * r2World.cross(p);
    b2.setRotation(rotateByVector(b2.getRotation(), -spin));
  }
}

double angularDeltaLambda(const Body& b1,
                          const Body& b2,
                          const Vector3D& deltaQ,
                          double compliance,
                          double lambda,
                          double h)
{
  double const theta = deltaQ.norm();
  if (theta <= kErrorEpsilon)
  {
    return 0.0;
  }

  Vector3D const n = deltaQ / theta;
  return deltaLambda(theta,
                     angularInverseMass(b1, n),
                     angularInverseMass(b2, n),
                     compliance,
                     lambda,
                     h);
}

void applyAngular(Body& b1,
                  Body& b2,
                  const Vector3D& deltaQ,
                  double deltaLambda)
{
  double const theta = deltaQ.norm();
  if (theta <= kErrorEpsilon)
  {
    return;
  }

  Vector3D const p = (-deltaLambda / theta) * deltaQ;

  if (!b1.isFixed())
  {
    Vector3D const spin = b1.getWorldInverseInertiaTensor() * p;
    b1.setRotation(rotateByVector(b1.getRotation(), spin));
  }

  if (!b2.isFixed())
  {
    Vector3D const spin = b2.getWorldInverseInertiaTensor() * p;
    b2.setRotation(rotateByVector(b2.getRotation(), -spin));
  }
}

}  // namespace xpbd_sim::constraint_correction
