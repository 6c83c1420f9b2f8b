#include "xpbd-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"

#include <Eigen/Geometry>

#include "xpbd-sim/src/DataTypes/ExternalForce.hpp"

namespace xpbd_sim
{

void SemiImplicitEulerIntegrator::predict(Body& body, double h) const
{
  Vector3D const force = ExternalForce::totalForce(body.getForces());
  Vector3D const torque = ExternalForce::totalTorque(body.getForces());

  // ===== Linear =====

  Vector3D const velocity =
    body.getLinearVelocity() + force * (h * body.getInverseMass());
  body.setLinearVelocity(velocity);
  body.setPosition(body.getPosition() + velocity * h);

  // ===== Angular =====

  Eigen::Matrix3d const inertia = body.getWorldInertiaTensor();
  Eigen::Matrix3d const inverseInertia = body.getWorldInverseInertiaTensor();
  Vector3D const& omega = body.getAngularVelocity();

  // Euler's equation with the gyroscopic term w x (I w)
  Vector3D const newOmega =
    omega + h * (inverseInertia * (torque - omega.cross(inertia * omega)));
  body.setAngularVelocity(newOmega);

  Eigen::Quaterniond const spin{
    0.0, newOmega.x(), newOmega.y(), newOmega.z()};
  Eigen::Quaterniond rotation = body.getRotation();
  rotation.coeffs() += 0.5 * h * (spin * rotation).coeffs();
  body.setRotation(rotation);
}

void SemiImplicitEulerIntegrator::reconstructVelocities(Body& body,
                                                        double h) const
{
  body.setLinearVelocity(
    (body.getPosition() - body.getPreviousPosition()) / h);

  Eigen::Quaterniond const deltaQ =
    body.getRotation() * body.getPreviousRotation().conjugate();
  Vector3D omega = deltaQ.vec() * (2.0 / h);
  if (deltaQ.w() < 0.0)
  {
    omega = -omega;
  }
  body.setAngularVelocity(omega);
}

}  // namespace xpbd_sim
