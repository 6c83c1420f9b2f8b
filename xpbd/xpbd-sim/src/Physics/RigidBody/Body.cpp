#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"
#include "xpbd-sim/src/Physics/RigidBody/InertialCalculations.hpp"

namespace xpbd_sim
{

Body::Body(const Coordinate& position,
           const Eigen::Quaterniond& rotation,
           const Vector3D& scale,
           double mass,
           std::vector<Collider> colliders,
           const MaterialProperties& material,
           bool isStatic)
  : position_{position},
    rotation_{rotation.normalized()},
    scale_{scale},
    mass_{mass},
    inverseMass_{0.0},
    inertiaTensor_{Eigen::Matrix3d::Zero()},
    inverseInertiaTensor_{Eigen::Matrix3d::Zero()},
    colliders_{std::move(colliders)},
    material_{material},
    fixed_{isStatic},
    previousPosition_{position},
    previousRotation_{rotation_}
{
  if (colliders_.empty())
  {
    throw std::invalid_argument("Body requires at least one collider");
  }

  material_.validate();

  if (!fixed_ && mass_ <= 0.0)
  {
    throw std::invalid_argument("Dynamic body mass must be positive, got: " +
                                std::to_string(mass_));
  }

  if (mass_ > 0.0)
  {
    inertiaTensor_ = InertialCalculations::computeInertiaTensor(colliders_,
                                                                mass_);
  }

  if (!fixed_)
  {
    if (std::abs(inertiaTensor_.determinant()) < 1e-15)
    {
      throw std::invalid_argument(
        "Body inertia tensor is singular; collider geometry is degenerate");
    }
    inverseMass_ = 1.0 / mass_;
    inverseInertiaTensor_ = inertiaTensor_.inverse();
  }

  updateColliders();
}

void Body::setRotation(const Eigen::Quaterniond& rotation)
{
  rotation_ = rotation.normalized();
}

Coordinate Body::localToWorld(const Coordinate& local) const
{
  return Coordinate{position_ + rotation_ * local};
}

void Body::push(const Vector3D& deltaVelocity)
{
  if (!fixed_)
  {
    linearVelocity_ += deltaVelocity;
  }
  activate();
}

void Body::turn(const Vector3D& deltaAngularVelocity)
{
  if (!fixed_)
  {
    angularVelocity_ += deltaAngularVelocity;
  }
  activate();
}

void Body::stop()
{
  linearVelocity_ = Vector3D{0.0, 0.0, 0.0};
}

void Body::rest()
{
  angularVelocity_ = Vector3D{0.0, 0.0, 0.0};
}

void Body::addForce(const Coordinate& position,
                    const Vector3D& force,
                    bool isLocalFrame)
{
  if (isLocalFrame)
  {
    forces_.push_back(ExternalForce{Coordinate{rotation_ * position},
                                    Vector3D{rotation_ * force}});
  }
  else
  {
    forces_.push_back(ExternalForce{position, force});
  }
  activate();
}

void Body::applyGravity(double gravity)
{
  forces_.push_back(ExternalForce{Coordinate{0.0, 0.0, 0.0},
                                  Vector3D{0.0, -gravity * mass_, 0.0}});
}

Eigen::Matrix3d Body::getWorldInertiaTensor() const
{
  Eigen::Matrix3d const r = rotation_.toRotationMatrix();
  return r * inertiaTensor_ * r.transpose();
}

Eigen::Matrix3d Body::getWorldInverseInertiaTensor() const
{
  Eigen::Matrix3d const r = rotation_.toRotationMatrix();
  return r * inverseInertiaTensor_ * r.transpose();
}

void Body::updateColliders()
{
  for (auto& collider : colliders_)
  {
    collider.update(position_, rotation_);
  }
}

double Body::getBoundingRadius() const
{
  double radius = 0.0;
  for (const auto& collider : colliders_)
  {
    radius = std::max(radius, collider.getBoundingRadius());
  }
  return radius;
}

void Body::activate()
{
  deactivationTime_ = 0.0;
  active_ = true;
}

void Body::storePreviousPose()
{
  previousPosition_ = position_;
  previousRotation_ = rotation_;
}

void Body::storePreviousVelocities()
{
  previousLinearVelocity_ = linearVelocity_;
  previousAngularVelocity_ = angularVelocity_;
}

}  // namespace xpbd_sim
