#ifndef XPBD_SIM_PHYSICS_BODY_HPP
#define XPBD_SIM_PHYSICS_BODY_HPP

#include <vector>

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/ExternalForce.hpp"
#include "xpbd-sim/src/DataTypes/Vector3D.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"
#include "xpbd-sim/src/Physics/RigidBody/MaterialProperties.hpp"

namespace xpbd_sim
{

/**
 * @brief Rigid body simulated by the XPBD solver.
 *
 * Holds the pose, velocities, mass properties, material, collider set and
 * sleep state of one object, together with the previous-substep snapshot
 * the solver needs to rebuild velocities from position changes and to
 * evaluate restitution.
 *
 * The inertia tensors are stored in the body frame; the world-frame tensors
 * are R I R^T of the current rotation.
 *
 * A fixed body has zero inverse mass and zero inverse inertia and is never
 * moved by the solver. Its velocities stay zero: the velocity setters,
 * push() and turn() leave them untouched.
 *
 * External mutators that add motion (push(), turn(), addForce()) wake the
 * body through activate(). The solver writes pose and velocity through the
 * plain setters, which leave the sleep state alone.
 */
class Body
{
public:
  /**
   * @brief Construct a body.
   *
   * @param position Initial world position of the centre of mass
   * @param rotation Initial orientation (normalized on entry)
   * @param scale World scale. Stored only; colliders must be pre-scaled.
   * @param mass Mass [kg], ignored for fixed bodies
   * @param colliders At least one collider in the body frame
   * @param material Surface material
   * @param isStatic If true the body is fixed in place
   * @throws std::invalid_argument if colliders is empty, the material is out
   *         of range, or a dynamic body has a non-positive mass
   */
  Body(const Coordinate& position,
       const Eigen::Quaterniond& rotation,
       const Vector3D& scale,
       double mass,
       std::vector<Collider> colliders,
       const MaterialProperties& material,
       bool isStatic);

  // ========== Pose ==========

  [[nodiscard]] const Coordinate& getPosition() const
  {
    return position_;
  }

  void setPosition(const Coordinate& position)
  {
    position_ = position;
  }

  [[nodiscard]] const Eigen::Quaterniond& getRotation() const
  {
    return rotation_;
  }

  /// Stores the normalized quaternion
  void setRotation(const Eigen::Quaterniond& rotation);

  [[nodiscard]] const Vector3D& getScale() const
  {
    return scale_;
  }

  void setScale(const Vector3D& scale)
  {
    scale_ = scale;
  }

  /**
   * @brief World position of a point given in the body frame.
   */
  [[nodiscard]] Coordinate localToWorld(const Coordinate& local) const;

  // ========== Velocity ==========

  [[nodiscard]] const Vector3D& getLinearVelocity() const
  {
    return linearVelocity_;
  }

  /// Ignored on fixed bodies
  void setLinearVelocity(const Vector3D& velocity)
  {
    if (!fixed_)
    {
      linearVelocity_ = velocity;
    }
  }

  [[nodiscard]] const Vector3D& getAngularVelocity() const
  {
    return angularVelocity_;
  }

  /// Ignored on fixed bodies
  void setAngularVelocity(const Vector3D& velocity)
  {
    if (!fixed_)
    {
      angularVelocity_ = velocity;
    }
  }

  /// Add linear velocity and wake the body
  void push(const Vector3D& deltaVelocity);

  /// Add angular velocity and wake the body
  void turn(const Vector3D& deltaAngularVelocity);

  void stop();

  void rest();

  // ========== Forces ==========

  /**
   * @brief Queue a force for the next simulation step and wake the body.
   *
   * @param position Application point relative to the centre of mass
   * @param force Force vector [N]
   * @param isLocalFrame If true, position and force are in the body frame
   *        and are rotated into world axes with the current rotation
   */
  void addForce(const Coordinate& position,
                const Vector3D& force,
                bool isLocalFrame);

  /**
   * @brief Queue the weight (0, -g m, 0) at the centre of mass.
   *
   * Unlike addForce() this does not wake a sleeping body.
   */
  void applyGravity(double gravity);

  [[nodiscard]] const std::vector<ExternalForce>& getForces() const
  {
    return forces_;
  }

  void clearForces()
  {
    forces_.clear();
  }

  // ========== Mass properties ==========

  [[nodiscard]] double getMass() const
  {
    return mass_;
  }

  [[nodiscard]] double getInverseMass() const
  {
    return inverseMass_;
  }

  [[nodiscard]] const Eigen::Matrix3d& getInertiaTensor() const
  {
    return inertiaTensor_;
  }

  [[nodiscard]] const Eigen::Matrix3d& getInverseInertiaTensor() const
  {
    return inverseInertiaTensor_;
  }

  [[nodiscard]] Eigen::Matrix3d getWorldInertiaTensor() const;

  [[nodiscard]] Eigen::Matrix3d getWorldInverseInertiaTensor() const;

  [[nodiscard]] const MaterialProperties& getMaterial() const
  {
    return material_;
  }

  // ========== Colliders ==========

  [[nodiscard]] const std::vector<Collider>& getColliders() const
  {
    return colliders_;
  }

  /// Refresh every collider's world-space copy from the current pose
  void updateColliders();

  /// Largest bounding radius of the colliders
  [[nodiscard]] double getBoundingRadius() const;

  // ========== Activity ==========

  [[nodiscard]] bool isFixed() const
  {
    return fixed_;
  }

  [[nodiscard]] bool isActive() const
  {
    return active_;
  }

  void setActive(bool active)
  {
    active_ = active;
  }

  /// Reset the deactivation timer and mark the body active
  void activate();

  [[nodiscard]] double getDeactivationTime() const
  {
    return deactivationTime_;
  }

  void setDeactivationTime(double time)
  {
    deactivationTime_ = time;
  }

  // ========== Previous substep ==========

  /// Snapshot position and rotation before the predict step
  void storePreviousPose();

  /// Snapshot the velocities before they are rebuilt from the pose
  void storePreviousVelocities();

  [[nodiscard]] const Coordinate& getPreviousPosition() const
  {
    return previousPosition_;
  }

  [[nodiscard]] const Eigen::Quaterniond& getPreviousRotation() const
  {
    return previousRotation_;
  }

  [[nodiscard]] const Vector3D& getPreviousLinearVelocity() const
  {
    return previousLinearVelocity_;
  }

  [[nodiscard]] const Vector3D& getPreviousAngularVelocity() const
  {
    return previousAngularVelocity_;
  }

private:
  Coordinate position_;
  Eigen::Quaterniond rotation_;
  Vector3D scale_;

  Vector3D linearVelocity_{0.0, 0.0, 0.0};
  Vector3D angularVelocity_{0.0, 0.0, 0.0};

  double mass_;
  double inverseMass_;
  Eigen::Matrix3d inertiaTensor_;
  Eigen::Matrix3d inverseInertiaTensor_;

  std::vector<ExternalForce> forces_;
  std::vector<Collider> colliders_;
  MaterialProperties material_;

  bool fixed_;
  bool active_{true};
  double deactivationTime_{0.0};

  Coordinate previousPosition_;
  Eigen::Quaterniond previousRotation_;
  Vector3D previousLinearVelocity_{0.0, 0.0, 0.0};
  Vector3D previousAngularVelocity_{0.0, 0.0, 0.0};
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_BODY_HPP
