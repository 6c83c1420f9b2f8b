#ifndef XPBD_SIM_PHYSICS_CONSTRAINT_HPP
#define XPBD_SIM_PHYSICS_CONSTRAINT_HPP

#include <cstddef>
#include <variant>
#include <vector>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Vector3D.hpp"
#include "xpbd-sim/src/Physics/Collision/CollisionResult.hpp"
#include "xpbd-sim/src/Physics/Constraints/CollisionConstraint.hpp"
#include "xpbd-sim/src/Physics/Constraints/HingeJointConstraint.hpp"
#include "xpbd-sim/src/Physics/Constraints/JointAxis.hpp"
#include "xpbd-sim/src/Physics/Constraints/MutualOrientationConstraint.hpp"
#include "xpbd-sim/src/Physics/Constraints/PositionalConstraint.hpp"
#include "xpbd-sim/src/Physics/Constraints/SphericalJointConstraint.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"

namespace xpbd_sim
{

/**
 * @brief A constraint between two bodies, addressed by index.
 *
 * Closed sum type over the constraint kinds the solver knows. Bodies are
 * referenced by their index in the body list passed to the solver, so a
 * constraint stays valid when the list is copied or reallocated.
 *
 * Body 1 receives the positive half of every correction, body 2 the
 * negative half.
 */
class Constraint
{
public:
  using Variant = std::variant<PositionalConstraint,
                               CollisionConstraint,
                               MutualOrientationConstraint,
                               HingeJointConstraint,
                               SphericalJointConstraint>;

  Constraint(size_t bodyAIndex, size_t bodyBIndex, Variant data);

  // ========== Factories ==========

  [[nodiscard]] static Constraint positional(size_t b1,
                                             size_t b2,
                                             const Coordinate& r1Local,
                                             const Coordinate& r2Local,
                                             double compliance,
                                             const Vector3D& distance);

  [[nodiscard]] static Constraint mutualOrientation(size_t b1,
                                                    size_t b2,
                                                    double compliance);

  [[nodiscard]] static Constraint hingeJoint(size_t b1,
                                             size_t b2,
                                             const Coordinate& r1Local,
                                             const Coordinate& r2Local,
                                             double compliance,
                                             JointAxis alignedAxis1,
                                             JointAxis alignedAxis2);

  /**
   * @throws std::invalid_argument if lowerLimit > upperLimit
   */
  [[nodiscard]] static Constraint limitedHingeJoint(size_t b1,
                                                    size_t b2,
                                                    const Coordinate& r1Local,
                                                    const Coordinate& r2Local,
                                                    double compliance,
                                                    JointAxis alignedAxis1,
                                                    JointAxis alignedAxis2,
                                                    JointAxis limitAxis1,
                                                    JointAxis limitAxis2,
                                                    double lowerLimit,
                                                    double upperLimit);

  /**
   * @throws std::invalid_argument if a lower limit exceeds its upper limit
   */
  [[nodiscard]] static Constraint sphericalJoint(size_t b1,
                                                 size_t b2,
                                                 const Coordinate& r1Local,
                                                 const Coordinate& r2Local,
                                                 JointAxis swingAxis1,
                                                 JointAxis swingAxis2,
                                                 JointAxis twistAxis1,
                                                 JointAxis twistAxis2,
                                                 double swingLower,
                                                 double swingUpper,
                                                 double twistLower,
                                                 double twistUpper);

  /**
   * @brief Collision constraint for a contact between bodies[b1] and
   * bodies[b2].
   *
   * The contact points are converted into each body's local frame using the
   * current pose: r = R^-1 (point - x).
   *
   * @param contact Contact with pointA on bodies[b1] and pointB on
   *        bodies[b2]
   * @throws std::out_of_range if an index is outside bodies
   */
  [[nodiscard]] static Constraint collision(const std::vector<Body>& bodies,
                                            size_t b1,
                                            size_t b2,
                                            const Contact& contact);

  // ========== Solver interface ==========

  /**
   * @brief One positional Gauss-Seidel update.
   *
   * Skipped, with an error log, when either body index is out of range.
   */
  void solvePositions(std::vector<Body>& bodies, double h);

  /**
   * @brief Velocity-level friction and restitution for collision
   * constraints. No-op for every other kind.
   *
   * @param restitutionThreshold Approach speed [m/s] at or below which a
   *        contact does not bounce
   */
  void solveVelocities(std::vector<Body>& bodies,
                       double h,
                       double restitutionThreshold = 0.0) const;

  /// Zero every accumulated multiplier
  void resetLambdas();

  // ========== Accessors ==========

  [[nodiscard]] size_t bodyAIndex() const
  {
    return bodyAIndex_;
  }

  [[nodiscard]] size_t bodyBIndex() const
  {
    return bodyBIndex_;
  }

  [[nodiscard]] bool isCollision() const
  {
    return std::holds_alternative<CollisionConstraint>(data_);
  }

  [[nodiscard]] const Variant& getData() const
  {
    return data_;
  }

  Constraint(const Constraint&) = default;
  Constraint& operator=(const Constraint&) = default;
  Constraint(Constraint&&) noexcept = default;
  Constraint& operator=(Constraint&&) noexcept = default;
  ~Constraint() = default;

private:
  [[nodiscard]] bool indicesValid(size_t bodyCount) const;

  size_t bodyAIndex_;
  size_t bodyBIndex_;
  Variant data_;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_CONSTRAINT_HPP
