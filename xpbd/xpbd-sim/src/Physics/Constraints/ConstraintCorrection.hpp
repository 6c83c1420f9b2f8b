#ifndef XPBD_SIM_PHYSICS_CONSTRAINT_CORRECTION_HPP
#define XPBD_SIM_PHYSICS_CONSTRAINT_CORRECTION_HPP

#include <Eigen/Geometry>

#include "xpbd-sim/src/DataTypes/Vector3D.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"

namespace xpbd_sim
{

/**
 * @brief XPBD delta-lambda and pose-correction primitives.
 *
 * Every constraint in the solver reduces to one or more calls of a
 * positional pair (deltaLambda + apply with an error vector between two
 * attachment points) or an angular pair (with an axis-angle error vector).
 *
 * For an error vector of length c along unit axis n:
 *
 *   alpha~ = compliance / h^2
 *   dLambda = (-c - alpha~ * lambda) / (w1 + w2 + alpha~)
 *
 * where w_i is the generalized inverse mass of body i along n
 * (positional: m_i^-1 + (r_i x n)^T I_i^-1 (r_i x n); angular:
 * n^T I_i^-1 n), with the inverse inertia taken in world axes.
 *
 * Angular velocities and axis-angle corrections are world-frame vectors.
 * A rotation by a small world-frame vector v updates the quaternion as
 * q += 0.5 [v, 0] q followed by normalization.
 *
 * Fixed bodies contribute zero to w and are never written.
 */
namespace constraint_correction
{

/// Error magnitudes at or below this are treated as satisfied
constexpr double kErrorEpsilon = 1e-50;

/**
 * @brief Delta lambda of a positional correction.
 *
 * @param r1World Attachment offset on body 1 in world axes
 * @param r2World Attachment offset on body 2 in world axes
 * @param deltaX Error vector p1 - p2 (or the constraint's equivalent)
 * @return 0 when |deltaX| is negligible or both bodies are immovable
 */
[[nodiscard]] double positionalDeltaLambda(const Body& b1,
                                           const Body& b2,
                                           const Vector3D& r1World,
                                           const Vector3D& r2World,
                                           const Vector3D& deltaX,
                                           double compliance,
                                           double lambda,
                                           double h);

/**
 * @brief Apply impulse deltaLambda * n at the attachment points.
 *
 * Body 1 moves along +p, body 2 along -p, each scaled by its inverse mass,
 * and each rotates by I^-1 (r x p).
 */
void applyPositional(Body& b1,
                     Body& b2,
                     const Vector3D& r1World,
                     const Vector3D& r2World,
                     const Vector3D& deltaX,
                     double deltaLambda);

/**
 * @brief Delta lambda of an angular correction.
 *
 * @param deltaQ Axis-angle error; the direction is the rotation axis that
 *        brings body 1 toward body 2
 */
[[nodiscard]] double angularDeltaLambda(const Body& b1,
                                        const Body& b2,
                                        const Vector3D& deltaQ,
                                        double compliance,
                                        double lambda,
                                        double h);

/**
 * @brief Rotate body 1 by +I1^-1 p and body 2 by -I2^-1 p with
 * p = -deltaLambda * n.
 */
void applyAngular(Body& b1,
                  Body& b2,
                  const Vector3D& deltaQ,
                  double deltaLambda);

/**
 * @brief q' = normalize(q + 0.5 [rotationVector, 0] q).
 */
[[nodiscard]] Eigen::Quaterniond rotateByVector(const Eigen::Quaterniond& q,
                                                const Vector3D& rotationVector);

}  // namespace constraint_correction

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_CONSTRAINT_CORRECTION_HPP
