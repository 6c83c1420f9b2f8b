#ifndef XPBD_SIM_PHYSICS_INERTIAL_CALCULATIONS_HPP
#define XPBD_SIM_PHYSICS_INERTIAL_CALCULATIONS_HPP

#include <vector>

#include <Eigen/Dense>

namespace xpbd_sim
{

class Collider;

/**
 * @brief Body-frame inertia tensors derived from collider geometry.
 */
namespace InertialCalculations
{

/**
 * @brief Solid sphere about its centre: diag(2/5 m r^2).
 */
Eigen::Matrix3d computeSphereInertia(double mass, double radius);

/**
 * @brief Inertia of the hull vertices treated as equal point masses.
 *
 * The mass is split evenly across every vertex of every hull collider.
 * Sphere colliders in a composite are ignored.
 *
 * @param colliders Colliders of the body
 * @param mass Total mass [kg]
 * @return Inertia tensor about the body origin
 */
Eigen::Matrix3d computePointMassInertia(const std::vector<Collider>& colliders,
                                        double mass);

/**
 * @brief Inertia tensor for a body's collider set.
 *
 * A single sphere uses the solid-sphere formula, anything else uses the
 * vertex point-mass approximation.
 */
Eigen::Matrix3d computeInertiaTensor(const std::vector<Collider>& colliders,
                                     double mass);

}  // namespace InertialCalculations

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_INERTIAL_CALCULATIONS_HPP
