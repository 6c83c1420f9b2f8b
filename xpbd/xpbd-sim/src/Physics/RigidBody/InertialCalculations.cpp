#include "xpbd-sim/src/Physics/RigidBody/InertialCalculations.hpp"

#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"

namespace xpbd_sim
{
namespace InertialCalculations
{

Eigen::Matrix3d computeSphereInertia(double mass, double radius)
{
  return Eigen::Matrix3d::Identity() * (2.0 / 5.0 * mass * radius * radius);
}

Eigen::Matrix3d computePointMassInertia(const std::vector<Collider>& colliders,
                                        double mass)
{
  size_t vertexCount = 0;
  for (const auto& collider : colliders)
  {
    if (collider.isConvexHull())
    {
      vertexCount += collider.getConvexHull().getVertexCount();
    }
  }

  Eigen::Matrix3d inertia = Eigen::Matrix3d::Zero();
  if (vertexCount == 0)
  {
    return inertia;
  }

  double const m = mass / static_cast<double>(vertexCount);

  for (const auto& collider : colliders)
  {
    if (!collider.isConvexHull())
    {
      continue;
    }

    for (const auto& v : collider.getConvexHull().getVertices())
    {
      double const x = v.x();
      double const y = v.y();
      double const z = v.z();

      inertia(0, 0) += m * (y * y + z * z);
      inertia(1, 1) += m * (x * x + z * z);
      inertia(2, 2) += m * (x * x + y * y);

      // Products of inertia are accumulated with a positive sign
      inertia(0, 1) += m * x * y;
      inertia(0, 2) += m * x * z;
      inertia(1, 2) += m * y * z;
    }
  }

  inertia(1, 0) = inertia(0, 1);
  inertia(2, 0) = inertia(0, 2);
  inertia(2, 1) = inertia(1, 2);

  return inertia;
}

Eigen::Matrix3d computeInertiaTensor(const std::vector<Collider>& colliders,
                                     double mass)
{
  if (colliders.size() == 1 && colliders.front().isSphere())
  {
    return computeSphereInertia(mass, colliders.front().getSphere().radius);
  }
  return computePointMassInertia(colliders, mass);
}

}  // namespace InertialCalculations
}  // namespace xpbd_sim
