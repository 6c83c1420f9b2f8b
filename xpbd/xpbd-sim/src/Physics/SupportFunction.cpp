#include "xpbd-sim/src/Physics/SupportFunction.hpp"

namespace xpbd_sim::support_function
{

Coordinate support(const Collider& collider, const Vector3D& direction)
{
  if (collider.isSphere())
  {
    const Sphere& sphere = collider.getSphere();
    return Coordinate{sphere.transformedCenter +
                      direction.safeNormalized() * sphere.radius};
  }

  const ConvexHull& hull = collider.getConvexHull();
  return hull.getTransformedVertices()[hull.supportIndex(direction)];
}

Coordinate supportMinkowski(const Collider& a,
                            const Collider& b,
                            const Vector3D& direction)
{
  Coordinate const supportA = support(a, direction);
  Coordinate const supportB = support(b, Vector3D{-direction});
  return Coordinate{supportA - supportB};
}

}  // namespace xpbd_sim::support_function
