#include <stdexcept>
#include <string>
#include <utility>

#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"

namespace xpbd_sim
{

Collider::Collider(std::variant<Sphere, ConvexHull> shape)
  : shape_{std::move(shape)}
{
}

Collider Collider::sphere(double radius)
{
  if (radius <= 0.0)
  {
    throw std::invalid_argument("Sphere radius must be positive, got " +
                                std::to_string(radius));
  }
  return Collider{Sphere{radius, Coordinate{0.0, 0.0, 0.0}}};
}

Collider Collider::convexHull(ConvexHull hull)
{
  return Collider{std::move(hull)};
}

Collider::Type Collider::getType() const
{
  return isSphere() ? Type::Sphere : Type::ConvexHull;
}

void Collider::update(const Coordinate& translation,
                      const Eigen::Quaterniond& rotation)
{
  if (auto* s = std::get_if<Sphere>(&shape_))
  {
    s->transformedCenter = translation;
  }
  else
  {
    std::get<ConvexHull>(shape_).update(translation, rotation);
  }
}

double Collider::getBoundingRadius() const
{
  if (const auto* s = std::get_if<Sphere>(&shape_))
  {
    return s->radius;
  }
  return std::get<ConvexHull>(shape_).getBoundingRadius();
}

}  // namespace xpbd_sim
