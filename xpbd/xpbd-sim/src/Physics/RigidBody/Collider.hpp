#ifndef XPBD_SIM_PHYSICS_COLLIDER_HPP
#define XPBD_SIM_PHYSICS_COLLIDER_HPP

#include <variant>

#include <Eigen/Geometry>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Vector3D.hpp"
#include "xpbd-sim/src/Physics/RigidBody/ConvexHull.hpp"

namespace xpbd_sim
{

/**
 * @brief Sphere centred on the body origin.
 *
 * The transformed centre is the body position after update().
 */
struct Sphere
{
  double radius{1.0};
  Coordinate transformedCenter{0.0, 0.0, 0.0};
};

/**
 * @brief Convex collision shape attached to a body.
 *
 * Either a Sphere or a ConvexHull. Geometry is stored in the body frame and
 * mirrored into world space by update(). Support queries (see
 * support_function) operate on the world-space copy.
 */
class Collider
{
public:
  enum class Type
  {
    Sphere,
    ConvexHull
  };

  /**
   * @throws std::invalid_argument if radius is not positive
   */
  static Collider sphere(double radius);

  static Collider convexHull(ConvexHull hull);

  [[nodiscard]] Type getType() const;

  [[nodiscard]] bool isSphere() const
  {
    return std::holds_alternative<Sphere>(shape_);
  }

  [[nodiscard]] bool isConvexHull() const
  {
    return std::holds_alternative<ConvexHull>(shape_);
  }

  /// @pre isSphere()
  [[nodiscard]] const Sphere& getSphere() const
  {
    return std::get<Sphere>(shape_);
  }

  /// @pre isConvexHull()
  [[nodiscard]] const ConvexHull& getConvexHull() const
  {
    return std::get<ConvexHull>(shape_);
  }

  void update(const Coordinate& translation,
              const Eigen::Quaterniond& rotation);

  [[nodiscard]] double getBoundingRadius() const;

private:
  explicit Collider(std::variant<Sphere, ConvexHull> shape);

  std::variant<Sphere, ConvexHull> shape_;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_COLLIDER_HPP
