#ifndef XPBD_SIM_UTILS_BODY_FACTORY_HPP
#define XPBD_SIM_UTILS_BODY_FACTORY_HPP

#include <cstdint>
#include <vector>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"

namespace xpbd_sim
{

/**
 * @brief Factory class for the standard body shapes
 *
 * Every body is created at the origin with identity rotation, unit scale,
 * mass 1 and the default material (friction 0.5 / 0.5, restitution 0).
 * Adjust the pose and velocities through the Body setters afterwards.
 */
class BodyFactory
{
public:
  /**
   * @throws std::invalid_argument if radius <= 0
   */
  static Body makeSphere(double radius, bool isStatic);

  /**
   * @brief Axis-aligned box with half-extents (hx, hy, hz).
   *
   * @throws std::invalid_argument if a half-extent is not positive
   */
  static Body makeBox(double hx, double hy, double hz, bool isStatic);

  /**
   * @brief Body from an external convex triangle mesh.
   *
   * @param vertices Body-frame vertex buffer
   * @param indices Outward-wound triangles, three indices each
   * @throws std::invalid_argument for a malformed mesh
   */
  static Body makeConvexHull(const std::vector<Coordinate>& vertices,
                             const std::vector<uint32_t>& indices,
                             bool isStatic);

  /**
   * @brief Body from the convex hull of an unstructured point cloud.
   *
   * @throws std::runtime_error if the hull computation fails
   */
  static Body makeConvexHullFromPoints(const std::vector<Coordinate>& points,
                                       bool isStatic);

  /// Corner layout used by makeBox()
  static std::vector<Coordinate> boxVertices(double hx, double hy, double hz);

  /// Outward-wound triangles over boxVertices()
  static const std::vector<uint32_t>& boxIndices();

  BodyFactory() = delete;

private:
  static Body makeDefault(Collider collider, bool isStatic);
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_UTILS_BODY_FACTORY_HPP
