#ifndef XPBD_SIM_PHYSICS_GJK_HPP
#define XPBD_SIM_PHYSICS_GJK_HPP

#include <vector>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Vector3D.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"

namespace xpbd_sim
{

/**
 * @brief GJK (Gilbert-Johnson-Keerthi) intersection test for two colliders.
 *
 * Two convex shapes A and B intersect if and only if their Minkowski
 * difference A - B contains the origin. GJK grows a simplex of up to four
 * support points of A - B toward the origin, reducing it to the sub-simplex
 * whose Voronoi region holds the origin after every insertion.
 *
 * On success the simplex is a tetrahedron enclosing the origin, which is the
 * seed polytope for EPA.
 *
 * Both colliders must have been updated to the current body poses.
 */
class GJK
{
public:
  GJK(const Collider& colliderA, const Collider& colliderB);

  /**
   * @brief Test whether the two colliders overlap.
   *
   * @param maxIterations Support-point budget before giving up
   * @return true if the origin is enclosed. Exhausting the budget or a
   *         degenerate search direction counts as separated.
   */
  bool intersects(int maxIterations = 100);

  /**
   * @brief Terminating simplex, newest point last.
   *
   * @pre intersects() returned true; the simplex then has 4 points.
   */
  [[nodiscard]] const std::vector<Coordinate>& getSimplex() const
  {
    return simplex_;
  }

private:
  const Collider& colliderA_;
  const Collider& colliderB_;

  std::vector<Coordinate> simplex_;
  Vector3D direction_;

  bool updateSimplex();

  bool handleLine();

  bool handleTriangle();

  bool handleTetrahedron();

  /**
   * @brief Reduce triangle (a, b, c), a newest, to the feature nearest the
   * origin and set the next search direction.
   */
  void reduceTriangle(const Coordinate& a,
                      const Coordinate& b,
                      const Coordinate& c);

  /// Edge AB or vertex A, whichever region holds the origin
  void reduceEdge(const Coordinate& a, const Coordinate& b);

  static bool sameDirection(const Vector3D& direction, const Vector3D& ao);
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_GJK_HPP
