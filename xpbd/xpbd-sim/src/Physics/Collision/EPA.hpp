#ifndef XPBD_SIM_PHYSICS_EPA_HPP
#define XPBD_SIM_PHYSICS_EPA_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Vector3D.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Collider.hpp"

namespace xpbd_sim
{

/**
 * @brief Penetration axis and depth found by EPA.
 */
struct PenetrationResult
{
  Vector3D normal;  // Unit normal in Minkowski space, A toward B
  double depth;     // Penetration depth along normal (>= 0)
};

/**
 * @brief Expanding Polytope Algorithm for penetration depth.
 *
 * Starting from the GJK tetrahedron, the polytope is grown toward the
 * boundary of A - B until the face closest to the origin no longer moves:
 *
 * 1. Find the face closest to the origin
 * 2. Query the support point along its outward normal
 * 3. If the support point lies on that face (within tolerance), stop
 * 4. Otherwise remove every face that sees the new point, collect the
 *    horizon edges and fan new faces from the horizon to the new point
 *
 * The face list is rebuilt from a filtered copy each iteration instead of
 * being erased while it is traversed.
 */
class EPA
{
public:
  /**
   * @param colliderA First collider (updated to the current pose)
   * @param colliderB Second collider (updated to the current pose)
   * @param tolerance Convergence tolerance on the support distance
   */
  EPA(const Collider& colliderA,
      const Collider& colliderB,
      double tolerance = 1e-4);

  /**
   * @brief Penetration normal and depth from a GJK terminating simplex.
   *
   * @param simplex GJK tetrahedron enclosing the origin
   * @param maxIterations Expansion budget
   * @return Penetration result, or std::nullopt when the expansion did not
   *         converge or the polytope degenerated (logged as a warning)
   * @throws std::invalid_argument if the simplex does not have 4 points
   */
  std::optional<PenetrationResult> computePenetration(
    const std::vector<Coordinate>& simplex,
    int maxIterations = 100);

private:
  struct EPAFace
  {
    std::array<size_t, 3> vertexIndices;
    Vector3D normal;  // Outward unit normal
    double distance;  // Plane distance to the origin
  };

  struct EPAEdge
  {
    size_t v0;
    size_t v1;

    bool operator==(const EPAEdge& other) const
    {
      return (v0 == other.v0 && v1 == other.v1) ||
             (v0 == other.v1 && v1 == other.v0);
    }
  };

  /**
   * @brief Build a face with its outward normal.
   *
   * @return std::nullopt if the triangle is degenerate or every polytope
   *         point lies in its plane
   */
  [[nodiscard]] std::optional<EPAFace> makeFace(size_t v0,
                                                size_t v1,
                                                size_t v2) const;

  [[nodiscard]] size_t findClosestFace() const;

  static void toggleEdge(std::vector<EPAEdge>& edges, const EPAEdge& edge);

  const Collider& colliderA_;
  const Collider& colliderB_;
  double tolerance_;

  std::vector<Coordinate> vertices_;
  std::vector<EPAFace> faces_;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_EPA_HPP
