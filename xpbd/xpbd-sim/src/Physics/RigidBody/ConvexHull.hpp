#ifndef XPBD_SIM_PHYSICS_CONVEX_HULL_HPP
#define XPBD_SIM_PHYSICS_CONVEX_HULL_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <Eigen/Geometry>

#include "xpbd-sim/src/DataTypes/Coordinate.hpp"
#include "xpbd-sim/src/DataTypes/Vector3D.hpp"

// Forward declare Qhull C API types
extern "C"
{
  // NOLINTNEXTLINE(readability-identifier-naming)
  struct qhT;
}

namespace xpbd_sim
{

/**
 * @brief Convex polyhedron used as a collision shape.
 *
 * Built from a triangle mesh (vertex + index buffers) or from an unstructured
 * point cloud through Qhull. Coplanar triangles are fused into polygonal
 * faces whose vertex loop is ordered along the face boundary, which is what
 * the contact clipping needs.
 *
 * Two copies of the geometry are kept: the body-local vertices and face
 * normals, and a "transformed" copy refreshed by update() from the owning
 * body's pose (rotation + translation, no scale). The narrow phase only
 * reads the transformed copy.
 *
 * The input mesh is assumed to be convex with consistent outward
 * (counter-clockwise) winding. Non-convex input is not validated.
 */
class ConvexHull
{
public:
  /**
   * @brief Polygonal face of the hull.
   */
  struct Face
  {
    std::vector<size_t> vertexIndices;  // Boundary loop, counter-clockwise
    Vector3D normal;                    // Outward-facing unit normal
  };

  using Triangle = std::array<size_t, 3>;

  /**
   * @brief Build a hull from a triangle mesh.
   *
   * Duplicate vertices (bitwise equal coordinates) are merged before the
   * faces are assembled.
   *
   * @param vertices Vertex buffer
   * @param indices Index buffer, three entries per triangle
   * @throws std::invalid_argument if the index buffer is malformed or fewer
   *         than 4 distinct vertices remain
   */
  ConvexHull(const std::vector<Coordinate>& vertices,
             const std::vector<uint32_t>& indices);

  /**
   * @brief Build the convex hull of a point cloud using Qhull.
   *
   * Interior points are discarded.
   *
   * @param points Input point cloud (at least 4 non-coplanar points)
   * @return Hull with merged polygonal faces
   * @throws std::runtime_error if Qhull fails
   * @throws std::invalid_argument if fewer than 4 points are given
   */
  static ConvexHull fromPointCloud(const std::vector<Coordinate>& points);

  /**
   * @brief Refresh the transformed copy from a body pose.
   */
  void update(const Coordinate& translation,
              const Eigen::Quaterniond& rotation);

  /**
   * @brief Index of the transformed vertex farthest along a direction.
   */
  [[nodiscard]] size_t supportIndex(const Vector3D& direction) const;

  [[nodiscard]] const std::vector<Coordinate>& getVertices() const
  {
    return vertices_;
  }

  [[nodiscard]] const std::vector<Face>& getFaces() const
  {
    return faces_;
  }

  [[nodiscard]] const std::vector<Coordinate>& getTransformedVertices() const
  {
    return transformedVertices_;
  }

  [[nodiscard]] const Vector3D& getTransformedNormal(size_t faceIndex) const
  {
    return transformedNormals_[faceIndex];
  }

  /// Faces touching a vertex
  [[nodiscard]] const std::vector<size_t>& getVertexFaces(
    size_t vertexIndex) const
  {
    return vertexToFaces_[vertexIndex];
  }

  /// Vertices connected to a vertex by a triangle edge
  [[nodiscard]] const std::vector<size_t>& getVertexNeighbors(
    size_t vertexIndex) const
  {
    return vertexToNeighbors_[vertexIndex];
  }

  /// Faces sharing at least one vertex with a face
  [[nodiscard]] const std::vector<size_t>& getFaceNeighbors(
    size_t faceIndex) const
  {
    return faceToNeighbors_[faceIndex];
  }

  [[nodiscard]] size_t getVertexCount() const
  {
    return vertices_.size();
  }

  [[nodiscard]] size_t getFaceCount() const
  {
    return faces_.size();
  }

  /**
   * @brief Radius of the origin-centred sphere enclosing all local vertices.
   */
  [[nodiscard]] double getBoundingRadius() const;

private:
  ConvexHull() = default;

  void build(std::vector<Triangle> triangles);

  static std::vector<Triangle> extractTriangles(
    qhT* qh,
    std::vector<Coordinate>& vertices);

  std::vector<Coordinate> vertices_;
  std::vector<Face> faces_;
  std::vector<Coordinate> transformedVertices_;
  std::vector<Vector3D> transformedNormals_;
  std::vector<std::vector<size_t>> vertexToFaces_;
  std::vector<std::vector<size_t>> vertexToNeighbors_;
  std::vector<std::vector<size_t>> faceToNeighbors_;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_CONVEX_HULL_HPP
