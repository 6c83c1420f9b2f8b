#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

extern "C"
{
#include <libqhull_r/geom_r.h>
#include <libqhull_r/libqhull_r.h>
}

#include <spdlog/spdlog.h>

#include "xpbd-sim/src/Physics/RigidBody/ConvexHull.hpp"

namespace xpbd_sim
{

namespace
{

// Tolerance on the dot product of two unit normals for coplanarity
constexpr double kCoplanarTolerance = 1e-6;

using Edge = std::pair<size_t, size_t>;

Vector3D triangleNormal(const std::vector<Coordinate>& vertices,
                        const ConvexHull::Triangle& tri)
{
  Vector3D const e1 = vertices[tri[1]] - vertices[tri[0]];
  Vector3D const e2 = vertices[tri[2]] - vertices[tri[0]];
  return Vector3D{e1.cross(e2)}.safeNormalized();
}

bool sharesVertex(const ConvexHull::Triangle& a, const ConvexHull::Triangle& b)
{
  return std::any_of(a.begin(),
                     a.end(),
                     [&b](size_t v)
                     { return std::find(b.begin(), b.end(), v) != b.end(); });
}

bool sharesVertex(const std::vector<size_t>& a, const std::vector<size_t>& b)
{
  return std::any_of(a.begin(),
                     a.end(),
                     [&b](size_t v)
                     { return std::find(b.begin(), b.end(), v) != b.end(); });
}

void addUnique(std::vector<size_t>& list, size_t value)
{
  if (std::find(list.begin(), list.end(), value) == list.end())
  {
    list.push_back(value);
  }
}

/// Add an edge to the boundary set, or cancel it if the same undirected
/// edge is already present (interior edge shared by two triangles).
void toggleEdge(std::vector<Edge>& edges, const Edge& edge)
{
  auto it = std::find_if(
    edges.begin(),
    edges.end(),
    [&edge](const Edge& e)
    {
      return (e.first == edge.first && e.second == edge.second) ||
             (e.first == edge.second && e.second == edge.first);
    });

  if (it != edges.end())
  {
    edges.erase(it);
  }
  else
  {
    edges.push_back(edge);
  }
}

/// Chain boundary edges into a closed loop and return the loop's vertices
std::vector<size_t> orderBoundary(std::vector<Edge> edges)
{
  std::vector<size_t> loop;
  if (edges.empty())
  {
    return loop;
  }

  Edge current = edges.front();
  edges.erase(edges.begin());
  loop.push_back(current.first);

  while (!edges.empty())
  {
    size_t const tail = current.second;
    auto it = std::find_if(edges.begin(),
                           edges.end(),
                           [tail](const Edge& e)
                           { return e.first == tail || e.second == tail; });
    if (it == edges.end())
    {
      spdlog::warn("ConvexHull: face boundary is not a closed loop");
      break;
    }

    current = (it->first == tail) ? *it : Edge{it->second, it->first};
    edges.erase(it);
    loop.push_back(current.first);
  }

  return loop;
}

}  // namespace

ConvexHull::ConvexHull(const std::vector<Coordinate>& vertices,
                       const std::vector<uint32_t>& indices)
{
  if (indices.empty() || indices.size() % 3 != 0)
  {
    throw std::invalid_argument(
      "ConvexHull: index buffer size must be a non-zero multiple of 3, got " +
      std::to_string(indices.size()));
  }

  // Merge bitwise-identical vertices and remap the index buffer
  std::map<std::array<double, 3>, size_t> uniqueIndex;
  std::vector<size_t> remap(vertices.size());
  for (size_t i = 0; i < vertices.size(); ++i)
  {
    std::array<double, 3> const key{
      vertices[i].x(), vertices[i].y(), vertices[i].z()};
    auto [it, inserted] = uniqueIndex.try_emplace(key, vertices_.size());
    if (inserted)
    {
      vertices_.push_back(vertices[i]);
    }
    remap[i] = it->second;
  }

  if (vertices_.size() < 4)
  {
    throw std::invalid_argument(
      "ConvexHull: at least 4 distinct vertices are required, got " +
      std::to_string(vertices_.size()));
  }

  std::vector<Triangle> triangles;
  triangles.reserve(indices.size() / 3);
  for (size_t i = 0; i < indices.size(); i += 3)
  {
    Triangle tri{};
    for (size_t k = 0; k < 3; ++k)
    {
      uint32_t const idx = indices[i + k];
      if (idx >= vertices.size())
      {
        throw std::invalid_argument("ConvexHull: index " +
                                    std::to_string(idx) +
                                    " is out of range for " +
                                    std::to_string(vertices.size()) +
                                    " vertices");
      }
      tri[k] = remap[idx];
    }
    triangles.push_back(tri);
  }

  build(std::move(triangles));
}

ConvexHull ConvexHull::fromPointCloud(const std::vector<Coordinate>& points)
{
  if (points.size() < 4)
  {
    throw std::invalid_argument(
      "ConvexHull: cannot create 3D convex hull from fewer than 4 points");
  }

  std::vector<double> qhullPoints;
  qhullPoints.reserve(points.size() * 3);
  for (const auto& point : points)
  {
    qhullPoints.push_back(point.x());
    qhullPoints.push_back(point.y());
    qhullPoints.push_back(point.z());
  }

  qhT qh_qh;
  qhT* qh = &qh_qh;

  QHULL_LIB_CHECK
  qh_zero(qh, stderr);

  // "Qt" triangulates every facet; coplanar triangles are fused afterwards
  char options[] = "qhull Qt Pp";
  int const exitcode = qh_new_qhull(qh,
                                    3,
                                    static_cast<int>(points.size()),
                                    qhullPoints.data(),
                                    False,
                                    options,
                                    nullptr,
                                    stderr);

  ConvexHull hull;
  std::vector<Triangle> triangles;
  if (exitcode == 0)
  {
    triangles = extractTriangles(qh, hull.vertices_);
  }

  int curlong = 0;
  int totlong = 0;
  qh_freeqhull(qh, !qh_ALL);
  qh_memfreeshort(qh, &curlong, &totlong);

  if (exitcode != 0)
  {
    throw std::runtime_error("ConvexHull: Qhull failed with exit code " +
                             std::to_string(exitcode));
  }

  hull.build(std::move(triangles));
  return hull;
}

std::vector<ConvexHull::Triangle> ConvexHull::extractTriangles(
  qhT* qh,
  std::vector<Coordinate>& vertices)
{
  std::unordered_map<int, size_t> vertexIdMap;

  vertexT* vertex;
  FORALLvertices
  {
    pointT* point = vertex->point;
    vertexIdMap[qh_pointid(qh, point)] = vertices.size();
    vertices.emplace_back(point[0], point[1], point[2]);
  }

  std::vector<Triangle> triangles;
  facetT* facet;
  FORALLfacets
  {
    if (facet->upperdelaunay || !facet->simplicial)
    {
      continue;
    }

    Triangle tri{};
    size_t count = 0;
    vertexT** vertexp;
    FOREACHvertex_(facet->vertices)
    {
      if (count < 3)
      {
        tri[count] = vertexIdMap[qh_pointid(qh, vertex->point)];
      }
      ++count;
    }

    if (count != 3)
    {
      continue;
    }

    // Qhull does not guarantee vertex order; wind against the facet normal
    Vector3D const facetNormal{
      facet->normal[0], facet->normal[1], facet->normal[2]};
    if (triangleNormal(vertices, tri).dot(facetNormal) < 0.0)
    {
      std::swap(tri[1], tri[2]);
    }
    triangles.push_back(tri);
  }

  return triangles;
}

void ConvexHull::build(std::vector<Triangle> triangles)
{
  size_t const triangleCount = triangles.size();

  std::vector<Vector3D> normals;
  normals.reserve(triangleCount);
  for (const auto& tri : triangles)
  {
    normals.push_back(triangleNormal(vertices_, tri));
  }

  vertexToNeighbors_.assign(vertices_.size(), {});
  for (const auto& tri : triangles)
  {
    for (size_t k = 0; k < 3; ++k)
    {
      size_t const a = tri[k];
      size_t const b = tri[(k + 1) % 3];
      addUnique(vertexToNeighbors_[a], b);
      addUnique(vertexToNeighbors_[b], a);
    }
  }

  // Flood-fill each unvisited triangle into its coplanar group
  std::vector<bool> visited(triangleCount, false);
  for (size_t seed = 0; seed < triangleCount; ++seed)
  {
    if (visited[seed])
    {
      continue;
    }

    std::vector<size_t> group;
    std::vector<size_t> stack{seed};
    visited[seed] = true;
    while (!stack.empty())
    {
      size_t const current = stack.back();
      stack.pop_back();
      group.push_back(current);

      for (size_t other = 0; other < triangleCount; ++other)
      {
        if (visited[other] ||
            !sharesVertex(triangles[current], triangles[other]))
        {
          continue;
        }
        if (std::abs(normals[seed].dot(normals[other]) - 1.0) <
            kCoplanarTolerance)
        {
          visited[other] = true;
          stack.push_back(other);
        }
      }
    }

    std::vector<Edge> boundary;
    for (size_t t : group)
    {
      const Triangle& tri = triangles[t];
      toggleEdge(boundary, {tri[0], tri[1]});
      toggleEdge(boundary, {tri[1], tri[2]});
      toggleEdge(boundary, {tri[2], tri[0]});
    }

    faces_.push_back(Face{orderBoundary(std::move(boundary)), normals[seed]});
  }

  vertexToFaces_.assign(vertices_.size(), {});
  for (size_t f = 0; f < faces_.size(); ++f)
  {
    for (size_t v : faces_[f].vertexIndices)
    {
      addUnique(vertexToFaces_[v], f);
    }
  }

  faceToNeighbors_.assign(faces_.size(), {});
  for (size_t f = 0; f < faces_.size(); ++f)
  {
    for (size_t g = 0; g < faces_.size(); ++g)
    {
      if (f != g &&
          sharesVertex(faces_[f].vertexIndices, faces_[g].vertexIndices))
      {
        faceToNeighbors_[f].push_back(g);
      }
    }
  }

  transformedVertices_ = vertices_;
  transformedNormals_.clear();
  for (const auto& face : faces_)
  {
    transformedNormals_.push_back(face.normal);
  }
}

void ConvexHull::update(const Coordinate& translation,
                        const Eigen::Quaterniond& rotation)
{
  Eigen::Matrix3d const r = rotation.toRotationMatrix();

  for (size_t i = 0; i < vertices_.size(); ++i)
  {
    transformedVertices_[i] = r * vertices_[i] + translation;
  }
  for (size_t f = 0; f < faces_.size(); ++f)
  {
    transformedNormals_[f] = r * faces_[f].normal;
  }
}

size_t ConvexHull::supportIndex(const Vector3D& direction) const
{
  size_t best = 0;
  double bestDot = transformedVertices_[0].dot(direction);
  for (size_t i = 1; i < transformedVertices_.size(); ++i)
  {
    double const d = transformedVertices_[i].dot(direction);
    if (d > bestDot)
    {
      bestDot = d;
      best = i;
    }
  }
  return best;
}

double ConvexHull::getBoundingRadius() const
{
  double radius = 0.0;
  for (const auto& v : vertices_)
  {
    radius = std::max(radius, v.norm());
  }
  return radius;
}

}  // namespace xpbd_sim
