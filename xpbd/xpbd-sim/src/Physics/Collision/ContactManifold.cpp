#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "xpbd-sim/src/Physics/Collision/ContactManifold.hpp"
#include "xpbd-sim/src/Physics/SupportFunction.hpp"

namespace xpbd_sim::contact_manifold
{

namespace
{

// An edge pair must beat both faces by this much to be used
constexpr double kEdgePreference = 1e-4;

// Below this the edge is treated as parallel to the clip plane
constexpr double kParallelTolerance = 1e-6;

struct ClipPlane
{
  Vector3D normal;
  Coordinate point;

  /// Points on the side the normal points to are kept
  [[nodiscard]] bool contains(const Coordinate& p) const
  {
    return (p - point).dot(normal) >= 0.0;
  }

  [[nodiscard]] Coordinate project(const Coordinate& p) const
  {
    return Coordinate{p - normal * (p - point).dot(normal)};
  }
};

struct EdgePair
{
  size_t a0;
  size_t a1;
  size_t b0;
  size_t b1;
  Vector3D normal;
  double dot;
};

std::optional<Coordinate> intersectEdge(const ClipPlane& plane,
                                        const Coordinate& start,
                                        const Coordinate& end)
{
  Vector3D const ab = end - start;
  double const abProjection = plane.normal.dot(ab);
  if (std::abs(abProjection) <= kParallelTolerance)
  {
    return std::nullopt;
  }

  double factor = -plane.normal.dot(start - plane.point) / abProjection;
  factor = std::clamp(factor, 0.0, 1.0);
  return Coordinate{start + ab * factor};
}

/**
 * Clip a polygon against a set of planes. With removeOnly set, vertices
 * outside a plane are dropped instead of being cut at the plane.
 */
std::vector<Coordinate> sutherlandHodgman(std::vector<Coordinate> polygon,
                                          const std::vector<ClipPlane>& planes,
                                          bool removeOnly)
{
  std::vector<Coordinate> output;
  for (const auto& plane : planes)
  {
    if (polygon.empty())
    {
      break;
    }

    output.clear();
    Coordinate start = polygon.back();
    for (const auto& end : polygon)
    {
      bool const startIn = plane.contains(start);
      bool const endIn = plane.contains(end);

      if (removeOnly)
      {
        if (endIn)
        {
          output.push_back(end);
        }
      }
      else if (startIn && endIn)
      {
        output.push_back(end);
      }
      else if (startIn)
      {
        if (auto hit = intersectEdge(plane, start, end))
        {
          output.push_back(*hit);
        }
      }
      else if (endIn)
      {
        if (auto hit = intersectEdge(plane, start, end))
        {
          output.push_back(*hit);
        }
        output.push_back(end);
      }
      start = end;
    }
    std::swap(polygon, output);
  }
  return polygon;
}

size_t mostFittingFace(const ConvexHull& hull,
                       size_t supportIndex,
                       const Vector3D& direction)
{
  size_t selected = 0;
  double maxProjection = -std::numeric_limits<double>::max();
  for (size_t face : hull.getVertexFaces(supportIndex))
  {
    double const projection = hull.getTransformedNormal(face).dot(direction);
    if (projection > maxProjection)
    {
      maxProjection = projection;
      selected = face;
    }
  }
  return selected;
}

EdgePair mostFittingEdges(const ConvexHull& hullA,
                          size_t supportA,
                          const ConvexHull& hullB,
                          size_t supportB,
                          const Vector3D& direction)
{
  const auto& verticesA = hullA.getTransformedVertices();
  const auto& verticesB = hullB.getTransformedVertices();

  EdgePair best{supportA,
                supportA,
                supportB,
                supportB,
                Vector3D{0.0, 0.0, 0.0},
                -std::numeric_limits<double>::max()};

  for (size_t na : hullA.getVertexNeighbors(supportA))
  {
    Vector3D const edgeA = verticesA[supportA] - verticesA[na];
    for (size_t nb : hullB.getVertexNeighbors(supportB))
    {
      Vector3D const edgeB = verticesB[supportB] - verticesB[nb];
      Vector3D const candidate = Vector3D{edgeA.cross(edgeB)}.safeNormalized();

      for (const Vector3D& n : {candidate, Vector3D{-candidate}})
      {
        double const d = n.dot(direction);
        if (d > best.dot)
        {
          best = EdgePair{supportA, na, supportB, nb, n, d};
        }
      }
    }
  }
  return best;
}

/// Closest points between the infinite lines p1 + s d1 and p2 + t d2
std::optional<std::pair<Coordinate, Coordinate>> closestPointsBetweenLines(
  const Coordinate& p1,
  const Vector3D& d1,
  const Coordinate& p2,
  const Vector3D& d2)
{
  Vector3D const r = p1 - p2;
  double const a = d1.dot(d1);
  double const b = d1.dot(d2);
  double const e = d2.dot(d2);
  double const c = d1.dot(r);
  double const f = d2.dot(r);

  double const denom = a * e - b * b;
  if (std::abs(denom) < 1e-12)
  {
    return std::nullopt;
  }

  double const s = (b * f - c * e) / denom;
  double const t = (a * f - b * c) / denom;
  return std::make_pair(Coordinate{p1 + d1 * s}, Coordinate{p2 + d2 * t});
}

std::vector<Coordinate> faceVertices(const ConvexHull& hull, size_t face)
{
  std::vector<Coordinate> result;
  const auto& vertices = hull.getTransformedVertices();
  for (size_t idx : hull.getFaces()[face].vertexIndices)
  {
    result.push_back(vertices[idx]);
  }
  return result;
}

std::vector<ClipPlane> boundaryPlanes(const ConvexHull& hull, size_t face)
{
  std::vector<ClipPlane> planes;
  const auto& vertices = hull.getTransformedVertices();
  for (size_t neighbor : hull.getFaceNeighbors(face))
  {
    planes.push_back(
      ClipPlane{Vector3D{-hull.getTransformedNormal(neighbor)},
                vertices[hull.getFaces()[neighbor].vertexIndices[0]]});
  }
  return planes;
}

std::vector<Contact> hullHull(const ConvexHull& hullA,
                              const ConvexHull& hullB,
                              const Vector3D& n)
{
  std::vector<Contact> contacts;
  Vector3D const contactNormal = -n;

  size_t const supportA = hullA.supportIndex(n);
  size_t const supportB = hullB.supportIndex(contactNormal);
  size_t const faceA = mostFittingFace(hullA, supportA, n);
  size_t const faceB = mostFittingFace(hullB, supportB, contactNormal);

  double const faceADot = hullA.getTransformedNormal(faceA).dot(n);
  double const faceBDot = hullB.getTransformedNormal(faceB).dot(contactNormal);

  EdgePair const edges = mostFittingEdges(hullA, supportA, hullB, supportB, n);

  if (edges.dot > faceADot + kEdgePreference &&
      edges.dot > faceBDot + kEdgePreference)
  {
    const auto& verticesA = hullA.getTransformedVertices();
    const auto& verticesB = hullB.getTransformedVertices();
    const Coordinate& p1 = verticesA[edges.a0];
    const Coordinate& p2 = verticesB[edges.b0];
    Vector3D const d1 = verticesA[edges.a1] - p1;
    Vector3D const d2 = verticesB[edges.b1] - p2;

    if (auto closest = closestPointsBetweenLines(p1, d1, p2, d2))
    {
      contacts.emplace_back(closest->first, closest->second, contactNormal);
      return contacts;
    }
    // Parallel edges: fall through to face clipping
  }

  bool const referenceIsA = faceADot > faceBDot;
  const ConvexHull& referenceHull = referenceIsA ? hullA : hullB;
  const ConvexHull& incidentHull = referenceIsA ? hullB : hullA;
  size_t const referenceFace = referenceIsA ? faceA : faceB;
  size_t const incidentFace = referenceIsA ? faceB : faceA;

  std::vector<Coordinate> const clipped =
    sutherlandHodgman(faceVertices(incidentHull, incidentFace),
                      boundaryPlanes(referenceHull, referenceFace),
                      false);

  ClipPlane const referencePlane{
    Vector3D{-referenceHull.getTransformedNormal(referenceFace)},
    referenceHull
      .getTransformedVertices()[referenceHull.getFaces()[referenceFace]
                                  .vertexIndices[0]]};

  std::vector<Coordinate> const inside =
    sutherlandHodgman(clipped, {referencePlane}, true);

  // Surviving points belong to the incident hull; their projection onto
  // the reference plane is the matching point on the reference hull
  for (const auto& point : inside)
  {
    Vector3D const offset = point - referencePlane.project(point);
    if (referenceIsA)
    {
      double const penetration = offset.dot(n);
      if (penetration < 0.0)
      {
        contacts.emplace_back(
          Coordinate{point - n * penetration}, point, contactNormal);
      }
    }
    else
    {
      double const penetration = -offset.dot(n);
      if (penetration < 0.0)
      {
        contacts.emplace_back(
          point, Coordinate{point + n * penetration}, contactNormal);
      }
    }
  }

  if (contacts.empty())
  {
    spdlog::debug("contact_manifold: clipping produced no contact points");
  }
  return contacts;
}

}  // namespace

std::vector<Contact> generate(const Collider& colliderA,
                              const Collider& colliderB,
                              const Vector3D& normalAtoB,
                              double depth)
{
  std::vector<Contact> contacts;
  Vector3D const contactNormal = -normalAtoB;

  if (colliderA.isSphere())
  {
    Coordinate const pointA = support_function::support(colliderA, normalAtoB);
    contacts.emplace_back(
      pointA, Coordinate{pointA - normalAtoB * depth}, contactNormal);
  }
  else if (colliderB.isSphere())
  {
    Coordinate const pointB =
      support_function::support(colliderB, contactNormal);
    contacts.emplace_back(
      Coordinate{pointB + normalAtoB * depth}, pointB, contactNormal);
  }
  else
  {
    contacts = hullHull(
      colliderA.getConvexHull(), colliderB.getConvexHull(), normalAtoB);
  }

  return contacts;
}

}  // namespace xpbd_sim::contact_manifold
