#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "xpbd-sim/src/Physics/Collision/EPA.hpp"
#include "xpbd-sim/src/Physics/SupportFunction.hpp"

namespace xpbd_sim
{

EPA::EPA(const Collider& colliderA,
         const Collider& colliderB,
         double tolerance)
  : colliderA_{colliderA}, colliderB_{colliderB}, tolerance_{tolerance}
{
}

std::optional<PenetrationResult> EPA::computePenetration(
  const std::vector<Coordinate>& simplex,
  int maxIterations)
{
  if (simplex.size() != 4)
  {
    throw std::invalid_argument("EPA requires a 4-point simplex, got " +
                                std::to_string(simplex.size()));
  }

  vertices_ = simplex;
  faces_.clear();

  constexpr std::array<std::array<size_t, 3>, 4> initialFaces{
    {{0, 1, 2}, {0, 2, 3}, {0, 3, 1}, {1, 2, 3}}};
  for (const auto& f : initialFaces)
  {
    auto face = makeFace(f[0], f[1], f[2]);
    if (!face)
    {
      return std::nullopt;
    }
    faces_.push_back(*face);
  }

  for (int iteration = 0; iteration < maxIterations; ++iteration)
  {
    const EPAFace closest = faces_[findClosestFace()];

    Coordinate const support = support_function::supportMinkowski(
      colliderA_, colliderB_, closest.normal);

    if (std::abs(support.dot(closest.normal) - closest.distance) < tolerance_)
    {
      return PenetrationResult{closest.normal, closest.distance};
    }

    size_t const newIndex = vertices_.size();
    vertices_.push_back(support);

    // Remove every face that sees the new point and collect the horizon
    std::vector<EPAEdge> horizon;
    std::vector<EPAFace> kept;
    kept.reserve(faces_.size());
    for (const auto& face : faces_)
    {
      Coordinate const centroid{(vertices_[face.vertexIndices[0]] +
                                 vertices_[face.vertexIndices[1]] +
                                 vertices_[face.vertexIndices[2]]) /
                                3.0};
      if (face.normal.dot(support - centroid) > 0.0)
      {
        toggleEdge(horizon, {face.vertexIndices[0], face.vertexIndices[1]});
        toggleEdge(horizon, {face.vertexIndices[1], face.vertexIndices[2]});
        toggleEdge(horizon, {face.vertexIndices[2], face.vertexIndices[0]});
      }
      else
      {
        kept.push_back(face);
      }
    }
    faces_ = std::move(kept);

    for (const auto& edge : horizon)
    {
      auto face = makeFace(edge.v0, edge.v1, newIndex);
      if (!face)
      {
        return std::nullopt;
      }
      faces_.push_back(*face);
    }

    if (faces_.empty())
    {
      spdlog::warn("EPA: polytope collapsed after {} iterations", iteration);
      return std::nullopt;
    }
  }

  spdlog::warn("EPA: no convergence after {} iterations", maxIterations);
  return std::nullopt;
}

std::optional<EPA::EPAFace> EPA::makeFace(size_t v0, size_t v1, size_t v2) const
{
  const Coordinate& a = vertices_[v0];
  const Coordinate& b = vertices_[v1];
  const Coordinate& c = vertices_[v2];

  Vector3D normal = Vector3D{b - a}.cross(Vector3D{c - a});
  normal = normal.safeNormalized(0.0);
  if (normal.squaredNorm() == 0.0)
  {
    spdlog::warn("EPA: zero-length face normal");
    return std::nullopt;
  }

  double distance = normal.dot(a);
  if (distance < 0.0)
  {
    normal = -normal;
    distance = -distance;
  }
  else if (distance == 0.0)
  {
    // Origin on the face plane: orient using the rest of the polytope, which
    // must lie behind the plane
    bool oriented = false;
    for (const auto& p : vertices_)
    {
      double const side = normal.dot(p);
      if (side != 0.0)
      {
        if (side > 0.0)
        {
          normal = -normal;
        }
        oriented = true;
        break;
      }
    }

    if (!oriented)
    {
      spdlog::warn("EPA: all polytope points are coplanar");
      return std::nullopt;
    }
  }

  return EPAFace{{v0, v1, v2}, normal, distance};
}

size_t EPA::findClosestFace() const
{
  size_t closest = 0;
  double minDistance = std::numeric_limits<double>::max();
  for (size_t i = 0; i < faces_.size(); ++i)
  {
    if (faces_[i].distance < minDistance)
    {
      minDistance = faces_[i].distance;
      closest = i;
    }
  }
  return closest;
}

void EPA::toggleEdge(std::vector<EPAEdge>& edges, const EPAEdge& edge)
{
  auto it = std::find(edges.begin(), edges.end(), edge);
  if (it != edges.end())
  {
    edges.erase(it);
  }
  else
  {
    edges.push_back(edge);
  }
}

}  // namespace xpbd_sim
