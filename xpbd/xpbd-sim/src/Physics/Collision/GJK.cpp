#include <spdlog/spdlog.h>

#include "xpbd-sim/src/Physics/Collision/GJK.hpp"
#include "xpbd-sim/src/Physics/SupportFunction.hpp"

namespace xpbd_sim
{

namespace
{

/// (a x b) x c
Vector3D tripleCross(const Vector3D& a, const Vector3D& b, const Vector3D& c)
{
  return Vector3D{a.cross(b).cross(c)};
}

}  // namespace

GJK::GJK(const Collider& colliderA, const Collider& colliderB)
  : colliderA_{colliderA},
    colliderB_{colliderB},
    simplex_{},
    direction_{0.0, 0.0, 1.0}
{
}

bool GJK::intersects(int maxIterations)
{
  simplex_.clear();
  simplex_.reserve(4);

  simplex_.push_back(support_function::supportMinkowski(
    colliderA_, colliderB_, Vector3D{0.0, 0.0, 1.0}));
  direction_ = -simplex_[0];

  for (int iteration = 0; iteration < maxIterations; ++iteration)
  {
    if (direction_.squaredNorm() == 0.0)
    {
      // Origin lies on the current simplex: touching, no penetration
      spdlog::debug("GJK: origin on simplex boundary, treating as separated");
      return false;
    }

    Coordinate const newPoint =
      support_function::supportMinkowski(colliderA_, colliderB_, direction_);

    // The new point did not pass the origin, so A - B cannot contain it
    if (newPoint.dot(direction_) < 0.0)
    {
      return false;
    }

    simplex_.push_back(newPoint);

    if (updateSimplex())
    {
      return true;
    }
  }

  spdlog::debug("GJK: no convergence after {} iterations", maxIterations);
  return false;
}

bool GJK::updateSimplex()
{
  switch (simplex_.size())
  {
    case 2:
      return handleLine();
    case 3:
      return handleTriangle();
    case 4:
      return handleTetrahedron();
    default:
      return false;
  }
}

bool GJK::handleLine()
{
  Coordinate const a = simplex_[1];  // Newest point
  Coordinate const b = simplex_[0];
  reduceEdge(a, b);
  return false;
}

bool GJK::handleTriangle()
{
  Coordinate const a = simplex_[2];  // Newest point
  Coordinate const b = simplex_[1];
  Coordinate const c = simplex_[0];
  reduceTriangle(a, b, c);
  return false;
}

bool GJK::handleTetrahedron()
{
  Coordinate const a = simplex_[3];  // Newest point
  Coordinate const b = simplex_[2];
  Coordinate const c = simplex_[1];
  Coordinate const d = simplex_[0];

  Vector3D const ao = -a;

  // Only the faces through A are tested; A was found beyond face BCD, so the
  // origin is on the inner side of it.
  struct FaceCandidate
  {
    Coordinate p;
    Coordinate q;
    Coordinate opposite;
  };
  FaceCandidate const faces[] = {{b, c, d}, {c, d, b}, {d, b, c}};

  for (const auto& face : faces)
  {
    Vector3D normal = Vector3D{face.p - a}.cross(Vector3D{face.q - a});
    if (sameDirection(normal, Vector3D{face.opposite - a}))
    {
      normal = -normal;
    }

    if (sameDirection(normal, ao))
    {
      reduceTriangle(a, face.p, face.q);
      return false;
    }
  }

  // Origin is behind all three faces: enclosed
  return true;
}

void GJK::reduceTriangle(const Coordinate& a,
                         const Coordinate& b,
                         const Coordinate& c)
{
  Vector3D const ab = b - a;
  Vector3D const ac = c - a;
  Vector3D const ao = -a;
  Vector3D const abc = ab.cross(ac);

  if (sameDirection(abc.cross(ac), ao))
  {
    if (sameDirection(ac, ao))
    {
      simplex_ = {c, a};
      direction_ = tripleCross(ac, ao, ac);
    }
    else
    {
      reduceEdge(a, b);
    }
    return;
  }

  if (sameDirection(ab.cross(abc), ao))
  {
    reduceEdge(a, b);
    return;
  }

  if (sameDirection(abc, ao))
  {
    simplex_ = {c, b, a};
    direction_ = abc;
  }
  else
  {
    // Origin below the triangle; flip the winding so the next point lands
    // on the counter-clockwise side
    simplex_ = {b, c, a};
    direction_ = -abc;
  }
}

void GJK::reduceEdge(const Coordinate& a, const Coordinate& b)
{
  Vector3D const ab = b - a;
  Vector3D const ao = -a;

  if (sameDirection(ab, ao))
  {
    simplex_ = {b, a};
    direction_ = tripleCross(ab, ao, ab);
  }
  else
  {
    simplex_ = {a};
    direction_ = ao;
  }
}

bool GJK::sameDirection(const Vector3D& direction, const Vector3D& ao)
{
  return direction.dot(ao) >= 0.0;
}

}  // namespace xpbd_sim
