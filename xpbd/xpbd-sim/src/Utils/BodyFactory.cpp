#include "xpbd-sim/src/Utils/BodyFactory.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <Eigen/Geometry>

#include "xpbd-sim/src/Physics/RigidBody/ConvexHull.hpp"

namespace xpbd_sim
{

namespace
{

constexpr double kDefaultMass = 1.0;

}  // anonymous namespace

Body BodyFactory::makeDefault(Collider collider, bool isStatic)
{
  std::vector<Collider> colliders;
  colliders.push_back(std::move(collider));

  return Body{Coordinate{0.0, 0.0, 0.0},
              Eigen::Quaterniond::Identity(),
              Vector3D{1.0, 1.0, 1.0},
              kDefaultMass,
              std::move(colliders),
              MaterialProperties{},
              isStatic};
}

Body BodyFactory::makeSphere(double radius, bool isStatic)
{
  return makeDefault(Collider::sphere(radius), isStatic);
}

Body BodyFactory::makeBox(double hx, double hy, double hz, bool isStatic)
{
  if (hx <= 0.0 || hy <= 0.0 || hz <= 0.0)
  {
    throw std::invalid_argument("Box half-extents must be positive, got (" +
                                std::to_string(hx) + ", " +
                                std::to_string(hy) + ", " +
                                std::to_string(hz) + ")");
  }

  return makeConvexHull(boxVertices(hx, hy, hz), boxIndices(), isStatic);
}

Body BodyFactory::makeConvexHull(const std::vector<Coordinate>& vertices,
                                 const std::vector<uint32_t>& indices,
                                 bool isStatic)
{
  return makeDefault(Collider::convexHull(ConvexHull{vertices, indices}),
                     isStatic);
}

Body BodyFactory::makeConvexHullFromPoints(
  const std::vector<Coordinate>& points,
  bool isStatic)
{
  return makeDefault(Collider::convexHull(ConvexHull::fromPointCloud(points)),
                     isStatic);
}

std::vector<Coordinate> BodyFactory::boxVertices(double hx, double hy, double hz)
{
  return {
    Coordinate{-hx, hy, hz},
    Coordinate{-hx, -hy, hz},
    Coordinate{-hx, hy, -hz},
    Coordinate{-hx, -hy, -hz},
    Coordinate{hx, hy, hz},
    Coordinate{hx, -hy, hz},
    Coordinate{hx, hy, -hz},
    Coordinate{hx, -hy, -hz},
  };
}

const std::vector<uint32_t>& BodyFactory::boxIndices()
{
  // Two triangles per face: +Y, -Z, +X, -Y, -X, +Z
  static const std::vector<uint32_t> indices{
    4, 2, 0, 4, 6, 2,  //
    2, 7, 3, 2, 6, 7,  //
    6, 5, 7, 6, 4, 5,  //
    1, 7, 5, 1, 3, 7,  //
    0, 3, 1, 0, 2, 3,  //
    4, 1, 5, 4, 0, 1,  //
  };
  return indices;
}

}  // namespace xpbd_sim
