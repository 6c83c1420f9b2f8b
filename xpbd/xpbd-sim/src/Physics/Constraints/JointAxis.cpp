#include "xpbd-sim/src/Physics/Constraints/JointAxis.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace xpbd_sim::joint_axis
{

Vector3D localAxis(JointAxis axis)
{
  switch (axis)
  {
    case JointAxis::PositiveX:
      return Vector3D{1.0, 0.0, 0.0};
    case JointAxis::NegativeX:
      return Vector3D{-1.0, 0.0, 0.0};
    case JointAxis::PositiveY:
      return Vector3D{0.0, 1.0, 0.0};
    case JointAxis::NegativeY:
      return Vector3D{0.0, -1.0, 0.0};
    case JointAxis::PositiveZ:
      return Vector3D{0.0, 0.0, 1.0};
    case JointAxis::NegativeZ:
      return Vector3D{0.0, 0.0, -1.0};
  }
  return Vector3D{1.0, 0.0, 0.0};
}

Vector3D worldAxis(const Eigen::Quaterniond& rotation, JointAxis axis)
{
  return Vector3D{rotation * localAxis(axis)};
}

std::optional<Vector3D> limitAngle(const Vector3D& n,
                                   const Vector3D& n1,
                                   const Vector3D& n2,
                                   double lower,
                                   double upper)
{
  constexpr double kPi = std::numbers::pi;

  // asin only covers [-pi/2, pi/2]; obtuse angles are folded back by the
  // sign of n1 . n2
  double const sine = std::clamp(n.dot(n1.cross(n2)), -1.0, 1.0);
  double phi = std::asin(sine);
  if (n1.dot(n2) < 0.0)
  {
    phi = kPi - phi;
  }
  if (phi > kPi)
  {
    phi -= 2.0 * kPi;
  }
  if (phi < -kPi)
  {
    phi += 2.0 * kPi;
  }

  if (phi >= lower && phi <= upper)
  {
    return std::nullopt;
  }

  phi = std::clamp(phi, lower, upper);
  Vector3D const limited{Eigen::AngleAxisd{phi, n} * n1};
  return Vector3D{limited.cross(n2)};
}

}  // namespace xpbd_sim::joint_axis
