#include "xpbd-sim/src/Physics/Constraints/Constraint.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace xpbd_sim
{

Constraint::Constraint(size_t bodyAIndex, size_t bodyBIndex, Variant data)
  : bodyAIndex_{bodyAIndex}, bodyBIndex_{bodyBIndex}, data_{std::move(data)}
{
}

// ============================================================================
// Factories
// ============================================================================

Constraint Constraint::positional(size_t b1,
                                  size_t b2,
                                  const Coordinate& r1Local,
                                  const Coordinate& r2Local,
                                  double compliance,
                                  const Vector3D& distance)
{
  return Constraint{
    b1, b2, PositionalConstraint{r1Local, r2Local, compliance, distance}};
}

Constraint Constraint::mutualOrientation(size_t b1,
                                         size_t b2,
                                         double compliance)
{
  return Constraint{b1, b2, MutualOrientationConstraint{compliance}};
}

Constraint Constraint::hingeJoint(size_t b1,
                                  size_t b2,
                                  const Coordinate& r1Local,
                                  const Coordinate& r2Local,
                                  double compliance,
                                  JointAxis alignedAxis1,
                                  JointAxis alignedAxis2)
{
  return Constraint{b1,
                    b2,
                    HingeJointConstraint{r1Local,
                                         r2Local,
                                         compliance,
                                         alignedAxis1,
                                         alignedAxis2}};
}

Constraint Constraint::limitedHingeJoint(size_t b1,
                                         size_t b2,
                                         const Coordinate& r1Local,
                                         const Coordinate& r2Local,
                                         double compliance,
                                         JointAxis alignedAxis1,
                                         JointAxis alignedAxis2,
                                         JointAxis limitAxis1,
                                         JointAxis limitAxis2,
                                         double lowerLimit,
                                         double upperLimit)
{
  HingeJointConstraint::Limit const limit{
    limitAxis1, limitAxis2, lowerLimit, upperLimit};
  return Constraint{b1,
                    b2,
                    HingeJointConstraint{r1Local,
                                         r2Local,
                                         compliance,
                                         alignedAxis1,
                                         alignedAxis2,
                                         limit}};
}

Constraint Constraint::sphericalJoint(size_t b1,
                                      size_t b2,
                                      const Coordinate& r1Local,
                                      const Coordinate& r2Local,
                                      JointAxis swingAxis1,
                                      JointAxis swingAxis2,
                                      JointAxis twistAxis1,
                                      JointAxis twistAxis2,
                                      double swingLower,
                                      double swingUpper,
                                      double twistLower,
                                      double twistUpper)
{
  SphericalJointConstraint::Axes const axes{
    swingAxis1, swingAxis2, twistAxis1, twistAxis2};
  SphericalJointConstraint::Limits const limits{
    swingLower, swingUpper, twistLower, twistUpper};
  return Constraint{
    b1, b2, SphericalJointConstraint{r1Local, r2Local, axes, limits}};
}

Constraint Constraint::collision(const std::vector<Body>& bodies,
                                 size_t b1,
                                 size_t b2,
                                 const Contact& contact)
{
  const Body& body1 = bodies.at(b1);
  const Body& body2 = bodies.at(b2);

  Coordinate const r1Local = body1.getRotation().conjugate() *
                             (contact.pointA - body1.getPosition());
  Coordinate const r2Local = body2.getRotation().conjugate() *
                             (contact.pointB - body2.getPosition());

  return Constraint{
    b1, b2, CollisionConstraint{r1Local, r2Local, contact.normal}};
}

// ============================================================================
// Solver interface
// ============================================================================

bool Constraint::indicesValid(size_t bodyCount) const
{
  if (bodyAIndex_ >= bodyCount || bodyBIndex_ >= bodyCount)
  {
    spdlog::error("Constraint references body {} / {} but only {} exist",
                  bodyAIndex_,
                  bodyBIndex_,
                  bodyCount);
    return false;
  }
  if (bodyAIndex_ == bodyBIndex_)
  {
    spdlog::error("Constraint connects body {} to itself", bodyAIndex_);
    return false;
  }
  return true;
}

void Constraint::solvePositions(std::vector<Body>& bodies, double h)
{
  if (!indicesValid(bodies.size()))
  {
    return;
  }

  Body& b1 = bodies[bodyAIndex_];
  Body& b2 = bodies[bodyBIndex_];
  std::visit([&](auto& constraint) { constraint.solve(b1, b2, h); }, data_);
}

void Constraint::solveVelocities(std::vector<Body>& bodies,
                                 double h,
                                 double restitutionThreshold) const
{
  const auto* collision = std::get_if<CollisionConstraint>(&data_);
  if (collision == nullptr || !indicesValid(bodies.size()))
  {
    return;
  }

  collision->solveVelocity(
    bodies[bodyAIndex_], bodies[bodyBIndex_], h, restitutionThreshold);
}

void Constraint::resetLambdas()
{
  std::visit([](auto& constraint) { constraint.resetLambdas(); }, data_);
}

}  // namespace xpbd_sim
