#include <cmath>

#include "xpbd-sim/src/Physics/Collision/CollisionHandler.hpp"
#include "xpbd-sim/src/Physics/Collision/ContactManifold.hpp"
#include "xpbd-sim/src/Physics/Collision/EPA.hpp"
#include "xpbd-sim/src/Physics/Collision/GJK.hpp"

namespace xpbd_sim
{

CollisionHandler::CollisionHandler(double epaTolerance, int maxIterations)
  : epaTolerance_{epaTolerance}, maxIterations_{maxIterations}
{
}

std::vector<Contact> CollisionHandler::getContacts(
  const Collider& colliderA,
  const Collider& colliderB) const
{
  if (colliderA.isSphere() && colliderB.isSphere())
  {
    return sphereSphere(colliderA, colliderB);
  }

  GJK gjk{colliderA, colliderB};
  if (!gjk.intersects(maxIterations_))
  {
    return {};
  }

  EPA epa{colliderA, colliderB, epaTolerance_};
  auto penetration = epa.computePenetration(gjk.getSimplex(), maxIterations_);
  if (!penetration)
  {
    return {};
  }

  return contact_manifold::generate(
    colliderA, colliderB, penetration->normal, penetration->depth);
}

std::vector<Contact> CollisionHandler::getContacts(const Body& bodyA,
                                                   const Body& bodyB) const
{
  std::vector<Contact> contacts;
  for (const auto& colliderA : bodyA.getColliders())
  {
    for (const auto& colliderB : bodyB.getColliders())
    {
      auto pairContacts = getContacts(colliderA, colliderB);
      contacts.insert(contacts.end(), pairContacts.begin(), pairContacts.end());
    }
  }
  return contacts;
}

std::vector<Contact> CollisionHandler::sphereSphere(const Collider& colliderA,
                                                    const Collider& colliderB)
{
  const Sphere& a = colliderA.getSphere();
  const Sphere& b = colliderB.getSphere();

  Vector3D const centerDelta = b.transformedCenter - a.transformedCenter;
  double const minDistance = a.radius + b.radius;
  double const distanceSquared = centerDelta.squaredNorm();
  if (distanceSquared >= minDistance * minDistance)
  {
    return {};
  }

  Vector3D normalAtoB = centerDelta.safeNormalized();
  if (normalAtoB.squaredNorm() == 0.0)
  {
    // Concentric spheres have no preferred axis; push A toward +Y
    normalAtoB = Vector3D{0.0, -1.0, 0.0};
  }

  double const penetration = minDistance - std::sqrt(distanceSquared);
  return contact_manifold::generate(
    colliderA, colliderB, normalAtoB, penetration);
}

}  // namespace xpbd_sim
