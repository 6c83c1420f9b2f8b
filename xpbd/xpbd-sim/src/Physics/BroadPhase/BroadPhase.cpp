#include "xpbd-sim/src/Physics/BroadPhase/BroadPhase.hpp"

namespace xpbd_sim::broad_phase
{

std::vector<BodyPair> findCandidatePairs(const std::vector<Body>& bodies,
                                         double slack)
{
  std::vector<BodyPair> pairs;

  std::vector<double> radii;
  radii.reserve(bodies.size());
  for (const auto& body : bodies)
  {
    radii.push_back(body.getBoundingRadius());
  }

  for (size_t i = 0; i < bodies.size(); ++i)
  {
    for (size_t j = i + 1; j < bodies.size(); ++j)
    {
      double const distance =
        (bodies[i].getPosition() - bodies[j].getPosition()).norm();
      if (distance <= radii[i] + radii[j] + slack)
      {
        pairs.push_back(BodyPair{i, j});
      }
    }
  }

  return pairs;
}

}  // namespace xpbd_sim::broad_phase
