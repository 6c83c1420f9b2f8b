#include "xpbd-sim/src/Physics/Integration/XPBDSolver.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "xpbd-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"

namespace xpbd_sim
{

namespace
{

bool isAwake(const Body& body)
{
  return !body.isFixed() && body.isActive();
}

/// True when neither end of the constraint can move this substep
bool bothAsleep(const std::vector<Body>& bodies, const Constraint& constraint)
{
  size_t const a = constraint.bodyAIndex();
  size_t const b = constraint.bodyBIndex();
  if (a >= bodies.size() || b >= bodies.size())
  {
    return false;
  }
  return !isAwake(bodies[a]) && !isAwake(bodies[b]);
}

void validateConfig(const SimulationConfig& config)
{
  if (config.numSubsteps == 0)
  {
    throw std::invalid_argument("XPBDSolver: numSubsteps must be at least 1");
  }
  if (config.numPositionIterations == 0)
  {
    throw std::invalid_argument(
      "XPBDSolver: numPositionIterations must be at least 1");
  }
}

}  // anonymous namespace

XPBDSolver::XPBDSolver(const SimulationConfig& config)
  : XPBDSolver{config, std::make_unique<SemiImplicitEulerIntegrator>()}
{
}

XPBDSolver::XPBDSolver(const SimulationConfig& config,
                       std::unique_ptr<Integrator> integrator)
  : config_{config},
    integrator_{std::move(integrator)},
    collisionHandler_{config.epaTolerance, config.maxCollisionIterations}
{
  validateConfig(config_);
  if (!integrator_)
  {
    throw std::invalid_argument("XPBDSolver: integrator must not be null");
  }
}

void XPBDSolver::step(std::vector<Body>& bodies,
                      const std::vector<Constraint>& externalConstraints,
                      double dt) const
{
  if (dt <= 0.0)
  {
    return;
  }

  double const h = dt / static_cast<double>(config_.numSubsteps);

  auto const pairs =
    broad_phase::findCandidatePairs(bodies, config_.broadPhaseSlack);
  auto const islands =
    SimulationIslandBuilder::buildIslands(bodies, pairs, externalConstraints);
  updateSleep(bodies, islands, dt);

  for (uint32_t i = 0; i < config_.numSubsteps; ++i)
  {
    substep(bodies, pairs, externalConstraints, h);
  }
}

void XPBDSolver::updateSleep(
  std::vector<Body>& bodies,
  const std::vector<SimulationIslandBuilder::Island>& islands,
  double dt) const
{
  for (const auto& island : islands)
  {
    bool allInactive = true;
    for (size_t index : island.bodyIndices)
    {
      Body& body = bodies[index];
      bool const slow =
        body.getLinearVelocity().norm() < config_.linearSleepThreshold &&
        body.getAngularVelocity().norm() < config_.angularSleepThreshold;

      body.setDeactivationTime(slow ? body.getDeactivationTime() + dt : 0.0);
      if (body.getDeactivationTime() < config_.deactivationTime)
      {
        allInactive = false;
      }
    }

    for (size_t index : island.bodyIndices)
    {
      bodies[index].setActive(!allInactive);
    }
  }
}

void XPBDSolver::substep(std::vector<Body>& bodies,
                         const std::vector<BodyPair>& pairs,
                         const std::vector<Constraint>& externalConstraints,
                         double h) const
{
  // ===== Predict =====

  for (auto& body : bodies)
  {
    body.storePreviousPose();
    if (isAwake(body))
    {
      integrator_->predict(body, h);
    }
  }

  // ===== Constraint list for this substep =====

  std::vector<Constraint> constraints = externalConstraints;
  for (auto& constraint : constraints)
  {
    constraint.resetLambdas();
  }

  if (config_.enableCollisions)
  {
    appendCollisionConstraints(bodies, pairs, constraints);
  }

  // ===== Position solve =====

  for (uint32_t iteration = 0; iteration < config_.numPositionIterations;
       ++iteration)
  {
    for (auto& constraint : constraints)
    {
      if (!bothAsleep(bodies, constraint))
      {
        constraint.solvePositions(bodies, h);
      }
    }
  }

  // ===== Velocity update =====

  for (auto& body : bodies)
  {
    if (!isAwake(body))
    {
      continue;
    }
    body.storePreviousVelocities();
    integrator_->reconstructVelocities(body, h);
  }

  // ===== Velocity solve =====

  // Speed gained by falling for two substeps
  double const restitutionThreshold = 2.0 * config_.gravity * h;

  for (const auto& constraint : constraints)
  {
    if (constraint.isCollision())
    {
      constraint.solveVelocities(bodies, h, restitutionThreshold);
    }
  }
}

void XPBDSolver::appendCollisionConstraints(
  std::vector<Body>& bodies,
  const std::vector<BodyPair>& pairs,
  std::vector<Constraint>& constraints) const
{
  for (const auto& pair : pairs)
  {
    Body& b1 = bodies[pair.first];
    Body& b2 = bodies[pair.second];

    // Bodies in contact share an island, so their sleep state must agree
    if (!b1.isFixed() && !b2.isFixed() && b1.isActive() != b2.isActive())
    {
      spdlog::error(
        "Colliding bodies {} and {} disagree on sleep state, pair skipped",
        pair.first,
        pair.second);
      continue;
    }

    if (!isAwake(b1) && !isAwake(b2))
    {
      continue;
    }

    b1.updateColliders();
    b2.updateColliders();

    auto const contacts = collisionHandler_.getContacts(b1, b2);
    for (const auto& contact : contacts)
    {
      constraints.push_back(
        Constraint::collision(bodies, pair.first, pair.second, contact));
    }

    if (!contacts.empty())
    {
      spdlog::debug("Bodies {} and {}: {} contact(s)",
                    pair.first,
                    pair.second,
                    contacts.size());
    }
  }
}

}  // namespace xpbd_sim
