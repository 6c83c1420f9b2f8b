#include "xpbd-sim/src/Environment/WorldModel.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "xpbd-sim/src/Physics/Simulation.hpp"

namespace xpbd_sim
{

WorldModel::WorldModel(const SimulationConfig& config) : config_{config}
{
}

BodyHandle WorldModel::addBody(Body body)
{
  bodies_.push_back(std::move(body));
  return BodyHandle{bodies_.size() - 1};
}

Body& WorldModel::getBody(BodyHandle handle)
{
  return bodies_.at(handle.index);
}

const Body& WorldModel::getBody(BodyHandle handle) const
{
  return bodies_.at(handle.index);
}

void WorldModel::addConstraint(Constraint constraint)
{
  if (constraint.bodyAIndex() >= bodies_.size() ||
      constraint.bodyBIndex() >= bodies_.size())
  {
    throw std::out_of_range(
      "Constraint references body " + std::to_string(constraint.bodyAIndex()) +
      " / " + std::to_string(constraint.bodyBIndex()) + " but the world has " +
      std::to_string(bodies_.size()));
  }
  constraints_.push_back(std::move(constraint));
}

void WorldModel::step(double dt)
{
  simulate(bodies_, dt, constraints_, config_);
}

void WorldModel::update(std::chrono::milliseconds simTime)
{
  if (simTime <= time_)
  {
    if (simTime < time_)
    {
      spdlog::warn("WorldModel::update: time went backwards ({} ms < {} ms)",
                   simTime.count(),
                   time_.count());
    }
    return;
  }

  std::chrono::duration<double> const elapsed = simTime - time_;
  time_ = simTime;
  spdlog::debug("Simulation time: {} ms", time_.count());

  step(elapsed.count());
}

}  // namespace xpbd_sim
