#ifndef XPBD_SIM_ENVIRONMENT_WORLD_MODEL_HPP
#define XPBD_SIM_ENVIRONMENT_WORLD_MODEL_HPP

#include <chrono>
#include <cstddef>
#include <vector>

#include "xpbd-sim/src/Physics/Constraints/Constraint.hpp"
#include "xpbd-sim/src/Physics/RigidBody/Body.hpp"
#include "xpbd-sim/src/Physics/SimulationConfig.hpp"

namespace xpbd_sim
{

/**
 * @brief Stable reference to a body owned by a WorldModel.
 *
 * Bodies are never removed, so a handle stays valid for the life of the
 * world that issued it.
 */
struct BodyHandle
{
  size_t index;

  bool operator==(const BodyHandle& other) const
  {
    return index == other.index;
  }
};

/**
 * @brief Owns the bodies and persistent joints of one simulated world.
 *
 * Constraints added here address bodies by handle index and are passed to
 * every simulate() call. update() advances the world to an absolute
 * simulation time, stepping by the time elapsed since the previous update.
 */
class WorldModel
{
public:
  explicit WorldModel(const SimulationConfig& config = SimulationConfig{});

  BodyHandle addBody(Body body);

  /// @throws std::out_of_range for a handle this world did not issue
  [[nodiscard]] Body& getBody(BodyHandle handle);

  /// @throws std::out_of_range for a handle this world did not issue
  [[nodiscard]] const Body& getBody(BodyHandle handle) const;

  [[nodiscard]] const std::vector<Body>& getBodies() const
  {
    return bodies_;
  }

  /**
   * @brief Register a persistent constraint, built with the Constraint
   * factories from handle indices.
   *
   * @throws std::out_of_range if the constraint references an unknown body
   */
  void addConstraint(Constraint constraint);

  [[nodiscard]] const std::vector<Constraint>& getConstraints() const
  {
    return constraints_;
  }

  /// Advance by dt seconds
  void step(double dt);

  /**
   * @brief Advance to the absolute simulation time simTime.
   *
   * Steps by simTime minus the time of the previous update. A time that
   * does not move forward is ignored.
   */
  void update(std::chrono::milliseconds simTime);

  [[nodiscard]] std::chrono::milliseconds getTime() const
  {
    return time_;
  }

  [[nodiscard]] const SimulationConfig& getConfig() const
  {
    return config_;
  }

  void setConfig(const SimulationConfig& config)
  {
    config_ = config;
  }

private:
  std::vector<Body> bodies_;
  std::vector<Constraint> constraints_;
  SimulationConfig config_;

  //! Simulation time reached by the last update()
  std::chrono::milliseconds time_{0};
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_ENVIRONMENT_WORLD_MODEL_HPP
