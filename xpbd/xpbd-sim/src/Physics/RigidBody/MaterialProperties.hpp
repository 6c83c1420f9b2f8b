#ifndef XPBD_SIM_PHYSICS_MATERIAL_PROPERTIES_HPP
#define XPBD_SIM_PHYSICS_MATERIAL_PROPERTIES_HPP

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace xpbd_sim
{

/**
 * @brief Surface material of a body.
 *
 * Friction coefficients of two touching bodies are averaged; restitution
 * coefficients are multiplied.
 */
struct MaterialProperties
{
  double staticFriction{0.5};
  double dynamicFriction{0.5};
  double restitution{0.0};

  /**
   * @brief Check every coefficient is in [0, 1].
   *
   * A dynamic friction larger than the static friction is accepted with a
   * warning.
   *
   * @throws std::invalid_argument if a coefficient is out of range
   */
  void validate() const
  {
    checkUnitRange("Static friction", staticFriction);
    checkUnitRange("Dynamic friction", dynamicFriction);
    checkUnitRange("Restitution", restitution);

    if (dynamicFriction > staticFriction)
    {
      spdlog::warn("Dynamic friction {} exceeds static friction {}",
                   dynamicFriction,
                   staticFriction);
    }
  }

private:
  static void checkUnitRange(const char* name, double value)
  {
    if (value < 0.0 || value > 1.0)
    {
      throw std::invalid_argument(std::string{name} +
                                  " must be in [0, 1], got: " +
                                  std::to_string(value));
    }
  }
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_MATERIAL_PROPERTIES_HPP
