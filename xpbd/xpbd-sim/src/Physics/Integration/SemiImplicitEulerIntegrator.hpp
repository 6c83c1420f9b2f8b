#ifndef XPBD_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
#define XPBD_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP

#include "xpbd-sim/src/Physics/Integration/Integrator.hpp"

namespace xpbd_sim
{

/**
 * @brief Semi-implicit Euler predictor (symplectic)
 *
 * Prediction order:
 * 1. v += h F / m
 * 2. x += h v (uses the NEW velocity)
 * 3. w += h I_w^-1 (tau - w x (I_w w)), with I_w the world-frame inertia
 * 4. q += 0.5 h [w, 0] q
 * 5. Normalize q
 *
 * Velocity reconstruction:
 * - v = (x - x_prev) / h
 * - dq = q q_prev^-1, w = 2 vec(dq) / h, negated when dq.w < 0 so the
 *   shorter rotation is used
 */
class SemiImplicitEulerIntegrator : public Integrator
{
public:
  SemiImplicitEulerIntegrator() = default;
  ~SemiImplicitEulerIntegrator() override = default;

  void predict(Body& body, double h) const override;

  void reconstructVelocities(Body& body, double h) const override;

  SemiImplicitEulerIntegrator(const SemiImplicitEulerIntegrator&) = default;
  SemiImplicitEulerIntegrator& operator=(const SemiImplicitEulerIntegrator&) =
    default;
  SemiImplicitEulerIntegrator(SemiImplicitEulerIntegrator&&) noexcept = default;
  SemiImplicitEulerIntegrator& operator=(
    SemiImplicitEulerIntegrator&&) noexcept = default;
};

}  // namespace xpbd_sim

#endif  // XPBD_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
