/**
 * @file stepper.hpp
 * @brief Fixed-step integration schemes for translational orbit motion.
 * @author Watosn
 */
#pragma once

#include <functional>

#include "spacetraffic/core/types.hpp"

namespace spacetraffic::propagator {

/**
 * @brief Total acceleration (m/s^2) acting on a state.
 */
using AccelerationFunction = std::function<spacetraffic::core::Vec3(const spacetraffic::core::StateVector&)>;

/**
 * @brief Interface for one fixed-step integration scheme.
 */
class IStepper {
 public:
  virtual ~IStepper() = default;
  /**
   * @brief Advance a state by one step.
   * @param state State at the start of the step.
   * @param dt_s Step size in seconds.
   * @param acceleration Acceleration callback.
   * @return State at the end of the step (epoch advanced by dt_s).
   */
  [[nodiscard]] virtual spacetraffic::core::StateVector step(const spacetraffic::core::StateVector& state,
                                                             double dt_s,
                                                             const AccelerationFunction& acceleration) const = 0;
};

/**
 * @brief Semi-implicit (symplectic) Euler: v += a*dt, then x += v*dt.
 */
class SemiImplicitEulerStepper final : public IStepper {
 public:
  [[nodiscard]] spacetraffic::core::StateVector step(const spacetraffic::core::StateVector& state,
                                                     double dt_s,
                                                     const AccelerationFunction& acceleration) const override;
};

/**
 * @brief Classic fourth-order Runge-Kutta.
 */
class Rk4Stepper final : public IStepper {
 public:
  [[nodiscard]] spacetraffic::core::StateVector step(const spacetraffic::core::StateVector& state,
                                                     double dt_s,
                                                     const AccelerationFunction& acceleration) const override;
};

}  // namespace spacetraffic::propagator
