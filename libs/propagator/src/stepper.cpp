/**
 * @file stepper.cpp
 * @brief Fixed-step integration schemes implementation.
 * @author Watosn
 */

#include "spacetraffic/propagator/stepper.hpp"

namespace spacetraffic::propagator {

namespace {

using spacetraffic::core::StateVector;
using spacetraffic::core::Vec3;

// Time derivative of a state: (dx/dt, dv/dt).
struct Derivative {
  Vec3 velocity_mps{};
  Vec3 acceleration_mps2{};
};

Derivative derivative_at(const StateVector& s, const AccelerationFunction& acceleration) {
  return Derivative{.velocity_mps = s.velocity_mps, .acceleration_mps2 = acceleration(s)};
}

StateVector advance(const StateVector& s, const Derivative& d, double h) {
  return StateVector{
      .epoch = {s.epoch.utc_seconds + h},
      .position_m = s.position_m + h * d.velocity_mps,
      .velocity_mps = s.velocity_mps + h * d.acceleration_mps2,
  };
}

}  // namespace

StateVector SemiImplicitEulerStepper::step(const StateVector& state,
                                           double dt_s,
                                           const AccelerationFunction& acceleration) const {
  StateVector out = state;
  out.velocity_mps = state.velocity_mps + dt_s * acceleration(state);
  out.position_m = state.position_m + dt_s * out.velocity_mps;
  out.epoch.utc_seconds = state.epoch.utc_seconds + dt_s;
  return out;
}

StateVector Rk4Stepper::step(const StateVector& state, double dt_s, const AccelerationFunction& acceleration) const {
  const double half = 0.5 * dt_s;
  const auto k1 = derivative_at(state, acceleration);
  const auto k2 = derivative_at(advance(state, k1, half), acceleration);
  const auto k3 = derivative_at(advance(state, k2, half), acceleration);
  const auto k4 = derivative_at(advance(state, k3, dt_s), acceleration);

  const Derivative slope{
      .velocity_mps = (k1.velocity_mps + 2.0 * k2.velocity_mps + 2.0 * k3.velocity_mps + k4.velocity_mps) / 6.0,
      .acceleration_mps2 =
          (k1.acceleration_mps2 + 2.0 * k2.acceleration_mps2 + 2.0 * k3.acceleration_mps2 + k4.acceleration_mps2) / 6.0,
  };
  return advance(state, slope, dt_s);
}

}  // namespace spacetraffic::propagator
