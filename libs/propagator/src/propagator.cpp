/**
 * @file propagator.cpp
 * @brief Fixed-step orbit propagation implementation.
 * @author Watosn
 */

#include "spacetraffic/propagator/propagator.hpp"

#include <cmath>
#include <memory>

#include "spacetraffic/forces/gravity/j2_perturbation.hpp"
#include "spacetraffic/forces/gravity/two_body.hpp"
#include "spacetraffic/forces/surface/drag/drag_perturbation.hpp"
#include "spacetraffic/models/exponential_atmosphere.hpp"

namespace spacetraffic::propagator {

using spacetraffic::core::Status;

PropagationResult OrbitPropagator::propagate(const spacetraffic::core::StateVector& initial,
                                             double time_step_s,
                                             double duration_s,
                                             const spacetraffic::sc::SatelliteParameters& sat,
                                             const PropagationLimits& limits) const {
  if (!std::isfinite(time_step_s) || time_step_s <= 0.0 || !std::isfinite(duration_s) || duration_s < 0.0 ||
      !std::isfinite(initial.epoch.utc_seconds) || !spacetraffic::core::is_finite(initial) ||
      spacetraffic::sc::validate(sat) != Status::Ok || !std::isfinite(limits.reentry_altitude_m)) {
    return PropagationResult{.status = Status::InvalidInput};
  }

  const double step_count = std::floor(duration_s / time_step_s);
  if (step_count > static_cast<double>(limits.max_steps)) {
    return PropagationResult{.status = Status::InvalidInput};
  }
  const auto steps = static_cast<std::size_t>(step_count);
  const double reentry_radius_m = spacetraffic::core::constants::kEarthMeanRadiusM + limits.reentry_altitude_m;

  PropagationResult out{};
  out.trajectory.reserve(steps + 1);
  out.trajectory.push_back(TrajectoryPoint{.state = initial, .simulation_time_s = 0.0});

  Status force_status = Status::Ok;
  const AccelerationFunction acceleration = [&](const spacetraffic::core::StateVector& s) {
    const auto perturbation = perturbations_.evaluate(spacetraffic::forces::PerturbationRequest{.state = s, .satellite = &sat});
    if (perturbation.status != Status::Ok && force_status == Status::Ok) {
      force_status = perturbation.status;
    }
    return spacetraffic::forces::two_body_acceleration(s.position_m, mu_m3_s2_) + perturbation.total_acceleration_mps2;
  };

  auto state = initial;
  for (std::size_t k = 1; k <= steps; ++k) {
    if (limits.cancel && limits.cancel->load(std::memory_order_relaxed)) {
      out.status = Status::Cancelled;
      return out;
    }

    state = stepper_.step(state, time_step_s, acceleration);
    const double t = static_cast<double>(k) * time_step_s;
    state.epoch.utc_seconds = initial.epoch.utc_seconds + t;

    if (!spacetraffic::core::is_finite(state)) {
      out.status = Status::NumericalError;
      return out;
    }
    // Checked before force faults: stages below the surface make the atmosphere report InvalidInput.
    if (spacetraffic::core::norm(state.position_m) < reentry_radius_m) {
      out.status = Status::Reentry;
      return out;
    }
    if (force_status != Status::Ok) {
      out.status = force_status;
      return out;
    }

    out.trajectory.push_back(TrajectoryPoint{.state = state, .simulation_time_s = t});
    out.steps_taken = k;
  }
  return out;
}

PropagationResult propagate_orbit(const spacetraffic::core::StateVector& initial,
                                  double time_step_s,
                                  double duration_s,
                                  const spacetraffic::sc::SatelliteParameters& sat,
                                  const PropagationLimits& limits,
                                  const spacetraffic::forces::DragConfig& drag) {
  const spacetraffic::models::ExponentialAtmosphereModel atmosphere{};

  spacetraffic::forces::PerturbationStack stack;
  stack.add(std::make_unique<spacetraffic::forces::J2PerturbationModel>());
  stack.add(std::make_unique<spacetraffic::forces::DragPerturbationModel>(atmosphere, drag));

  const SemiImplicitEulerStepper stepper{};
  const OrbitPropagator propagator(stack, stepper);
  return propagator.propagate(initial, time_step_s, duration_s, sat, limits);
}

}  // namespace spacetraffic::propagator
