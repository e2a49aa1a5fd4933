/**
 * @file propagator.hpp
 * @brief Fixed-step orbit propagation over a perturbation stack.
 * @author Watosn
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <vector>

#include "spacetraffic/core/constants.hpp"
#include "spacetraffic/forces/perturbation.hpp"
#include "spacetraffic/forces/surface/drag/drag_model.hpp"
#include "spacetraffic/propagator/stepper.hpp"

namespace spacetraffic::propagator {

/**
 * @brief One sampled trajectory point.
 */
struct TrajectoryPoint {
  spacetraffic::core::StateVector state{};
  /// Seconds since the initial state.
  double simulation_time_s{};
};

/**
 * @brief Resource bounds for one propagation request.
 */
struct PropagationLimits {
  /// Requests needing more steps are rejected before any work is done.
  std::size_t max_steps{1'000'000};
  /// Optional cooperative cancellation flag, polled once per step.
  const std::atomic<bool>* cancel{nullptr};
  /// Altitude above the mean radius below which the object is treated as reentered.
  double reentry_altitude_m{spacetraffic::core::constants::kReentryAltitudeM};
};

/**
 * @brief Propagation output.
 *
 * On NumericalError, Reentry or Cancelled the trajectory holds every point produced before the stop.
 * A Reentry stop never records the point that crossed the reentry altitude.
 */
struct PropagationResult {
  std::vector<TrajectoryPoint> trajectory{};
  std::size_t steps_taken{};
  spacetraffic::core::Status status{spacetraffic::core::Status::Ok};
};

/**
 * @brief Two-body propagator with additive perturbations.
 */
class OrbitPropagator {
 public:
  /**
   * @brief Construct from a perturbation stack and a stepper, both must outlive the propagator.
   */
  OrbitPropagator(const spacetraffic::forces::PerturbationStack& perturbations,
                  const IStepper& stepper,
                  double mu_m3_s2 = spacetraffic::core::constants::kEarthMuM3S2)
      : perturbations_(perturbations), stepper_(stepper), mu_m3_s2_(mu_m3_s2) {}

  /**
   * @brief Propagate an initial state over a fixed time grid.
   * @param initial Initial ECI state.
   * @param time_step_s Step size in seconds (> 0).
   * @param duration_s Total span in seconds (>= 0).
   * @param sat Satellite properties forwarded to the perturbation models.
   * @param limits Step cap and cancellation flag.
   * @return floor(duration / step) + 1 points starting at the initial state.
   */
  [[nodiscard]] PropagationResult propagate(const spacetraffic::core::StateVector& initial,
                                            double time_step_s,
                                            double duration_s,
                                            const spacetraffic::sc::SatelliteParameters& sat,
                                            const PropagationLimits& limits = {}) const;

 private:
  const spacetraffic::forces::PerturbationStack& perturbations_;
  const IStepper& stepper_;
  double mu_m3_s2_{};
};

/**
 * @brief Propagate with two-body + J2 + exponential-atmosphere drag and the semi-implicit Euler stepper.
 */
[[nodiscard]] PropagationResult propagate_orbit(const spacetraffic::core::StateVector& initial,
                                                double time_step_s,
                                                double duration_s,
                                                const spacetraffic::sc::SatelliteParameters& sat,
                                                const PropagationLimits& limits = {},
                                                const spacetraffic::forces::DragConfig& drag = {});

}  // namespace spacetraffic::propagator
