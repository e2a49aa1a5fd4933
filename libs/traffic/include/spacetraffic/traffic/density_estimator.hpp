/**
 * @file density_estimator.hpp
 * @brief Heuristic orbital-density (congestion) estimator.
 * @author Watosn
 */
#pragma once

#include "spacetraffic/core/constants.hpp"
#include "spacetraffic/traffic/types.hpp"

namespace spacetraffic::traffic {

/**
 * @brief Classify an altitude (km above mean radius) into LEO/MEO/GEO.
 */
[[nodiscard]] OrbitRegime classify_regime(double altitude_km);

/**
 * @brief Evaluation window. Periodic factors are sampled at the window start.
 */
struct TimeWindow {
  spacetraffic::core::Epoch start{};
  spacetraffic::core::Epoch end{};
};

/**
 * @brief Estimator tuning.
 */
struct DensityModelConfig {
  double leo_base_density{0.45};
  double meo_base_density{0.15};
  double geo_base_density{0.05};
  /// Altitude (km) of peak LEO traffic.
  double leo_peak_altitude_km{550.0};
  double geo_altitude_factor{1.2};
  double inclination_weight{0.3};
  double j2{spacetraffic::core::constants::kEarthJ2};
  double solar_pressure_amplitude{0.05};
  double lunar_gravity_amplitude{0.02};
};

/**
 * @brief Multiplicative perturbation factors applied to the base density.
 */
struct DensityFactors {
  double j2{1.0};
  double drag{1.0};
  double solar_pressure{1.0};
  double lunar_gravity{1.0};
};

/**
 * @brief Estimator output.
 */
struct DensityEstimate {
  double base_density{};
  /// Normalized congestion in [0, 1].
  double perturbed_density{};
  OrbitRegime regime{OrbitRegime::LEO};
  double inclination_factor{1.0};
  double altitude_factor{1.0};
  DensityFactors factors{};
  spacetraffic::core::Status status{spacetraffic::core::Status::Ok};
};

/**
 * @brief Estimate normalized orbital density for an altitude/inclination over a time window.
 * @param altitude_km Altitude above mean Earth radius (>= 0).
 * @param inclination_deg Orbit inclination in degrees.
 * @param window Evaluation window (start <= end).
 * @param config Estimator tuning.
 */
[[nodiscard]] DensityEstimate estimate_density(double altitude_km,
                                               double inclination_deg,
                                               const TimeWindow& window,
                                               const DensityModelConfig& config = {});

}  // namespace spacetraffic::traffic
