/**
 * @file density_estimator.cpp
 * @brief Heuristic orbital-density estimator implementation.
 * @author Watosn
 */

#include "spacetraffic/traffic/density_estimator.hpp"

#include <algorithm>
#include <cmath>

namespace spacetraffic::traffic {

namespace constants = spacetraffic::core::constants;
using spacetraffic::core::Status;

OrbitRegime classify_regime(double altitude_km) {
  if (altitude_km < constants::kLeoUpperAltitudeKm) {
    return OrbitRegime::LEO;
  }
  if (altitude_km < constants::kGeoAltitudeKm) {
    return OrbitRegime::MEO;
  }
  return OrbitRegime::GEO;
}

DensityEstimate estimate_density(double altitude_km,
                                 double inclination_deg,
                                 const TimeWindow& window,
                                 const DensityModelConfig& config) {
  if (!std::isfinite(altitude_km) || altitude_km < 0.0 || !std::isfinite(inclination_deg) ||
      !std::isfinite(window.start.utc_seconds) || !std::isfinite(window.end.utc_seconds) ||
      window.end.utc_seconds < window.start.utc_seconds) {
    return DensityEstimate{.status = Status::InvalidInput};
  }

  DensityEstimate out{};
  out.regime = classify_regime(altitude_km);

  switch (out.regime) {
    case OrbitRegime::LEO: {
      out.base_density = config.leo_base_density;
      const double off_peak = (altitude_km - config.leo_peak_altitude_km) / 1000.0;
      out.altitude_factor = std::max(0.0, 1.0 - off_peak * off_peak);
      out.factors.drag = 1.0 + (1000.0 - altitude_km) / 1000.0 * 0.2;
      break;
    }
    case OrbitRegime::MEO:
      out.base_density = config.meo_base_density;
      out.altitude_factor = 1.0;
      break;
    case OrbitRegime::GEO:
      out.base_density = config.geo_base_density;
      out.altitude_factor = config.geo_altitude_factor;
      break;
  }

  // Traffic clusters toward polar orbits.
  out.inclination_factor = 1.0 - std::abs(inclination_deg - 90.0) / 90.0 * config.inclination_weight;

  const double t = window.start.utc_seconds;
  out.factors.j2 = 1.0 + config.j2 * std::sin(inclination_deg * constants::kDegToRad);
  out.factors.solar_pressure = 1.0 + config.solar_pressure_amplitude * std::sin(t / constants::kSecondsPerDay);
  out.factors.lunar_gravity = 1.0 + config.lunar_gravity_amplitude * std::sin(t / constants::kSecondsPerMonth);

  const double rho = out.base_density * out.inclination_factor * out.altitude_factor * out.factors.j2 *
                     out.factors.drag * out.factors.solar_pressure * out.factors.lunar_gravity;
  out.perturbed_density = std::clamp(rho, 0.0, 1.0);
  return out;
}

}  // namespace spacetraffic::traffic
