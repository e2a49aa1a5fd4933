/**
 * @file collision_risk.cpp
 * @brief Scenario risk scoring implementation.
 * @author Watosn
 */

#include "spacetraffic/traffic/collision_risk.hpp"

#include <algorithm>
#include <cmath>

#include "spacetraffic/core/constants.hpp"

namespace spacetraffic::traffic {

namespace constants = spacetraffic::core::constants;

namespace {

double altitude_band_risk(double altitude_km) {
  if (altitude_km < 500.0) {
    return 25.0;
  }
  if (altitude_km < 1000.0) {
    return 15.0;
  }
  if (altitude_km < constants::kLeoUpperAltitudeKm) {
    return 10.0;
  }
  if (altitude_km < constants::kGeoAltitudeKm) {
    return 5.0;
  }
  return 2.0;
}

}  // namespace

double scenario_risk(const OrbitalRegimeState& /*before*/,
                     const OrbitalRegimeState& after,
                     const ScenarioParameters& params,
                     const RiskModelConfig& config) {
  const double congestion = std::clamp(after.average_congestion, 0.0, 1.0) * config.congestion_weight;
  const double altitude = altitude_band_risk(params.altitude_km);
  const double inclination = std::abs(std::sin(params.inclination_deg * constants::kDegToRad)) * 10.0;
  const double velocity = std::min(20.0, params.velocity_kms / constants::kNominalLeoVelocityKms * 15.0);
  const double mass = std::min(15.0, params.mass_kg / 1000.0 * 5.0);
  return std::clamp(congestion + altitude + inclination + velocity + mass, 0.0, config.risk_cap_percent);
}

double regime_collision_probability(double congestion, double velocity_kms, double mass_kg) {
  const double velocity_factor = std::min(velocity_kms / 10.0, 2.0);
  const double mass_factor = std::min(mass_kg / 1000.0, 5.0);
  return std::clamp(congestion * 0.001 * velocity_factor * mass_factor, 0.0, 1.0);
}

double congestion_increase_percent(const OrbitalRegimeState& before, const OrbitalRegimeState& after, EventType event) {
  const double change = after.average_congestion - before.average_congestion;
  double percent = before.average_congestion > 0.0 ? change / before.average_congestion * 100.0 : change * 100.0;
  if (event == EventType::Breakup) {
    percent *= 3.0;
  } else if (event == EventType::Launch) {
    percent *= 1.5;
  }
  return std::max(0.0, percent);
}

double secondary_debris_probability(EventType event, double mass_kg) {
  if (event == EventType::Breakup) {
    return std::min(95.0, mass_kg / 1000.0 * 25.0);
  }
  return std::min(10.0, mass_kg / 1000.0 * 2.0);
}

ImpactLevel classify_risk_level(double collision_probability, const RiskModelConfig& config) {
  if (collision_probability > config.high_risk_probability) {
    return ImpactLevel::High;
  }
  if (collision_probability > config.medium_risk_probability) {
    return ImpactLevel::Medium;
  }
  return ImpactLevel::Low;
}

ImpactLevel classify_congestion_impact(double congestion_change, const RiskModelConfig& config) {
  if (congestion_change > config.high_congestion_change) {
    return ImpactLevel::High;
  }
  if (congestion_change > config.medium_congestion_change) {
    return ImpactLevel::Medium;
  }
  return ImpactLevel::Low;
}

}  // namespace spacetraffic::traffic
