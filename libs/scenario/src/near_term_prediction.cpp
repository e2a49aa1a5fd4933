/**
 * @file near_term_prediction.cpp
 * @brief Short-horizon risk outlook implementation.
 * @author Watosn
 */

#include "spacetraffic/scenario/near_term_prediction.hpp"

#include <algorithm>
#include <cmath>

namespace spacetraffic::scenario {

using spacetraffic::core::Status;

namespace {

constexpr double kAssumedCongestionGrowth = 1.1;
constexpr double kStormSeverityAdvisory = 5.0;
constexpr double kSolarRadiationAdvisory = 7.0;
constexpr std::int64_t kNeoActivityAdvisory = 3;
constexpr std::int64_t kNeoDebrisThreshold = 5;

}  // namespace

std::string_view to_string(Advisory advisory) {
  switch (advisory) {
    case Advisory::GeomagneticStorm:
      return "geomagnetic storm: monitor satellite operations closely";
    case Advisory::SolarRadiation:
      return "high solar radiation: consider protective measures for satellite electronics";
    case Advisory::NearEarthObjectActivity:
      return "increased near-Earth object activity: enhanced tracking recommended";
  }
  return "unknown";
}

NearTermPrediction predict_near_term(const ScenarioParameters& params,
                                     const spacetraffic::traffic::OrbitalRegimeState& current,
                                     const NearTermEnvironment& environment,
                                     double horizon_hours,
                                     const spacetraffic::traffic::RiskModelConfig& risk) {
  if (!std::isfinite(horizon_hours) || horizon_hours <= 0.0 || !std::isfinite(current.average_congestion) ||
      current.average_congestion < 0.0 || environment.near_earth_objects < 0 ||
      !std::isfinite(environment.storm_severity) || !std::isfinite(environment.solar_radiation_level)) {
    return NearTermPrediction{.status = Status::InvalidInput};
  }

  auto projected = current;
  projected.average_congestion = std::clamp(current.average_congestion * kAssumedCongestionGrowth, 0.0, 1.0);

  NearTermPrediction out{};
  out.horizon_hours = horizon_hours;
  out.risk_percent = spacetraffic::traffic::scenario_risk(current, projected, params, risk);
  out.congestion_increase_percent =
      spacetraffic::traffic::congestion_increase_percent(current, projected, EventType::Launch);
  out.secondary_debris_probability =
      environment.near_earth_objects > kNeoDebrisThreshold
          ? std::min(50.0, static_cast<double>(environment.near_earth_objects) * 5.0)
          : 10.0;

  if (environment.storm_severity > kStormSeverityAdvisory) {
    out.advisories.push_back(Advisory::GeomagneticStorm);
  }
  if (environment.solar_radiation_level > kSolarRadiationAdvisory) {
    out.advisories.push_back(Advisory::SolarRadiation);
  }
  if (environment.near_earth_objects > kNeoActivityAdvisory) {
    out.advisories.push_back(Advisory::NearEarthObjectActivity);
  }
  return out;
}

}  // namespace spacetraffic::scenario
