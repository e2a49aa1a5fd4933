/**
 * @file near_term_prediction.hpp
 * @brief Short-horizon risk outlook for a prospective object under current conditions.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "spacetraffic/scenario/scenario.hpp"
#include "spacetraffic/traffic/collision_risk.hpp"

namespace spacetraffic::scenario {

/**
 * @brief Current environment indicators.
 */
struct NearTermEnvironment {
  std::int64_t near_earth_objects{};
  double storm_severity{};
  double solar_radiation_level{};
};

enum class Advisory : std::uint8_t { GeomagneticStorm, SolarRadiation, NearEarthObjectActivity };

[[nodiscard]] std::string_view to_string(Advisory advisory);

struct NearTermPrediction {
  double horizon_hours{};
  double risk_percent{};
  double congestion_increase_percent{};
  double secondary_debris_probability{};
  std::vector<Advisory> advisories{};
  spacetraffic::core::Status status{spacetraffic::core::Status::Ok};
};

/**
 * @brief Outlook assuming a 10 % congestion rise over the horizon.
 *
 * Secondary debris probability is 10 % unless more than five near-Earth objects are active, in
 * which case it is 5 % per object up to 50 %.
 */
[[nodiscard]] NearTermPrediction predict_near_term(const ScenarioParameters& params,
                                                   const spacetraffic::traffic::OrbitalRegimeState& current,
                                                   const NearTermEnvironment& environment,
                                                   double horizon_hours = 24.0,
                                                   const spacetraffic::traffic::RiskModelConfig& risk = {});

}  // namespace spacetraffic::scenario
