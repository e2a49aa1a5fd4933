/**
 * @file collision_risk.hpp
 * @brief Scenario risk scoring and regime-level collision heuristics.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string_view>

#include "spacetraffic/traffic/types.hpp"

namespace spacetraffic::traffic {

/**
 * @brief Three-level qualitative classification.
 */
enum class ImpactLevel : std::uint8_t { Low, Medium, High };

[[nodiscard]] constexpr std::string_view to_string(ImpactLevel level) {
  switch (level) {
    case ImpactLevel::Low:
      return "low";
    case ImpactLevel::Medium:
      return "medium";
    case ImpactLevel::High:
      return "high";
  }
  return "unknown";
}

/**
 * @brief Risk scorer tuning.
 */
struct RiskModelConfig {
  double congestion_weight{50.0};
  /// Upper bound of the scenario risk percentage.
  double risk_cap_percent{95.0};
  double high_risk_probability{0.01};
  double medium_risk_probability{0.005};
  double high_congestion_change{0.1};
  double medium_congestion_change{0.05};
};

/**
 * @brief Collision-risk percentage of a scenario in [0, risk_cap_percent].
 *
 * Sum of a congestion term (after-state congestion, at most congestion_weight), an altitude band
 * term, an inclination term, a velocity term, and a mass term.
 */
[[nodiscard]] double scenario_risk(const OrbitalRegimeState& before,
                                   const OrbitalRegimeState& after,
                                   const ScenarioParameters& params,
                                   const RiskModelConfig& config = {});

/**
 * @brief Regime-level collision probability: congestion * 0.001 * min(v/10, 2) * min(m/1000, 5), clamped to [0, 1].
 */
[[nodiscard]] double regime_collision_probability(double congestion, double velocity_kms, double mass_kg);

/**
 * @brief Relative congestion increase in percent, weighted by event type and floored at 0.
 */
[[nodiscard]] double congestion_increase_percent(const OrbitalRegimeState& before,
                                                 const OrbitalRegimeState& after,
                                                 EventType event);

/**
 * @brief Probability (percent) that the event produces secondary debris.
 */
[[nodiscard]] double secondary_debris_probability(EventType event, double mass_kg);

[[nodiscard]] ImpactLevel classify_risk_level(double collision_probability, const RiskModelConfig& config = {});
[[nodiscard]] ImpactLevel classify_congestion_impact(double congestion_change, const RiskModelConfig& config = {});

}  // namespace spacetraffic::traffic
