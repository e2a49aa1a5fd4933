/**
 * @file evaluator.hpp
 * @brief Scenario evaluator producing before/after traffic snapshots and risk deltas.
 * @author Watosn
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

#include "spacetraffic/propagator/propagator.hpp"
#include "spacetraffic/scenario/scenario.hpp"
#include "spacetraffic/traffic/collision_risk.hpp"
#include "spacetraffic/traffic/density_estimator.hpp"
#include "spacetraffic/weather/feeds.hpp"

namespace spacetraffic::scenario {

using spacetraffic::traffic::OrbitalRegimeState;

/**
 * @brief Difference between after and before snapshots.
 */
struct RegimeDelta {
  std::int64_t new_objects{};
  double congestion_change{};
  double risk_change{};
};

/**
 * @brief Evaluator tuning.
 */
struct EvaluatorConfig {
  spacetraffic::traffic::DensityModelConfig density{};
  spacetraffic::traffic::RiskModelConfig risk{};
  ScenarioLimits limits{};

  /// Density estimation window length starting at the reference time.
  double density_window_s{86400.0};

  /// Catalogue counts assumed for regimes the scenario does not touch.
  std::int64_t nominal_leo_objects{3000};
  std::int64_t nominal_meo_objects{500};
  std::int64_t nominal_geo_objects{2000};
  /// Extra objects per unit congestion in the scenario's own regime.
  double leo_objects_per_congestion{1000.0};
  double meo_objects_per_congestion{500.0};
  double geo_objects_per_congestion{300.0};

  double launch_congestion_multiplier{1.01};
  double breakup_congestion_multiplier{1.1};
  double breakup_probability_multiplier{2.0};

  /// One debris fragment per this much parent mass.
  double debris_mass_per_fragment_kg{100.0};
  double leo_debris_fraction{0.7};
  double meo_debris_fraction{0.2};
  double geo_debris_fraction{0.1};

  bool propagate_debris{true};
  double debris_time_step_s{60.0};
  double debris_duration_s{86400.0};
  double debris_drag_coefficient{2.2};
  double debris_area_m2{0.1};
  std::size_t debris_max_steps{1'000'000};
  /// Fragment propagation ends with Status::Reentry below this altitude.
  double debris_reentry_altitude_m{spacetraffic::core::constants::kReentryAltitudeM};
};

/**
 * @brief Per-call inputs that are not part of the scenario itself.
 */
struct EvaluationInputs {
  /// Start of the density estimation window.
  spacetraffic::core::Epoch reference_time{};
  spacetraffic::weather::EnvironmentalFactors environment{};
  /// Known traffic state; derived from the density estimate when absent.
  std::optional<OrbitalRegimeState> before{};
  /// Representative fragment properties; derived from the parent mass when absent.
  std::optional<spacetraffic::sc::SatelliteParameters> debris_fragment{};
  const std::atomic<bool>* cancel{nullptr};
};

struct DebrisAllocation {
  std::int64_t leo{};
  std::int64_t meo{};
  std::int64_t geo{};
};

/**
 * @brief Breakup debris summary.
 */
struct DebrisReport {
  std::int64_t count{};
  DebrisAllocation allocation{};
  /// Representative fragment trajectory, empty when the debris count is zero or propagation is disabled.
  std::vector<spacetraffic::propagator::TrajectoryPoint> trajectory{};
  spacetraffic::core::Status propagation_status{spacetraffic::core::Status::Ok};
};

/**
 * @brief Evaluation output.
 *
 * On NumericalError, Reentry or Cancelled from debris propagation, all snapshot fields stay populated and
 * the debris trajectory holds the points produced before the stop.
 */
struct ScenarioResult {
  OrbitalRegimeState before{};
  OrbitalRegimeState after{};
  RegimeDelta delta{};
  double risk_percent{};
  double congestion_increase_percent{};
  double secondary_debris_probability{};
  spacetraffic::traffic::ImpactLevel risk_level{spacetraffic::traffic::ImpactLevel::Low};
  spacetraffic::traffic::ImpactLevel congestion_impact{spacetraffic::traffic::ImpactLevel::Low};
  spacetraffic::traffic::DensityEstimate density{};
  std::optional<DebrisReport> debris{};
  ValidationIssue validation{};
  spacetraffic::core::Status status{spacetraffic::core::Status::Ok};
};

/**
 * @brief Evaluates launch, adjustment and breakup scenarios.
 *
 * Stateless between calls; one instance may be shared across threads.
 */
class ScenarioEvaluator {
 public:
  explicit ScenarioEvaluator(EvaluatorConfig config = {}) : config_(config) {}

  [[nodiscard]] ScenarioResult evaluate(const Scenario& scenario, const EvaluationInputs& inputs) const;

  /**
   * @brief Before-state implied by a congestion level for a scenario's regime.
   */
  [[nodiscard]] OrbitalRegimeState derive_before_state(double congestion, const ScenarioParameters& params) const;

  /**
   * @brief Split a debris count across LEO/MEO/GEO, each share scaled by @p asteroid_influence and floored.
   */
  [[nodiscard]] DebrisAllocation allocate_debris(std::int64_t debris_count, double asteroid_influence) const;

  [[nodiscard]] const EvaluatorConfig& config() const { return config_; }

 private:
  EvaluatorConfig config_{};
};

/**
 * @brief Initial state of a fragment released at the scenario's altitude, moving in the inclined plane.
 */
[[nodiscard]] spacetraffic::core::StateVector fragment_initial_state(const ScenarioParameters& params);

}  // namespace spacetraffic::scenario
