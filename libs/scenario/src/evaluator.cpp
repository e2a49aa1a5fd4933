/**
 * @file evaluator.cpp
 * @brief Scenario evaluator implementation.
 * @author Watosn
 */

#include "spacetraffic/scenario/evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "spacetraffic/core/constants.hpp"

namespace spacetraffic::scenario {

namespace constants = spacetraffic::core::constants;
using spacetraffic::core::Status;
using spacetraffic::traffic::OrbitRegime;

namespace {

bool valid_multiplier(double m) { return std::isfinite(m) && m >= 1.0; }

bool valid_state(const OrbitalRegimeState& s) {
  return s.objects_in_leo >= 0 && s.objects_in_meo >= 0 && s.objects_in_geo >= 0 &&
         std::isfinite(s.average_congestion) && s.average_congestion >= 0.0 && s.average_congestion <= 1.0 &&
         std::isfinite(s.collision_probability) && s.collision_probability >= 0.0 && s.collision_probability <= 1.0;
}

std::int64_t& regime_count(OrbitalRegimeState& s, OrbitRegime regime) {
  switch (regime) {
    case OrbitRegime::LEO:
      return s.objects_in_leo;
    case OrbitRegime::MEO:
      return s.objects_in_meo;
    case OrbitRegime::GEO:
      break;
  }
  return s.objects_in_geo;
}

ScenarioResult rejected(ScenarioField field, std::string message) {
  ScenarioResult out{};
  out.validation = ValidationIssue{.status = Status::InvalidInput, .field = field, .message = std::move(message)};
  out.status = Status::InvalidInput;
  return out;
}

}  // namespace

spacetraffic::core::StateVector fragment_initial_state(const ScenarioParameters& params) {
  const double r_m = constants::kEarthMeanRadiusM + params.altitude_km * 1000.0;
  const double v_mps = params.velocity_kms * 1000.0;
  const double inc = params.inclination_deg * constants::kDegToRad;
  return spacetraffic::core::StateVector{
      .epoch = params.launch_time,
      .position_m = {r_m, 0.0, 0.0},
      .velocity_mps = {0.0, v_mps * std::cos(inc), v_mps * std::sin(inc)},
  };
}

OrbitalRegimeState ScenarioEvaluator::derive_before_state(double congestion, const ScenarioParameters& params) const {
  const auto regime = spacetraffic::traffic::classify_regime(params.altitude_km);
  const auto scaled = [&](std::int64_t nominal, double per_congestion, OrbitRegime r) {
    return regime == r ? static_cast<std::int64_t>(std::floor(static_cast<double>(nominal) + congestion * per_congestion))
                       : nominal;
  };
  return OrbitalRegimeState{
      .objects_in_leo = scaled(config_.nominal_leo_objects, config_.leo_objects_per_congestion, OrbitRegime::LEO),
      .objects_in_meo = scaled(config_.nominal_meo_objects, config_.meo_objects_per_congestion, OrbitRegime::MEO),
      .objects_in_geo = scaled(config_.nominal_geo_objects, config_.geo_objects_per_congestion, OrbitRegime::GEO),
      .average_congestion = congestion,
      .collision_probability =
          spacetraffic::traffic::regime_collision_probability(congestion, params.velocity_kms, params.mass_kg),
  };
}

DebrisAllocation ScenarioEvaluator::allocate_debris(std::int64_t debris_count, double asteroid_influence) const {
  const double d = static_cast<double>(debris_count);
  const auto share = [&](double fraction) { return static_cast<std::int64_t>(std::floor(d * fraction * asteroid_influence)); };
  return DebrisAllocation{
      .leo = share(config_.leo_debris_fraction),
      .meo = share(config_.meo_debris_fraction),
      .geo = share(config_.geo_debris_fraction),
  };
}

ScenarioResult ScenarioEvaluator::evaluate(const Scenario& scenario, const EvaluationInputs& inputs) const {
  if (auto issue = validate(scenario, config_.limits); issue.status != Status::Ok) {
    ScenarioResult out{};
    out.status = issue.status;
    out.validation = std::move(issue);
    return out;
  }
  const auto& env = inputs.environment;
  if (!valid_multiplier(env.storm_multiplier) || !valid_multiplier(env.asteroid_influence)) {
    return rejected(ScenarioField::Environment, "environment multipliers must be finite and >= 1");
  }
  if (!std::isfinite(inputs.reference_time.utc_seconds)) {
    return rejected(ScenarioField::Environment, "reference time is not finite");
  }
  if (inputs.before && !valid_state(*inputs.before)) {
    return rejected(ScenarioField::Environment, "supplied traffic state is out of range");
  }

  const auto& p = scenario.parameters;
  ScenarioResult out{};
  out.density = spacetraffic::traffic::estimate_density(
      p.altitude_km, p.inclination_deg,
      {inputs.reference_time, {inputs.reference_time.utc_seconds + config_.density_window_s}}, config_.density);
  if (out.density.status != Status::Ok) {
    out.status = out.density.status;
    return out;
  }

  const double congestion = std::clamp(out.density.perturbed_density * env.storm_multiplier, 0.0, 1.0);
  out.before = inputs.before ? *inputs.before : derive_before_state(congestion, p);
  out.after = out.before;

  const auto regime = spacetraffic::traffic::classify_regime(p.altitude_km);
  const auto probability_at = [&](double c) {
    return spacetraffic::traffic::regime_collision_probability(c, p.velocity_kms, p.mass_kg);
  };

  switch (scenario.event_type) {
    case EventType::Launch:
      regime_count(out.after, regime) += 1;
      out.after.average_congestion = std::clamp(out.before.average_congestion * config_.launch_congestion_multiplier, 0.0, 1.0);
      out.after.collision_probability = probability_at(out.after.average_congestion);
      break;
    case EventType::Adjustment:
      out.after.collision_probability = probability_at(out.before.average_congestion);
      break;
    case EventType::Breakup: {
      DebrisReport debris{};
      debris.count = static_cast<std::int64_t>(std::floor(p.mass_kg / config_.debris_mass_per_fragment_kg));
      debris.allocation = allocate_debris(debris.count, env.asteroid_influence);
      out.after.objects_in_leo += debris.allocation.leo;
      out.after.objects_in_meo += debris.allocation.meo;
      out.after.objects_in_geo += debris.allocation.geo;
      out.after.average_congestion = std::clamp(out.before.average_congestion * config_.breakup_congestion_multiplier, 0.0, 1.0);
      out.after.collision_probability =
          std::clamp(probability_at(out.after.average_congestion) * config_.breakup_probability_multiplier, 0.0, 1.0);

      if (config_.propagate_debris && debris.count > 0) {
        const auto fragment = inputs.debris_fragment.value_or(spacetraffic::sc::SatelliteParameters{
            .mass_kg = p.mass_kg / static_cast<double>(debris.count),
            .drag_coefficient = config_.debris_drag_coefficient,
            .cross_sectional_area_m2 = config_.debris_area_m2,
        });
        auto propagated = spacetraffic::propagator::propagate_orbit(
            fragment_initial_state(p), config_.debris_time_step_s, config_.debris_duration_s, fragment,
            {.max_steps = config_.debris_max_steps,
             .cancel = inputs.cancel,
             .reentry_altitude_m = config_.debris_reentry_altitude_m});
        debris.trajectory = std::move(propagated.trajectory);
        debris.propagation_status = propagated.status;
        if (propagated.status != Status::Ok) {
          out.status = propagated.status;
        }
      }
      out.debris = std::move(debris);
      break;
    }
  }

  out.delta = RegimeDelta{
      .new_objects = spacetraffic::traffic::total_objects(out.after) - spacetraffic::traffic::total_objects(out.before),
      .congestion_change = out.after.average_congestion - out.before.average_congestion,
      .risk_change = out.after.collision_probability - out.before.collision_probability,
  };
  out.risk_percent = spacetraffic::traffic::scenario_risk(out.before, out.after, p, config_.risk);
  out.congestion_increase_percent =
      spacetraffic::traffic::congestion_increase_percent(out.before, out.after, scenario.event_type);
  out.secondary_debris_probability = spacetraffic::traffic::secondary_debris_probability(scenario.event_type, p.mass_kg);
  out.risk_level = spacetraffic::traffic::classify_risk_level(out.after.collision_probability, config_.risk);
  out.congestion_impact = spacetraffic::traffic::classify_congestion_impact(out.delta.congestion_change, config_.risk);
  return out;
}

}  // namespace spacetraffic::scenario
