/**
 * @file scenario_cli.cpp
 * @brief Single-scenario evaluation command-line entrypoint.
 * @author Watosn
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "spacetraffic/scenario/evaluator.hpp"
#include "spacetraffic/weather/celestrak_kp_feed.hpp"
#include "spacetraffic/weather/static_feed.hpp"

namespace {

std::vector<spacetraffic::weather::NearEarthObjectRecord> synthetic_approaches(std::int64_t count,
                                                                               const spacetraffic::core::Epoch& day) {
  std::vector<spacetraffic::weather::NearEarthObjectRecord> out;
  for (std::int64_t i = 0; i < count; ++i) {
    out.push_back({.designation = fmt::format("neo-{}", i + 1), .close_approach = day, .miss_distance_km = 0.0, .hazardous = false});
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 7 || argc > 9) {
    spdlog::error("usage: scenario_cli <event> <alt_km> <inc_deg> <vel_kms> <mass_kg> <launch_time> [kp_csv] [neo_count]");
    spdlog::error("event: launch | adjustment | breakup");
    spdlog::error("launch_time: YYYY-MM-DD, YYYY-MM-DDThh:mm:ssZ or UTC seconds");
    spdlog::error("kp_csv: CelesTrak SW-Last5Years.csv (optional)");
    return 1;
  }

  const auto parsed = spacetraffic::scenario::parse_scenario(argv[1], argv[2], argv[3], argv[4], argv[5], argv[6]);
  if (parsed.issue.status != spacetraffic::core::Status::Ok) {
    spdlog::error("invalid scenario ({}): {}", spacetraffic::scenario::to_string(parsed.issue.field), parsed.issue.message);
    return 2;
  }
  const auto& scenario = parsed.scenario;
  const auto now = scenario.parameters.launch_time;

  const std::string kp_csv = (argc >= 8) ? argv[7] : "";
  std::int64_t neo_count = 0;
  if (argc >= 9) {
    const auto n = spacetraffic::scenario::parse_number(argv[8]);
    if (!n || *n < 0.0) {
      spdlog::error("neo_count must be a non-negative number");
      return 1;
    }
    neo_count = static_cast<std::int64_t>(*n);
  }

  std::unique_ptr<spacetraffic::weather::ISpaceWeatherFeed> weather{};
  if (!kp_csv.empty()) {
    weather = spacetraffic::weather::CelesTrakKpCsvFeed::Create({.csv_file = kp_csv});
  }
  const spacetraffic::weather::StaticNearEarthObjectFeed neo(synthetic_approaches(neo_count, now));

  const auto environment = spacetraffic::weather::gather_environment(weather.get(), &neo, now);
  if (!environment.storm_data_available) {
    spdlog::warn("geomagnetic storm data unavailable, using storm multiplier 1.0");
  }

  const spacetraffic::scenario::ScenarioEvaluator evaluator{};
  const auto r = evaluator.evaluate(scenario, {.reference_time = now, .environment = environment});
  if (r.status == spacetraffic::core::Status::InvalidInput) {
    spdlog::error("scenario evaluation failed: {}", r.validation.message);
    return 3;
  }

  const auto print_state = [](const char* label, const spacetraffic::traffic::OrbitalRegimeState& s) {
    fmt::print("{}: leo={} meo={} geo={} congestion={:.6f} collision_probability={:.6e}\n", label, s.objects_in_leo,
               s.objects_in_meo, s.objects_in_geo, s.average_congestion, s.collision_probability);
  };

  fmt::print("event={} regime={} storm_multiplier={} asteroid_influence={}\n",
             spacetraffic::traffic::to_string(scenario.event_type), spacetraffic::traffic::to_string(r.density.regime),
             environment.storm_multiplier, environment.asteroid_influence);
  fmt::print("base_density={} perturbed_density={:.6f}\n", r.density.base_density, r.density.perturbed_density);
  print_state("before", r.before);
  print_state("after", r.after);
  fmt::print("delta: new_objects={} congestion_change={:.6f} risk_change={:.6e}\n", r.delta.new_objects,
             r.delta.congestion_change, r.delta.risk_change);
  fmt::print("risk_percent={:.2f} congestion_increase_percent={:.3f} secondary_debris_probability={:.2f}\n",
             r.risk_percent, r.congestion_increase_percent, r.secondary_debris_probability);
  fmt::print("risk_level={} congestion_impact={}\n", spacetraffic::traffic::to_string(r.risk_level),
             spacetraffic::traffic::to_string(r.congestion_impact));
  if (r.debris) {
    fmt::print("debris: count={} leo={} meo={} geo={} trajectory_points={} propagation={}\n", r.debris->count,
               r.debris->allocation.leo, r.debris->allocation.meo, r.debris->allocation.geo, r.debris->trajectory.size(),
               spacetraffic::core::to_string(r.debris->propagation_status));
  }

  if (r.status != spacetraffic::core::Status::Ok) {
    spdlog::warn("evaluation completed with status {}", spacetraffic::core::to_string(r.status));
    return 4;
  }
  return 0;
}
