/**
 * @file scenario_batch_cli.cpp
 * @brief Batch scenario runner with CSV/JSON outputs.
 * @author Watosn
 */

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "spacetraffic/core/text_utils.hpp"
#include "spacetraffic/scenario/evaluator.hpp"
#include "spacetraffic/weather/celestrak_kp_feed.hpp"
#include "spacetraffic/weather/static_feed.hpp"

namespace {

std::vector<std::string> split_row(const std::string& line) {
  std::vector<std::string> fields;
  std::stringstream ss(line);
  std::string tok;
  while (std::getline(ss, tok, ',')) {
    fields.push_back(tok);
  }
  return fields;
}

std::vector<spacetraffic::weather::NearEarthObjectRecord> synthetic_approaches(std::int64_t count,
                                                                               const spacetraffic::core::Epoch& day) {
  std::vector<spacetraffic::weather::NearEarthObjectRecord> out;
  for (std::int64_t i = 0; i < count; ++i) {
    out.push_back({.designation = "neo-" + std::to_string(i + 1), .close_approach = day});
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 4 || argc > 6) {
    spdlog::error("usage: scenario_batch_cli <input_csv> <output_file> <format:csv|json> [kp_csv] [neo_count]");
    spdlog::error("input row: event,alt_km,inc_deg,vel_kms,mass_kg,launch_time");
    return 1;
  }

  const std::filesystem::path input_path = argv[1];
  const std::filesystem::path output_path = argv[2];
  const std::string format = argv[3];
  const std::string kp_csv = (argc >= 5) ? argv[4] : "";
  std::int64_t neo_count = 0;
  if (argc >= 6) {
    const auto n = spacetraffic::scenario::parse_number(argv[5]);
    if (!n || *n < 0.0) {
      spdlog::error("neo_count must be a non-negative number");
      return 1;
    }
    neo_count = static_cast<std::int64_t>(*n);
  }
  if (format != "csv" && format != "json") {
    spdlog::error("format must be csv or json");
    return 4;
  }

  std::ifstream in(input_path);
  if (!in) {
    spdlog::error("failed to open input csv: {}", input_path.string());
    return 2;
  }
  std::ofstream out(output_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 3;
  }

  std::unique_ptr<spacetraffic::weather::ISpaceWeatherFeed> weather{};
  if (!kp_csv.empty()) {
    auto feed = spacetraffic::weather::CelesTrakKpCsvFeed::Create({.csv_file = kp_csv});
    if (feed->sample_count() == 0U) {
      spdlog::warn("no Kp samples read from {}, storm multiplier defaults to 1.0", kp_csv);
    }
    weather = std::move(feed);
  }

  const spacetraffic::scenario::ScenarioEvaluator evaluator{};

  std::time_t now = std::time(nullptr);
  if (format == "csv") {
    out << "#record_type=metadata,schema=scenario_batch_v1,project=spacetraffic,generated_unix_utc=" << now
        << ",kp_csv=" << kp_csv << ",neo_count=" << neo_count << "\n";
    out << "row,event,alt_km,regime,before_leo,before_meo,before_geo,before_congestion,before_probability,"
           "after_leo,after_meo,after_geo,after_congestion,after_probability,new_objects,congestion_change,risk_change,"
           "risk_percent,congestion_increase_percent,secondary_debris_probability,risk_level,congestion_impact,"
           "debris_count,status\n";
  } else {
    out << "{\"record_type\":\"metadata\",\"schema\":\"scenario_batch_v1\",\"project\":\"spacetraffic\","
           "\"generated_unix_utc\":" << now << ",\"kp_csv\":\"" << spacetraffic::core::json_escape(kp_csv) << "\",\"neo_count\":" << neo_count << "}\n";
  }

  std::string line;
  std::size_t line_no = 0;
  std::size_t evaluated = 0;
  std::size_t skipped = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto fields = split_row(line);
    if (fields.size() != 6U) {
      spdlog::warn("skipping malformed row {}", line_no);
      ++skipped;
      continue;
    }
    const auto parsed = spacetraffic::scenario::parse_scenario(fields[0], fields[1], fields[2], fields[3], fields[4], fields[5]);
    if (parsed.issue.status != spacetraffic::core::Status::Ok) {
      if (line_no == 1 && line.find("event") != std::string::npos) {
        continue;
      }
      spdlog::warn("skipping row {}: {}", line_no, parsed.issue.message);
      ++skipped;
      continue;
    }

    const auto& p = parsed.scenario.parameters;
    const spacetraffic::weather::StaticNearEarthObjectFeed neo(synthetic_approaches(neo_count, p.launch_time));
    const auto environment = spacetraffic::weather::gather_environment(weather.get(), &neo, p.launch_time);
    const auto r = evaluator.evaluate(parsed.scenario, {.reference_time = p.launch_time, .environment = environment});
    if (r.status == spacetraffic::core::Status::InvalidInput) {
      spdlog::warn("skipping row {}: {}", line_no, r.validation.message);
      ++skipped;
      continue;
    }
    ++evaluated;

    const auto event = spacetraffic::traffic::to_string(parsed.scenario.event_type);
    const auto regime = spacetraffic::traffic::to_string(r.density.regime);
    const auto risk_level = spacetraffic::traffic::to_string(r.risk_level);
    const auto impact = spacetraffic::traffic::to_string(r.congestion_impact);
    const auto status = spacetraffic::core::to_string(r.status);
    const std::int64_t debris_count = r.debris ? r.debris->count : 0;

    if (format == "json") {
      out << "{\"record_type\":\"scenario\",\"schema\":\"scenario_batch_v1\",\"row\":" << line_no << ",\"event\":\""
          << event << "\",\"alt_km\":" << p.altitude_km << ",\"regime\":\"" << regime << "\",\"before\":{\"leo\":"
          << r.before.objects_in_leo << ",\"meo\":" << r.before.objects_in_meo << ",\"geo\":" << r.before.objects_in_geo
          << ",\"congestion\":" << r.before.average_congestion << ",\"probability\":" << r.before.collision_probability
          << "},\"after\":{\"leo\":" << r.after.objects_in_leo << ",\"meo\":" << r.after.objects_in_meo
          << ",\"geo\":" << r.after.objects_in_geo << ",\"congestion\":" << r.after.average_congestion
          << ",\"probability\":" << r.after.collision_probability << "},\"new_objects\":" << r.delta.new_objects
          << ",\"congestion_change\":" << r.delta.congestion_change << ",\"risk_change\":" << r.delta.risk_change
          << ",\"risk_percent\":" << r.risk_percent << ",\"congestion_increase_percent\":" << r.congestion_increase_percent
          << ",\"secondary_debris_probability\":" << r.secondary_debris_probability << ",\"risk_level\":\"" << risk_level
          << "\",\"congestion_impact\":\"" << impact << "\",\"debris_count\":" << debris_count << ",\"status\":\""
          << status << "\"}\n";
    } else {
      out << line_no << "," << event << "," << p.altitude_km << "," << regime << "," << r.before.objects_in_leo << ","
          << r.before.objects_in_meo << "," << r.before.objects_in_geo << "," << r.before.average_congestion << ","
          << r.before.collision_probability << "," << r.after.objects_in_leo << "," << r.after.objects_in_meo << ","
          << r.after.objects_in_geo << "," << r.after.average_congestion << "," << r.after.collision_probability << ","
          << r.delta.new_objects << "," << r.delta.congestion_change << "," << r.delta.risk_change << ","
          << r.risk_percent << "," << r.congestion_increase_percent << "," << r.secondary_debris_probability << ","
          << risk_level << "," << impact << "," << debris_count << "," << status << "\n";
    }
  }

  spdlog::info("evaluated {} scenarios, skipped {}", evaluated, skipped);
  return 0;
}
