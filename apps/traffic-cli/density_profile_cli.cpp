/**
 * @file density_profile_cli.cpp
 * @brief Altitude sweep of the orbital density estimator.
 * @author Watosn
 */

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "spacetraffic/scenario/scenario.hpp"
#include "spacetraffic/traffic/density_estimator.hpp"

int main(int argc, char** argv) {
  if (argc < 6 || argc > 7) {
    spdlog::error("usage: density_profile_cli <output_csv> <alt_min_km> <alt_max_km> <samples> <inc_deg> [epoch_utc_s]");
    return 1;
  }

  const std::filesystem::path output_path = argv[1];
  const auto alt_min = spacetraffic::scenario::parse_number(argv[2]);
  const auto alt_max = spacetraffic::scenario::parse_number(argv[3]);
  const auto samples = spacetraffic::scenario::parse_number(argv[4]);
  const auto inc = spacetraffic::scenario::parse_number(argv[5]);
  const auto epoch = (argc >= 7) ? spacetraffic::scenario::parse_number(argv[6]) : std::optional<double>{0.0};
  if (!alt_min || !alt_max || !samples || !inc || !epoch || *samples < 2.0 || *alt_max < *alt_min) {
    spdlog::error("invalid arguments: need alt_min <= alt_max and samples >= 2");
    return 1;
  }

  std::ofstream out(output_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 2;
  }

  const spacetraffic::traffic::TimeWindow window{.start = {*epoch}, .end = {*epoch + 86400.0}};
  const auto n = static_cast<int>(*samples);
  out << "alt_km,regime,base_density,inclination_factor,altitude_factor,j2_factor,drag_factor,solar_factor,lunar_factor,"
         "perturbed_density,status\n";
  int failures = 0;
  for (int k = 0; k < n; ++k) {
    const double alt = *alt_min + (*alt_max - *alt_min) * static_cast<double>(k) / static_cast<double>(n - 1);
    const auto d = spacetraffic::traffic::estimate_density(alt, *inc, window);
    if (d.status != spacetraffic::core::Status::Ok) {
      ++failures;
    }
    out << fmt::format("{},{},{},{},{},{},{},{},{},{},{}\n", alt, spacetraffic::traffic::to_string(d.regime), d.base_density,
                       d.inclination_factor, d.altitude_factor, d.factors.j2, d.factors.drag, d.factors.solar_pressure,
                       d.factors.lunar_gravity, d.perturbed_density, spacetraffic::core::to_string(d.status));
  }

  if (failures > 0) {
    spdlog::warn("{} of {} samples failed", failures, n);
  }
  return 0;
}
