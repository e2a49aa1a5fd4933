/**
 * @file trajectory_cli.cpp
 * @brief Orbit propagation from Keplerian elements to a CSV trajectory.
 * @author Watosn
 */

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "spacetraffic/forces/gravity/j2_perturbation.hpp"
#include "spacetraffic/forces/surface/drag/drag_perturbation.hpp"
#include "spacetraffic/models/exponential_atmosphere.hpp"
#include "spacetraffic/orbit/conversions.hpp"
#include "spacetraffic/propagator/propagator.hpp"
#include "spacetraffic/scenario/scenario.hpp"

namespace {

std::atomic<bool> g_cancel{false};

extern "C" void on_interrupt(int /*signal*/) { g_cancel.store(true); }

}  // namespace

int main(int argc, char** argv) {
  if (argc < 10 || argc > 11) {
    spdlog::error("usage: trajectory_cli <output_csv> <a_km> <e> <i_deg> <raan_deg> <argp_deg> <nu_deg> <dt_s> <duration_s> [euler|rk4]");
    return 1;
  }

  double values[8]{};
  for (int i = 0; i < 8; ++i) {
    const auto v = spacetraffic::scenario::parse_number(argv[i + 2]);
    if (!v) {
      spdlog::error("argument {} is not a number: {}", i + 2, argv[i + 2]);
      return 1;
    }
    values[i] = *v;
  }
  const std::filesystem::path output_path = argv[1];
  const std::string stepper_name = (argc >= 11) ? argv[10] : "euler";
  if (stepper_name != "euler" && stepper_name != "rk4") {
    spdlog::error("stepper must be euler or rk4");
    return 1;
  }

  const spacetraffic::orbit::OrbitalElements elements{.semi_major_axis_km = values[0],
                                                      .eccentricity = values[1],
                                                      .inclination_deg = values[2],
                                                      .raan_deg = values[3],
                                                      .arg_perigee_deg = values[4],
                                                      .true_anomaly_deg = values[5]};
  const auto initial = spacetraffic::orbit::to_cartesian(elements);
  if (initial.status != spacetraffic::core::Status::Ok) {
    spdlog::error("element conversion failed: {}", spacetraffic::core::to_string(initial.status));
    return 2;
  }

  const spacetraffic::models::ExponentialAtmosphereModel atmosphere{};
  spacetraffic::forces::PerturbationStack stack;
  stack.add(std::make_unique<spacetraffic::forces::J2PerturbationModel>());
  stack.add(std::make_unique<spacetraffic::forces::DragPerturbationModel>(atmosphere));

  std::unique_ptr<spacetraffic::propagator::IStepper> stepper{};
  if (stepper_name == "rk4") {
    stepper = std::make_unique<spacetraffic::propagator::Rk4Stepper>();
  } else {
    stepper = std::make_unique<spacetraffic::propagator::SemiImplicitEulerStepper>();
  }

  const spacetraffic::sc::SatelliteParameters sat{.mass_kg = 260.0, .drag_coefficient = 2.2, .cross_sectional_area_m2 = 2.0};
  std::signal(SIGINT, on_interrupt);

  const spacetraffic::propagator::OrbitPropagator propagator(stack, *stepper);
  const auto result = propagator.propagate(initial.state, values[6], values[7], sat, {.cancel = &g_cancel});
  if (result.status == spacetraffic::core::Status::InvalidInput) {
    spdlog::error("propagation rejected: check step, duration and step limit");
    return 3;
  }

  std::ofstream out(output_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 4;
  }
  out << "t_s,x_m,y_m,z_m,vx_mps,vy_mps,vz_mps,a_km,e,i_deg\n";
  for (const auto& point : result.trajectory) {
    const auto osc = spacetraffic::orbit::to_keplerian(point.state);
    const auto& s = point.state;
    out << fmt::format("{},{},{},{},{},{},{},{},{},{}\n", point.simulation_time_s, s.position_m.x, s.position_m.y,
                       s.position_m.z, s.velocity_mps.x, s.velocity_mps.y, s.velocity_mps.z,
                       osc.elements.semi_major_axis_km, osc.elements.eccentricity, osc.elements.inclination_deg);
  }

  if (result.status != spacetraffic::core::Status::Ok) {
    spdlog::warn("propagation stopped after {} steps: {}", result.steps_taken, spacetraffic::core::to_string(result.status));
    return 5;
  }
  spdlog::info("wrote {} trajectory points to {}", result.trajectory.size(), output_path.string());
  return 0;
}
