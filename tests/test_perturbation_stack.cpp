/**
 * @file test_perturbation_stack.cpp
 * @brief Generic perturbation interface and J2 tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "spacetraffic/core/constants.hpp"
#include "spacetraffic/forces/gravity/j2_model.hpp"
#include "spacetraffic/forces/gravity/j2_perturbation.hpp"
#include "spacetraffic/forces/gravity/two_body.hpp"
#include "spacetraffic/forces/perturbation.hpp"
#include "spacetraffic/forces/surface/drag/drag_model.hpp"
#include "spacetraffic/forces/surface/drag/drag_perturbation.hpp"
#include "spacetraffic/models/exponential_atmosphere.hpp"
#include "spacetraffic/sc/spacecraft.hpp"

namespace {

bool approx(double a, double b, double rel = 1e-12) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

class ConstantPerturbation final : public spacetraffic::forces::IPerturbationModel {
 public:
  ConstantPerturbation(spacetraffic::core::Vec3 a, const char* name) : a_(a), name_(name) {}

  [[nodiscard]] spacetraffic::forces::PerturbationContribution evaluate(
      const spacetraffic::forces::PerturbationRequest& /*request*/) const override {
    return spacetraffic::forces::PerturbationContribution{
        .name = name_, .type = spacetraffic::forces::PerturbationType::Unknown, .acceleration_mps2 = a_, .status = spacetraffic::core::Status::Ok};
  }

 private:
  spacetraffic::core::Vec3 a_{};
  std::string name_{};
};

}  // namespace

int main() {
  using namespace spacetraffic;
  namespace k = core::constants;

  const double r = 7000.0e3;
  const double j2_scale = 1.5 * k::kEarthJ2 * k::kEarthMuM3S2 * k::kEarthEquatorialRadiusM * k::kEarthEquatorialRadiusM /
                          (r * r * r * r);

  // Equatorial point: J2 strengthens gravity radially, no out-of-plane term.
  const core::StateVector equator{.position_m = {r, 0.0, 0.0}, .velocity_mps = {0.0, 7546.0, 0.0}};
  const auto a_eq = forces::j2_acceleration(equator);
  if (!approx(a_eq.x, -j2_scale) || a_eq.y != 0.0 || a_eq.z != 0.0) {
    spdlog::error("equatorial j2 mismatch: ax={}", a_eq.x);
    return 1;
  }

  // Polar point: J2 weakens gravity along the axis.
  const core::StateVector pole{.position_m = {0.0, 0.0, r}};
  const auto a_pole = forces::j2_acceleration(pole);
  if (!approx(a_pole.z, 2.0 * j2_scale) || a_pole.x != 0.0 || a_pole.y != 0.0) {
    spdlog::error("polar j2 mismatch: az={}", a_pole.z);
    return 2;
  }

  // Velocity never enters the J2 term.
  core::StateVector moving = equator;
  moving.velocity_mps = core::Vec3{-100.0, 3.0, 9000.0};
  const auto a_moving = forces::j2_acceleration(moving);
  if (a_moving.x != a_eq.x || a_moving.y != a_eq.y || a_moving.z != a_eq.z) {
    spdlog::error("j2 should not depend on velocity");
    return 3;
  }

  const auto g = forces::two_body_acceleration(equator.position_m);
  if (!approx(g.x, -k::kEarthMuM3S2 / (r * r)) || !(std::abs(a_eq.x / g.x) < 2e-3)) {
    spdlog::error("two-body reference mismatch");
    return 4;
  }

  const models::ExponentialAtmosphereModel atmosphere(3.0e-11, 400e3, 65e3);
  const sc::SatelliteParameters sat{.mass_kg = 600.0, .drag_coefficient = 2.25, .cross_sectional_area_m2 = 4.0};
  core::StateVector state{};
  state.position_m = core::Vec3{k::kEarthMeanRadiusM + 400.0e3, 0.0, 0.0};
  state.velocity_mps = core::Vec3{0.0, 7670.0, 0.0};

  const forces::DragAccelerationModel drag_direct(atmosphere);
  const auto direct = drag_direct.evaluate(state, sat);
  if (direct.status != core::Status::Ok) {
    spdlog::error("direct drag failed");
    return 5;
  }

  forces::PerturbationStack stack;
  stack.add(std::make_unique<forces::DragPerturbationModel>(atmosphere, forces::DragConfig{}, &sat, "drag_main"));
  stack.add(std::make_unique<forces::J2PerturbationModel>());
  stack.add(std::make_unique<ConstantPerturbation>(core::Vec3{1.0e-9, -2.0e-9, 3.0e-9}, "bias"));
  stack.add(nullptr);

  const auto result = stack.evaluate(forces::PerturbationRequest{.state = state, .satellite = &sat});
  if (result.status != core::Status::Ok || result.contributions.size() != 3U || stack.size() != 3U) {
    spdlog::error("stack evaluation failed");
    return 6;
  }
  if (result.contributions[0].name != "drag_main" || result.contributions[0].type != forces::PerturbationType::Drag ||
      result.contributions[1].type != forces::PerturbationType::Gravity) {
    spdlog::error("contribution metadata mismatch");
    return 7;
  }
  if (!approx(result.contributions[0].acceleration_mps2.y, direct.acceleration_mps2.y)) {
    spdlog::error("drag contribution mismatch");
    return 8;
  }

  const auto j2_here = forces::j2_acceleration(state);
  const core::Vec3 expected_total = direct.acceleration_mps2 + j2_here + core::Vec3{1.0e-9, -2.0e-9, 3.0e-9};
  if (!approx(result.total_acceleration_mps2.x, expected_total.x) ||
      !approx(result.total_acceleration_mps2.y, expected_total.y) ||
      !approx(result.total_acceleration_mps2.z, expected_total.z)) {
    spdlog::error("total acceleration mismatch");
    return 9;
  }

  const forces::DragPerturbationModel drag_no_default(atmosphere, forces::DragConfig{}, nullptr, "drag_nodefault");
  const auto missing_sat = drag_no_default.evaluate(forces::PerturbationRequest{.state = state, .satellite = nullptr});
  if (missing_sat.status != core::Status::InvalidInput) {
    spdlog::error("missing satellite should fail");
    return 10;
  }

  forces::PerturbationStack failing;
  failing.add(std::make_unique<forces::DragPerturbationModel>(atmosphere));
  failing.add(std::make_unique<forces::J2PerturbationModel>());
  const auto failed = failing.evaluate(forces::PerturbationRequest{.state = state});
  if (failed.status != core::Status::InvalidInput || failed.contributions.size() != 2U) {
    spdlog::error("stack should report the first failing contribution");
    return 11;
  }
  // Failed contributions stay out of the total.
  if (!approx(failed.total_acceleration_mps2.x, j2_here.x) || failed.total_acceleration_mps2.y != j2_here.y) {
    spdlog::error("failed drag contribution leaked into the total");
    return 12;
  }

  const double nan = std::numeric_limits<double>::quiet_NaN();
  forces::PerturbationStack unstable;
  unstable.add(std::make_unique<ConstantPerturbation>(core::Vec3{1.0e-6, 0.0, 0.0}, "steady"));
  unstable.add(std::make_unique<ConstantPerturbation>(core::Vec3{nan, 0.0, 0.0}, "unstable"));
  unstable.add(std::make_unique<ConstantPerturbation>(core::Vec3{0.0, 2.0e-6, 0.0}, "late"));
  const auto flagged = unstable.evaluate(forces::PerturbationRequest{.state = state, .satellite = &sat});
  if (flagged.status != core::Status::NumericalError || flagged.contributions.size() != 3U ||
      flagged.contributions[0].status != core::Status::Ok ||
      flagged.contributions[1].status != core::Status::NumericalError ||
      flagged.contributions[2].status != core::Status::Ok) {
    spdlog::error("non-finite contribution should be flagged as a numerical error");
    return 13;
  }
  if (!core::is_finite(flagged.total_acceleration_mps2) || flagged.total_acceleration_mps2.x != 1.0e-6 ||
      flagged.total_acceleration_mps2.y != 2.0e-6) {
    spdlog::error("total should sum only the healthy contributions");
    return 14;
  }

  return 0;
}
