/**
 * @file test_density_estimator.cpp
 * @brief Orbital density estimator tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

#include <spdlog/spdlog.h>

#include "spacetraffic/core/constants.hpp"
#include "spacetraffic/traffic/density_estimator.hpp"

namespace {

bool approx(double a, double b, double rel) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

}  // namespace

int main() {
  using namespace spacetraffic;
  namespace k = core::constants;

  if (traffic::classify_regime(0.0) != traffic::OrbitRegime::LEO ||
      traffic::classify_regime(1999.999) != traffic::OrbitRegime::LEO ||
      traffic::classify_regime(2000.0) != traffic::OrbitRegime::MEO ||
      traffic::classify_regime(35785.999) != traffic::OrbitRegime::MEO ||
      traffic::classify_regime(35786.0) != traffic::OrbitRegime::GEO ||
      traffic::classify_regime(400000.0) != traffic::OrbitRegime::GEO) {
    spdlog::error("regime boundaries mismatch");
    return 1;
  }

  const traffic::TimeWindow epoch0{.start = {0.0}, .end = {k::kSecondsPerDay}};

  const auto peak = traffic::estimate_density(550.0, 53.0, epoch0);
  const double inc_factor = 1.0 - 37.0 / 90.0 * 0.3;
  const double j2_factor = 1.0 + k::kEarthJ2 * std::sin(53.0 * k::kDegToRad);
  const double drag_factor = 1.0 + 450.0 / 1000.0 * 0.2;
  const double expected = 0.45 * inc_factor * 1.0 * j2_factor * drag_factor;
  if (peak.status != core::Status::Ok || peak.regime != traffic::OrbitRegime::LEO ||
      !approx(peak.base_density, 0.45, 1e-15) || !approx(peak.altitude_factor, 1.0, 1e-15) ||
      !approx(peak.inclination_factor, inc_factor, 1e-12) || !approx(peak.factors.drag, drag_factor, 1e-12) ||
      !approx(peak.factors.solar_pressure, 1.0, 1e-15) || !approx(peak.factors.lunar_gravity, 1.0, 1e-15) ||
      !approx(peak.perturbed_density, expected, 1e-12)) {
    spdlog::error("peak LEO density mismatch: {}", peak.perturbed_density);
    return 2;
  }

  // Altitude factor falls off quadratically and floors at zero.
  const auto off_peak = traffic::estimate_density(1050.0, 90.0, epoch0);
  if (!approx(off_peak.altitude_factor, 0.75, 1e-12) || !approx(off_peak.inclination_factor, 1.0, 1e-15)) {
    spdlog::error("off-peak altitude factor mismatch");
    return 3;
  }
  const auto floored = traffic::estimate_density(1800.0, 90.0, epoch0);
  if (floored.status != core::Status::Ok || floored.altitude_factor != 0.0 || floored.perturbed_density != 0.0) {
    spdlog::error("altitude factor should floor at zero");
    return 4;
  }

  const auto meo = traffic::estimate_density(20200.0, 55.0, epoch0);
  if (meo.regime != traffic::OrbitRegime::MEO || !approx(meo.base_density, 0.15, 1e-15) ||
      meo.factors.drag != 1.0 || meo.altitude_factor != 1.0) {
    spdlog::error("MEO density mismatch");
    return 5;
  }

  const auto geo = traffic::estimate_density(35786.0, 0.0, epoch0);
  const double geo_expected = 0.05 * 1.2 * (1.0 - 0.3) * 1.0;
  if (geo.regime != traffic::OrbitRegime::GEO || !approx(geo.altitude_factor, 1.2, 1e-15) ||
      !approx(geo.factors.j2, 1.0, 1e-15) || !approx(geo.perturbed_density, geo_expected, 1e-12)) {
    spdlog::error("GEO density mismatch: {}", geo.perturbed_density);
    return 6;
  }

  // Time factors track the window start.
  const double quarter = k::kSecondsPerDay * std::numbers::pi / 2.0;
  const auto timed = traffic::estimate_density(550.0, 90.0, traffic::TimeWindow{.start = {quarter}, .end = {quarter + 1.0}});
  if (!approx(timed.factors.solar_pressure, 1.05, 1e-12) ||
      !approx(timed.factors.lunar_gravity, 1.0 + 0.02 * std::sin(quarter / k::kSecondsPerMonth), 1e-12)) {
    spdlog::error("time factor mismatch");
    return 7;
  }

  const double nan = std::numeric_limits<double>::quiet_NaN();
  if (traffic::estimate_density(-1.0, 10.0, epoch0).status != core::Status::InvalidInput ||
      traffic::estimate_density(nan, 10.0, epoch0).status != core::Status::InvalidInput ||
      traffic::estimate_density(500.0, nan, epoch0).status != core::Status::InvalidInput ||
      traffic::estimate_density(500.0, 10.0, traffic::TimeWindow{.start = {10.0}, .end = {5.0}}).status !=
          core::Status::InvalidInput) {
    spdlog::error("invalid density input accepted");
    return 8;
  }

  // Output stays normalized across the whole parameter space, even with an inflated base.
  traffic::DensityModelConfig heavy{};
  heavy.leo_base_density = 3.0;
  for (double alt = 0.0; alt <= 40000.0; alt += 250.0) {
    for (double inc = 0.0; inc <= 180.0; inc += 15.0) {
      for (double t : {0.0, 1.0e5, 3.3e7, 1.8e9}) {
        const traffic::TimeWindow w{.start = {t}, .end = {t + k::kSecondsPerDay}};
        const auto nominal = traffic::estimate_density(alt, inc, w);
        const auto inflated = traffic::estimate_density(alt, inc, w, heavy);
        if (nominal.status != core::Status::Ok || nominal.perturbed_density < 0.0 || nominal.perturbed_density > 1.0 ||
            inflated.perturbed_density < 0.0 || inflated.perturbed_density > 1.0) {
          spdlog::error("density out of bounds at alt={} inc={} t={}", alt, inc, t);
          return 9;
        }
      }
    }
  }

  return 0;
}
