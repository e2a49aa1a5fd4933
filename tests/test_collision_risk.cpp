/**
 * @file test_collision_risk.cpp
 * @brief Risk scoring and conjunction estimator tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include "spacetraffic/traffic/collision_risk.hpp"
#include "spacetraffic/traffic/conjunction.hpp"

namespace {

bool approx(double a, double b, double rel) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

spacetraffic::traffic::ObjectState at(double x, double y, double z) {
  return spacetraffic::traffic::ObjectState{.position_m = {x, y, z}};
}

}  // namespace

int main() {
  using namespace spacetraffic;

  const traffic::OrbitalRegimeState before{
      .objects_in_leo = 3240, .objects_in_meo = 500, .objects_in_geo = 2000, .average_congestion = 0.42, .collision_probability = 0.0031};
  traffic::OrbitalRegimeState after = before;
  after.average_congestion = 0.4242;

  const traffic::ScenarioParameters leo{.altitude_km = 550.0, .inclination_deg = 53.0, .velocity_kms = 7.6, .mass_kg = 260.0};
  const double expected = 0.4242 * 50.0 + 15.0 + std::sin(53.0 * std::numbers::pi / 180.0) * 10.0 + 7.6 / 7.8 * 15.0 +
                          260.0 / 1000.0 * 5.0;
  if (!approx(traffic::scenario_risk(before, after, leo), expected, 1e-12)) {
    spdlog::error("scenario risk mismatch: {}", traffic::scenario_risk(before, after, leo));
    return 1;
  }

  // Worst case hits the cap.
  traffic::OrbitalRegimeState saturated = after;
  saturated.average_congestion = 1.0;
  const traffic::ScenarioParameters heavy{.altitude_km = 300.0, .inclination_deg = 90.0, .velocity_kms = 20.0, .mass_kg = 10000.0};
  if (traffic::scenario_risk(before, saturated, heavy) != 95.0) {
    spdlog::error("risk should cap at 95");
    return 2;
  }

  for (double c : {0.0, 0.3, 1.0, 1.7}) {
    for (double alt : {200.0, 700.0, 1500.0, 20000.0, 36000.0}) {
      for (double inc : {0.0, 45.0, 98.0, 180.0}) {
        for (double v : {0.1, 7.8, 30.0}) {
          for (double m : {1.0, 1000.0, 50000.0}) {
            traffic::OrbitalRegimeState s = after;
            s.average_congestion = c;
            const double r = traffic::scenario_risk(before, s,
                                                    traffic::ScenarioParameters{.altitude_km = alt, .inclination_deg = inc, .velocity_kms = v, .mass_kg = m});
            if (!(r >= 0.0 && r <= 95.0)) {
              spdlog::error("risk out of bounds: {}", r);
              return 3;
            }
          }
        }
      }
    }
  }

  if (!approx(traffic::regime_collision_probability(0.5, 7.5, 2000.0), 0.5 * 0.001 * 0.75 * 2.0, 1e-12) ||
      !approx(traffic::regime_collision_probability(0.5, 50.0, 1.0e6), 0.5 * 0.001 * 2.0 * 5.0, 1e-12) ||
      traffic::regime_collision_probability(0.0, 7.5, 2000.0) != 0.0) {
    spdlog::error("regime probability mismatch");
    return 4;
  }

  traffic::OrbitalRegimeState b0{.average_congestion = 0.1};
  traffic::OrbitalRegimeState b1{.average_congestion = 0.11};
  if (!approx(traffic::congestion_increase_percent(b0, b1, traffic::EventType::Breakup), 30.0, 1e-9) ||
      !approx(traffic::congestion_increase_percent(before, after, traffic::EventType::Launch), 1.5, 1e-9) ||
      traffic::congestion_increase_percent(b0, b0, traffic::EventType::Adjustment) != 0.0 ||
      traffic::congestion_increase_percent(b1, b0, traffic::EventType::Launch) != 0.0) {
    spdlog::error("congestion increase mismatch");
    return 5;
  }
  const traffic::OrbitalRegimeState empty{};
  traffic::OrbitalRegimeState little{.average_congestion = 0.02};
  if (!approx(traffic::congestion_increase_percent(empty, little, traffic::EventType::Adjustment), 2.0, 1e-9)) {
    spdlog::error("zero baseline congestion increase mismatch");
    return 6;
  }

  if (!approx(traffic::secondary_debris_probability(traffic::EventType::Breakup, 2000.0), 50.0, 1e-12) ||
      traffic::secondary_debris_probability(traffic::EventType::Breakup, 5000.0) != 95.0 ||
      !approx(traffic::secondary_debris_probability(traffic::EventType::Launch, 260.0), 0.52, 1e-12) ||
      traffic::secondary_debris_probability(traffic::EventType::Adjustment, 10000.0) != 10.0) {
    spdlog::error("secondary debris probability mismatch");
    return 7;
  }

  if (traffic::classify_risk_level(0.011) != traffic::ImpactLevel::High ||
      traffic::classify_risk_level(0.01) != traffic::ImpactLevel::Medium ||
      traffic::classify_risk_level(0.006) != traffic::ImpactLevel::Medium ||
      traffic::classify_risk_level(0.005) != traffic::ImpactLevel::Low ||
      traffic::classify_congestion_impact(0.2) != traffic::ImpactLevel::High ||
      traffic::classify_congestion_impact(0.1) != traffic::ImpactLevel::Medium ||
      traffic::classify_congestion_impact(0.05) != traffic::ImpactLevel::Low ||
      traffic::to_string(traffic::ImpactLevel::Medium) != "medium") {
    spdlog::error("impact classification mismatch");
    return 8;
  }

  const auto origin = at(0.0, 0.0, 0.0);
  const auto touching = traffic::pairwise_collision_probability(origin, at(10.0, 0.0, 0.0));
  const auto near = traffic::pairwise_collision_probability(origin, at(0.0, 50.0, 0.0));
  const auto edge = traffic::pairwise_collision_probability(origin, at(0.0, 0.0, 100.0));
  if (touching.status != core::Status::Ok || touching.probability != 1.0 ||
      traffic::pairwise_collision_probability(origin, origin).probability != 1.0 ||
      !approx(near.probability, std::exp(-2.0), 1e-12) || !approx(near.miss_distance_m, 50.0, 1e-15) ||
      edge.probability != 0.0) {
    spdlog::error("pairwise probability mismatch");
    return 9;
  }
  double last = 2.0;
  for (double d = 0.0; d <= 200.0; d += 0.5) {
    const double p = traffic::pairwise_collision_probability(origin, at(d, 0.0, 0.0)).probability;
    if (p > last || p < 0.0 || p > 1.0) {
      spdlog::error("pairwise probability not monotonic at d={}", d);
      return 10;
    }
    last = p;
  }
  if (traffic::pairwise_collision_probability(origin, at(5.0, 0.0, 0.0), 0.0).status != core::Status::InvalidInput ||
      traffic::pairwise_collision_probability(origin, at(std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0)).status !=
          core::Status::InvalidInput) {
    spdlog::error("invalid pairwise input accepted");
    return 11;
  }

  traffic::ObjectState a = origin;
  traffic::ObjectState b = at(10.0, 0.0, 0.0);
  a.covariance = Eigen::Matrix3d::Identity() * 100.0;
  b.covariance = Eigen::Matrix3d::Identity() * 100.0;
  const auto cov = traffic::covariance_collision_probability(a, b);
  const double two_pi = 2.0 * std::numbers::pi;
  const double pc_expected = 4.0 / 3.0 * std::numbers::pi * 1000.0 * std::exp(-0.25) /
                             (std::sqrt(two_pi * two_pi * two_pi) * std::pow(200.0, 1.5));
  if (cov.status != core::Status::Ok || !approx(cov.mahalanobis_distance, 10.0 / std::sqrt(200.0), 1e-12) ||
      !approx(cov.probability, pc_expected, 1e-10) || !approx(cov.miss_distance_m, 10.0, 1e-15)) {
    spdlog::error("covariance probability mismatch: {}", cov.probability);
    return 12;
  }

  // Tight covariance saturates at 1.
  a.covariance = Eigen::Matrix3d::Identity() * 1.0e-2;
  b.covariance = Eigen::Matrix3d::Identity() * 1.0e-2;
  if (traffic::covariance_collision_probability(a, at(0.0, 0.0, 0.0)).status != core::Status::InvalidInput ||
      traffic::covariance_collision_probability(a, a).probability != 1.0) {
    spdlog::error("covariance saturation mismatch");
    return 13;
  }

  b.covariance = Eigen::Matrix3d::Zero();
  traffic::ObjectState c = at(1.0, 0.0, 0.0);
  c.covariance = Eigen::Matrix3d::Zero();
  if (traffic::covariance_collision_probability(c, b).status != core::Status::InvalidInput) {
    spdlog::error("singular covariance accepted");
    return 14;
  }

  return 0;
}
