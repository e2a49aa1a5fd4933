/**
 * @file conjunction.hpp
 * @brief Two-object conjunction probability estimators.
 * @author Watosn
 */
#pragma once

#include <optional>

#include <Eigen/Dense>

#include "spacetraffic/core/types.hpp"

namespace spacetraffic::traffic {

/**
 * @brief Object state at the time of closest approach.
 */
struct ObjectState {
  spacetraffic::core::Vec3 position_m{};
  spacetraffic::core::Vec3 velocity_mps{};
  /// Position covariance (m^2), ECI.
  std::optional<Eigen::Matrix3d> covariance{};
};

/**
 * @brief Conjunction estimator output.
 */
struct ConjunctionAssessment {
  double probability{};
  double miss_distance_m{};
  /// Only populated by the covariance estimator.
  double mahalanobis_distance{};
  spacetraffic::core::Status status{spacetraffic::core::Status::Ok};
};

inline constexpr double kDefaultCombinedRadiusM = 10.0;

/**
 * @brief Distance-only probability.
 *
 * 1 at or inside the combined radius R, exp(-(d - R) / 2R) up to 10R, 0 beyond.
 */
[[nodiscard]] ConjunctionAssessment pairwise_collision_probability(const ObjectState& a,
                                                                   const ObjectState& b,
                                                                   double combined_radius_m = kDefaultCombinedRadiusM);

/**
 * @brief Small-hard-body approximation over the combined position covariance.
 *
 * Pc = min(1, V * exp(-m^2 / 2) / sqrt((2 pi)^3 det C)) with V the hard-body sphere volume and m the
 * Mahalanobis miss distance. Both objects must carry a positive-definite covariance.
 */
[[nodiscard]] ConjunctionAssessment covariance_collision_probability(const ObjectState& a,
                                                                     const ObjectState& b,
                                                                     double hard_body_radius_m = kDefaultCombinedRadiusM);

}  // namespace spacetraffic::traffic
