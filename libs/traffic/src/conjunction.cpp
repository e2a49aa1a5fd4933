/**
 * @file conjunction.cpp
 * @brief Two-object conjunction probability estimators implementation.
 * @author Watosn
 */

#include "spacetraffic/traffic/conjunction.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include "spacetraffic/core/math_utils.hpp"

namespace spacetraffic::traffic {

using spacetraffic::core::Status;

ConjunctionAssessment pairwise_collision_probability(const ObjectState& a,
                                                     const ObjectState& b,
                                                     double combined_radius_m) {
  if (!std::isfinite(combined_radius_m) || combined_radius_m <= 0.0 || !spacetraffic::core::is_finite(a.position_m) ||
      !spacetraffic::core::is_finite(b.position_m)) {
    return ConjunctionAssessment{.status = Status::InvalidInput};
  }

  const double d = spacetraffic::core::norm(a.position_m - b.position_m);
  double p = 0.0;
  if (d <= combined_radius_m) {
    p = 1.0;
  } else if (d < 10.0 * combined_radius_m) {
    p = std::exp(-(d - combined_radius_m) / (2.0 * combined_radius_m));
  }
  return ConjunctionAssessment{.probability = p, .miss_distance_m = d, .status = Status::Ok};
}

ConjunctionAssessment covariance_collision_probability(const ObjectState& a,
                                                       const ObjectState& b,
                                                       double hard_body_radius_m) {
  if (!a.covariance || !b.covariance || !std::isfinite(hard_body_radius_m) || hard_body_radius_m <= 0.0 ||
      !spacetraffic::core::is_finite(a.position_m) || !spacetraffic::core::is_finite(b.position_m)) {
    return ConjunctionAssessment{.status = Status::InvalidInput};
  }

  const Eigen::Matrix3d combined = *a.covariance + *b.covariance;
  if (!combined.allFinite()) {
    return ConjunctionAssessment{.status = Status::InvalidInput};
  }
  const Eigen::LLT<Eigen::Matrix3d> llt(combined);
  if (llt.info() != Eigen::Success) {
    return ConjunctionAssessment{.status = Status::InvalidInput};
  }

  const Eigen::Vector3d miss = spacetraffic::core::to_eigen(b.position_m - a.position_m);
  const double m2 = miss.dot(llt.solve(miss));
  const double sqrt_det = llt.matrixL().toDenseMatrix().diagonal().prod();
  const double two_pi = 2.0 * std::numbers::pi;
  const double volume = 4.0 / 3.0 * std::numbers::pi * hard_body_radius_m * hard_body_radius_m * hard_body_radius_m;
  const double density = std::exp(-0.5 * m2) / (std::sqrt(two_pi * two_pi * two_pi) * sqrt_det);

  return ConjunctionAssessment{.probability = std::min(1.0, volume * density),
                               .miss_distance_m = miss.norm(),
                               .mahalanobis_distance = std::sqrt(std::max(0.0, m2)),
                               .status = Status::Ok};
}

}  // namespace spacetraffic::traffic
