/**
 * @file two_body.hpp
 * @brief Central-body point-mass gravity.
 * @author Watosn
 */
#pragma once

#include "spacetraffic/core/constants.hpp"
#include "spacetraffic/core/types.hpp"

namespace spacetraffic::forces {

/**
 * @brief Point-mass gravitational acceleration -mu * r / |r|^3.
 */
inline spacetraffic::core::Vec3 two_body_acceleration(const spacetraffic::core::Vec3& position_m,
                                                      double mu_m3_s2 = spacetraffic::core::constants::kEarthMuM3S2) {
  const double r = spacetraffic::core::norm(position_m);
  return (-mu_m3_s2 / (r * r * r)) * position_m;
}

}  // namespace spacetraffic::forces
