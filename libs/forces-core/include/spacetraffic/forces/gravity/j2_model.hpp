/**
 * @file j2_model.hpp
 * @brief Earth oblateness (J2) perturbation.
 * @author Watosn
 */
#pragma once

#include "spacetraffic/core/constants.hpp"
#include "spacetraffic/core/types.hpp"

namespace spacetraffic::forces {

/**
 * @brief J2 model constants.
 */
struct J2Config {
  double mu_m3_s2{spacetraffic::core::constants::kEarthMuM3S2};
  double radius_m{spacetraffic::core::constants::kEarthEquatorialRadiusM};
  double j2{spacetraffic::core::constants::kEarthJ2};
};

/**
 * @brief Closed-form J2 acceleration in the inertial frame.
 *
 * Only the state's position is used. At r = 0 the result is non-finite.
 */
[[nodiscard]] spacetraffic::core::Vec3 j2_acceleration(const spacetraffic::core::StateVector& state,
                                                       const J2Config& config = {});

}  // namespace spacetraffic::forces
