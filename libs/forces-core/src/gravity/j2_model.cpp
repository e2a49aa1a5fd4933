/**
 * @file j2_model.cpp
 * @brief Earth oblateness (J2) perturbation implementation.
 * @author Watosn
 */

#include "spacetraffic/forces/gravity/j2_model.hpp"

#include <cmath>

namespace spacetraffic::forces {

spacetraffic::core::Vec3 j2_acceleration(const spacetraffic::core::StateVector& state, const J2Config& config) {
  const auto& p = state.position_m;
  const double r2 = spacetraffic::core::dot(p, p);
  const double r = std::sqrt(r2);
  const double r5 = r2 * r2 * r;
  const double z2_r2 = (p.z * p.z) / r2;
  const double k = -1.5 * config.j2 * config.mu_m3_s2 * config.radius_m * config.radius_m / r5;

  return spacetraffic::core::Vec3{
      k * p.x * (1.0 - 5.0 * z2_r2),
      k * p.y * (1.0 - 5.0 * z2_r2),
      k * p.z * (3.0 - 5.0 * z2_r2),
  };
}

}  // namespace spacetraffic::forces
