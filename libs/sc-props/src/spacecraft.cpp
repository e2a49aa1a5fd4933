/**
 * @file spacecraft.cpp
 * @brief Satellite parameter helper implementation.
 * @author Watosn
 */

#include "spacetraffic/sc/spacecraft.hpp"

#include <cmath>
#include <limits>

namespace spacetraffic::sc {
namespace {

bool positive_finite(double v) { return std::isfinite(v) && v > 0.0; }

}  // namespace

spacetraffic::core::Status validate(const SatelliteParameters& sat) {
  if (!positive_finite(sat.mass_kg) || !positive_finite(sat.drag_coefficient) ||
      !positive_finite(sat.cross_sectional_area_m2)) {
    return spacetraffic::core::Status::InvalidInput;
  }
  return spacetraffic::core::Status::Ok;
}

double ballistic_coefficient_kg_m2(const SatelliteParameters& sat) {
  if (validate(sat) != spacetraffic::core::Status::Ok) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return sat.mass_kg / (sat.drag_coefficient * sat.cross_sectional_area_m2);
}

}  // namespace spacetraffic::sc
