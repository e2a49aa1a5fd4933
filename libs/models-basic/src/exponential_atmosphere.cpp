/**
 * @file exponential_atmosphere.cpp
 * @brief Basic atmosphere model implementation.
 * @author Watosn
 */

#include "spacetraffic/models/exponential_atmosphere.hpp"

#include <cmath>

namespace spacetraffic::models {

spacetraffic::core::AtmosphereSample ExponentialAtmosphereModel::evaluate(const spacetraffic::core::StateVector& state) const {
  if (!(hs_ > 0.0) || !(rho0_ >= 0.0)) {
    return spacetraffic::core::AtmosphereSample{.status = spacetraffic::core::Status::InvalidInput};
  }
  const double r = spacetraffic::core::norm(state.position_m);
  if (!std::isfinite(r)) {
    return spacetraffic::core::AtmosphereSample{.status = spacetraffic::core::Status::NumericalError};
  }
  const double alt = r - spacetraffic::core::constants::kEarthMeanRadiusM;
  if (alt < 0.0) {
    return spacetraffic::core::AtmosphereSample{.status = spacetraffic::core::Status::InvalidInput};
  }
  const double rho = rho0_ * std::exp(-(alt - h0_) / hs_);
  return spacetraffic::core::AtmosphereSample{.density_kg_m3 = rho, .status = spacetraffic::core::Status::Ok};
}

}  // namespace spacetraffic::models
