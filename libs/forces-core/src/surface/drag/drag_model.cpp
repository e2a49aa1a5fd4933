/**
 * @file drag_model.cpp
 * @brief Atmospheric drag force pipeline implementation.
 * @author Watosn
 */

#include "spacetraffic/forces/surface/drag/drag_model.hpp"

#include <cmath>

#include "spacetraffic/core/math_utils.hpp"
#include "spacetraffic/models/exponential_atmosphere.hpp"

namespace spacetraffic::forces {

DragResult DragAccelerationModel::evaluate(const spacetraffic::core::StateVector& state,
                                           const spacetraffic::sc::SatelliteParameters& sat) const {
  if (spacetraffic::sc::validate(sat) != spacetraffic::core::Status::Ok) {
    return DragResult{.status = spacetraffic::core::Status::InvalidInput};
  }
  if (!spacetraffic::core::is_finite(state)) {
    return DragResult{.status = spacetraffic::core::Status::NumericalError};
  }

  const double altitude_m = spacetraffic::core::norm(state.position_m) - spacetraffic::core::constants::kEarthMeanRadiusM;
  if (altitude_m >= config_.ceiling_altitude_m) {
    return DragResult{.altitude_m = altitude_m, .above_ceiling = true, .status = spacetraffic::core::Status::Ok};
  }

  const auto a = atmosphere_.evaluate(state);
  if (a.status != spacetraffic::core::Status::Ok) {
    return DragResult{.altitude_m = altitude_m, .status = a.status};
  }
  if (!(a.density_kg_m3 >= 0.0)) {
    return DragResult{.altitude_m = altitude_m, .status = spacetraffic::core::Status::NumericalError};
  }

  double speed = 0.0;
  const auto flow_dir = spacetraffic::core::unit_direction(state.velocity_mps, &speed);
  if (!std::isfinite(speed)) {
    return DragResult{.status = spacetraffic::core::Status::NumericalError};
  }

  const double q_pa = 0.5 * a.density_kg_m3 * speed * speed;
  const auto force = (-q_pa * sat.drag_coefficient * sat.cross_sectional_area_m2) * flow_dir;

  return DragResult{.force_n = force,
                    .acceleration_mps2 = force / sat.mass_kg,
                    .density_kg_m3 = a.density_kg_m3,
                    .speed_mps = speed,
                    .dynamic_pressure_pa = q_pa,
                    .altitude_m = altitude_m,
                    .above_ceiling = false,
                    .status = spacetraffic::core::Status::Ok};
}

DragResult atmospheric_drag(const spacetraffic::core::StateVector& state,
                            const spacetraffic::sc::SatelliteParameters& sat,
                            const DragConfig& config) {
  const spacetraffic::models::ExponentialAtmosphereModel atmosphere{};
  const DragAccelerationModel model(atmosphere, config);
  return model.evaluate(state, sat);
}

}  // namespace spacetraffic::forces
