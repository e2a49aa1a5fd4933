/**
 * @file drag_model.hpp
 * @brief Atmospheric drag force pipeline.
 * @author Watosn
 */
#pragma once

#include "spacetraffic/core/constants.hpp"
#include "spacetraffic/core/interfaces.hpp"
#include "spacetraffic/sc/spacecraft.hpp"

namespace spacetraffic::forces {

/**
 * @brief Drag model tuning.
 */
struct DragConfig {
  /// Altitude above the mean Earth radius at and above which drag is not applied.
  double ceiling_altitude_m{spacetraffic::core::constants::kDefaultDragCeilingAltitudeM};
};

/**
 * @brief Drag model output bundle.
 */
struct DragResult {
  spacetraffic::core::Vec3 force_n{};
  spacetraffic::core::Vec3 acceleration_mps2{};
  double density_kg_m3{};
  double speed_mps{};
  double dynamic_pressure_pa{};
  double altitude_m{};
  bool above_ceiling{};
  spacetraffic::core::Status status{spacetraffic::core::Status::Ok};
};

/**
 * @brief Atmospheric drag model: F = -1/2 rho v^2 Cd A along the velocity direction.
 *
 * The atmosphere is assumed co-moving with the inertial frame, so the flow velocity equals the
 * state's velocity.
 */
class DragAccelerationModel {
 public:
  /**
   * @brief Construct drag model from an atmosphere provider.
   * @param atmosphere Atmosphere model provider, must outlive the model.
   * @param config Drag tuning.
   */
  explicit DragAccelerationModel(const spacetraffic::core::IAtmosphereModel& atmosphere, DragConfig config = {})
      : atmosphere_(atmosphere), config_(config) {}

  /**
   * @brief Evaluate drag force and acceleration for a state.
   * @param state State vector.
   * @param sat Satellite mass/aerodynamic properties.
   * @return Drag output bundle with status and intermediate values.
   */
  [[nodiscard]] DragResult evaluate(const spacetraffic::core::StateVector& state,
                                    const spacetraffic::sc::SatelliteParameters& sat) const;

  [[nodiscard]] const DragConfig& config() const { return config_; }

 private:
  const spacetraffic::core::IAtmosphereModel& atmosphere_;
  DragConfig config_{};
};

/**
 * @brief Drag force from the default exponential atmosphere (sea-level density, 8.5 km scale height).
 */
[[nodiscard]] DragResult atmospheric_drag(const spacetraffic::core::StateVector& state,
                                          const spacetraffic::sc::SatelliteParameters& sat,
                                          const DragConfig& config = {});

}  // namespace spacetraffic::forces
