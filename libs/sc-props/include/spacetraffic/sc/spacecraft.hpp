/**
 * @file spacecraft.hpp
 * @brief Drag-relevant properties of a simulated object.
 * @author Watosn
 */
#pragma once

#include "spacetraffic/core/types.hpp"

namespace spacetraffic::sc {

/**
 * @brief Mass and aerodynamic properties of one simulated object.
 */
struct SatelliteParameters {
  double mass_kg{};
  double drag_coefficient{};
  double cross_sectional_area_m2{};
};

/**
 * @brief Check that mass, Cd and area are finite and strictly positive.
 */
[[nodiscard]] spacetraffic::core::Status validate(const SatelliteParameters& sat);

/**
 * @brief Ballistic coefficient m / (Cd * A).
 */
[[nodiscard]] double ballistic_coefficient_kg_m2(const SatelliteParameters& sat);

}  // namespace spacetraffic::sc
