/**
 * @file elements.hpp
 * @brief Classical Keplerian element set.
 * @author Watosn
 */
#pragma once

namespace spacetraffic::orbit {

/**
 * @brief Osculating Keplerian elements of a bound two-body orbit.
 *
 * Angles are in degrees; `inclination_deg` lies in [0, 180], the remaining angles in [0, 360).
 */
struct OrbitalElements {
  double semi_major_axis_km{};
  double eccentricity{};
  double inclination_deg{};
  double raan_deg{};
  double arg_perigee_deg{};
  double true_anomaly_deg{};
};

}  // namespace spacetraffic::orbit
