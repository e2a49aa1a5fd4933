/**
 * @file conversions.hpp
 * @brief Keplerian <-> Cartesian state conversions.
 * @author Watosn
 */
#pragma once

#include "spacetraffic/core/constants.hpp"
#include "spacetraffic/core/types.hpp"
#include "spacetraffic/orbit/elements.hpp"

namespace spacetraffic::orbit {

/**
 * @brief Eccentricity below which an orbit is treated as circular.
 */
inline constexpr double kCircularEccentricityTol = 1e-10;

/**
 * @brief Ratio |node| / |h| below which an orbit is treated as equatorial.
 */
inline constexpr double kEquatorialNodeTol = 1e-10;

/**
 * @brief Cartesian conversion output.
 */
struct CartesianResult {
  spacetraffic::core::StateVector state{};
  spacetraffic::core::Status status{spacetraffic::core::Status::Ok};
};

/**
 * @brief Keplerian conversion output.
 */
struct ElementsResult {
  OrbitalElements elements{};
  spacetraffic::core::Status status{spacetraffic::core::Status::Ok};
};

/**
 * @brief Convert Keplerian elements to an inertial state vector.
 *
 * The perifocal state is rotated by Rz(raan) * Rx(i) * Rz(argp). The returned state carries a zero epoch.
 *
 * @param elements Input elements.
 * @param mu_m3_s2 Gravitational parameter.
 * @return State with `DegenerateInput` for a <= 0 or e outside [0, 1), `InvalidInput` for non-finite fields.
 */
[[nodiscard]] CartesianResult to_cartesian(const OrbitalElements& elements,
                                           double mu_m3_s2 = spacetraffic::core::constants::kEarthMuM3S2);

/**
 * @brief Convert an inertial state vector to Keplerian elements.
 *
 * Angle convention at the degenerate boundaries:
 * - equatorial orbits report raan = 0 and measure perigee from +X in the direction of motion;
 * - circular orbits report argp = 0 and report the argument of latitude (or true longitude when also
 *   equatorial) as true anomaly.
 *
 * @param state Input state (position in m, velocity in m/s).
 * @param mu_m3_s2 Gravitational parameter.
 * @return Elements with `DegenerateInput` for zero radius, rectilinear or unbound states.
 */
[[nodiscard]] ElementsResult to_keplerian(const spacetraffic::core::StateVector& state,
                                          double mu_m3_s2 = spacetraffic::core::constants::kEarthMuM3S2);

}  // namespace spacetraffic::orbit
