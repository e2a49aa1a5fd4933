/**
 * @file constants.hpp
 * @brief Shared physical constants for astrodynamics and traffic models.
 * @author Watosn
 */
#pragma once

#include <numbers>

namespace spacetraffic::core::constants {

inline constexpr double kEarthMuM3S2 = 3.986004418e14;
inline constexpr double kEarthEquatorialRadiusM = 6378137.0;
// Altitudes throughout the traffic models are referenced to the mean radius.
inline constexpr double kEarthMeanRadiusM = 6371000.0;
inline constexpr double kEarthJ2 = 1.08263e-3;

inline constexpr double kSeaLevelDensityKgM3 = 1.225;
inline constexpr double kAtmosphereScaleHeightM = 8500.0;
inline constexpr double kDefaultDragCeilingAltitudeM = 1000.0e3;
/// Propagation stops once a trajectory drops below this altitude.
inline constexpr double kReentryAltitudeM = 100.0e3;

inline constexpr double kLeoUpperAltitudeKm = 2000.0;
inline constexpr double kGeoAltitudeKm = 35786.0;
inline constexpr double kNominalLeoVelocityKms = 7.8;

inline constexpr double kSecondsPerDay = 86400.0;
inline constexpr double kSecondsPerMonth = 2592000.0;

inline constexpr double kDegToRad = std::numbers::pi / 180.0;
inline constexpr double kRadToDeg = 180.0 / std::numbers::pi;

}  // namespace spacetraffic::core::constants
