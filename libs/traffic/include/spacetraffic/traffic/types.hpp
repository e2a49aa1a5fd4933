/**
 * @file types.hpp
 * @brief Orbital-regime and scenario domain types shared by the traffic models.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string_view>

#include "spacetraffic/core/types.hpp"

namespace spacetraffic::traffic {

/**
 * @brief Altitude-band classification.
 */
enum class OrbitRegime : std::uint8_t { LEO, MEO, GEO };

/**
 * @brief Kind of traffic event being evaluated.
 */
enum class EventType : std::uint8_t { Launch, Adjustment, Breakup };

/**
 * @brief Physical parameters of the object introduced by a scenario.
 */
struct ScenarioParameters {
  double altitude_km{};
  double inclination_deg{};
  double velocity_kms{};
  double mass_kg{};
  spacetraffic::core::Epoch launch_time{};
};

/**
 * @brief Snapshot of orbital-traffic state.
 */
struct OrbitalRegimeState {
  std::int64_t objects_in_leo{};
  std::int64_t objects_in_meo{};
  std::int64_t objects_in_geo{};
  /// Normalized congestion in [0, 1].
  double average_congestion{};
  /// Regime-level collision probability in [0, 1].
  double collision_probability{};
};

[[nodiscard]] inline std::int64_t total_objects(const OrbitalRegimeState& s) {
  return s.objects_in_leo + s.objects_in_meo + s.objects_in_geo;
}

[[nodiscard]] constexpr std::string_view to_string(OrbitRegime regime) {
  switch (regime) {
    case OrbitRegime::LEO:
      return "LEO";
    case OrbitRegime::MEO:
      return "MEO";
    case OrbitRegime::GEO:
      return "GEO";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(EventType type) {
  switch (type) {
    case EventType::Launch:
      return "launch";
    case EventType::Adjustment:
      return "adjustment";
    case EventType::Breakup:
      return "breakup";
  }
  return "unknown";
}

}  // namespace spacetraffic::traffic
