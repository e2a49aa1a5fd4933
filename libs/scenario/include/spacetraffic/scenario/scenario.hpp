/**
 * @file scenario.hpp
 * @brief Traffic scenario description, validation and text parsing.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "spacetraffic/traffic/types.hpp"

namespace spacetraffic::scenario {

using spacetraffic::traffic::EventType;
using spacetraffic::traffic::ScenarioParameters;

/**
 * @brief User-supplied traffic event.
 */
struct Scenario {
  EventType event_type{EventType::Launch};
  ScenarioParameters parameters{};
};

/**
 * @brief Scenario field referenced by a validation issue.
 */
enum class ScenarioField : std::uint8_t { None, EventType, Altitude, Inclination, Velocity, Mass, LaunchTime, Environment };

[[nodiscard]] std::string_view to_string(ScenarioField field);

/**
 * @brief First problem found in a scenario. Status is Ok when the scenario is usable.
 */
struct ValidationIssue {
  spacetraffic::core::Status status{spacetraffic::core::Status::Ok};
  ScenarioField field{ScenarioField::None};
  std::string message{};
};

/**
 * @brief Inclusive parameter bounds.
 */
struct ScenarioLimits {
  double min_altitude_km{100.0};
  double max_altitude_km{5000.0};
  double min_inclination_deg{0.0};
  double max_inclination_deg{180.0};
  double min_velocity_kms{0.0};
  double max_velocity_kms{15.0};
  double min_mass_kg{1.0};
  double max_mass_kg{10000.0};
};

/**
 * @brief Parse `launch`, `adjustment` or `breakup` (case-sensitive).
 */
[[nodiscard]] std::optional<EventType> parse_event_type(std::string_view text);

/**
 * @brief Check all parameters against their inclusive bounds.
 */
[[nodiscard]] ValidationIssue validate(const Scenario& scenario, const ScenarioLimits& limits = {});

/**
 * @brief Outcome of parsing a scenario from text fields.
 */
struct ScenarioParseResult {
  Scenario scenario{};
  ValidationIssue issue{};
};

/**
 * @brief Parse and validate a scenario from text fields.
 *
 * Numbers must be complete decimal literals. The launch time accepts `YYYY-MM-DD`,
 * `YYYY-MM-DDThh:mm:ss[.fff][Z]` or plain UTC seconds.
 */
[[nodiscard]] ScenarioParseResult parse_scenario(std::string_view event_type,
                                                 std::string_view altitude_km,
                                                 std::string_view inclination_deg,
                                                 std::string_view velocity_kms,
                                                 std::string_view mass_kg,
                                                 std::string_view launch_time,
                                                 const ScenarioLimits& limits = {});

/**
 * @brief Parse a complete decimal literal, surrounding spaces allowed.
 */
[[nodiscard]] std::optional<double> parse_number(std::string_view text);

}  // namespace spacetraffic::scenario
