/**
 * @file scenario.cpp
 * @brief Scenario validation and parsing implementation.
 * @author Watosn
 */

#include "spacetraffic/scenario/scenario.hpp"

#include <charconv>
#include <cstddef>
#include <cmath>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "spacetraffic/core/time_utils.hpp"

namespace spacetraffic::scenario {

using spacetraffic::core::Status;

namespace {

std::string_view trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  return text;
}

ValidationIssue check_range(ScenarioField field, double value, double lo, double hi, std::string_view unit) {
  if (!std::isfinite(value) || value < lo || value > hi) {
    return ValidationIssue{
        .status = Status::InvalidInput,
        .field = field,
        .message = fmt::format("{} must be between {} and {} {}", to_string(field), lo, hi, unit),
    };
  }
  return {};
}

ValidationIssue invalid(ScenarioField field, std::string message) {
  return ValidationIssue{.status = Status::InvalidInput, .field = field, .message = std::move(message)};
}

}  // namespace

std::string_view to_string(ScenarioField field) {
  switch (field) {
    case ScenarioField::None:
      return "none";
    case ScenarioField::EventType:
      return "event type";
    case ScenarioField::Altitude:
      return "altitude";
    case ScenarioField::Inclination:
      return "inclination";
    case ScenarioField::Velocity:
      return "velocity";
    case ScenarioField::Mass:
      return "mass";
    case ScenarioField::LaunchTime:
      return "launch time";
    case ScenarioField::Environment:
      return "environment";
  }
  return "unknown";
}

std::optional<EventType> parse_event_type(std::string_view text) {
  text = trim(text);
  if (text == "launch") {
    return EventType::Launch;
  }
  if (text == "adjustment") {
    return EventType::Adjustment;
  }
  if (text == "breakup") {
    return EventType::Breakup;
  }
  return std::nullopt;
}

std::optional<double> parse_number(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }
  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

ValidationIssue validate(const Scenario& scenario, const ScenarioLimits& limits) {
  const auto& p = scenario.parameters;
  if (auto issue = check_range(ScenarioField::Altitude, p.altitude_km, limits.min_altitude_km, limits.max_altitude_km, "km");
      issue.status != Status::Ok) {
    return issue;
  }
  if (auto issue = check_range(ScenarioField::Inclination, p.inclination_deg, limits.min_inclination_deg,
                               limits.max_inclination_deg, "degrees");
      issue.status != Status::Ok) {
    return issue;
  }
  if (auto issue = check_range(ScenarioField::Velocity, p.velocity_kms, limits.min_velocity_kms, limits.max_velocity_kms, "km/s");
      issue.status != Status::Ok) {
    return issue;
  }
  if (auto issue = check_range(ScenarioField::Mass, p.mass_kg, limits.min_mass_kg, limits.max_mass_kg, "kg");
      issue.status != Status::Ok) {
    return issue;
  }
  if (!std::isfinite(p.launch_time.utc_seconds)) {
    return invalid(ScenarioField::LaunchTime, "launch time is not a valid timestamp");
  }
  return {};
}

ScenarioParseResult parse_scenario(std::string_view event_type,
                                   std::string_view altitude_km,
                                   std::string_view inclination_deg,
                                   std::string_view velocity_kms,
                                   std::string_view mass_kg,
                                   std::string_view launch_time,
                                   const ScenarioLimits& limits) {
  ScenarioParseResult out{};

  const auto event = parse_event_type(event_type);
  if (!event) {
    out.issue = invalid(ScenarioField::EventType,
                        fmt::format("unknown event type '{}', expected launch, adjustment or breakup", trim(event_type)));
    return out;
  }
  out.scenario.event_type = *event;

  const std::pair<ScenarioField, std::string_view> numeric_fields[] = {
      {ScenarioField::Altitude, altitude_km},
      {ScenarioField::Inclination, inclination_deg},
      {ScenarioField::Velocity, velocity_kms},
      {ScenarioField::Mass, mass_kg},
  };
  double values[4]{};
  for (std::size_t i = 0; i < 4; ++i) {
    const auto v = parse_number(numeric_fields[i].second);
    if (!v) {
      out.issue = invalid(numeric_fields[i].first,
                          fmt::format("{} '{}' is not a number", to_string(numeric_fields[i].first), trim(numeric_fields[i].second)));
      return out;
    }
    values[i] = *v;
  }
  out.scenario.parameters.altitude_km = values[0];
  out.scenario.parameters.inclination_deg = values[1];
  out.scenario.parameters.velocity_kms = values[2];
  out.scenario.parameters.mass_kg = values[3];

  if (const auto stamp = spacetraffic::core::parse_utc_timestamp(trim(launch_time))) {
    out.scenario.parameters.launch_time = *stamp;
  } else if (const auto seconds = parse_number(launch_time)) {
    out.scenario.parameters.launch_time = spacetraffic::core::Epoch{*seconds};
  } else {
    out.issue = invalid(ScenarioField::LaunchTime, fmt::format("invalid launch time format '{}'", trim(launch_time)));
    return out;
  }

  out.issue = validate(out.scenario, limits);
  return out;
}

}  // namespace spacetraffic::scenario
