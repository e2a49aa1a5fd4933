/**
 * @file time_utils.hpp
 * @brief UTC calendar helpers for epochs and timestamp parsing.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "spacetraffic/core/types.hpp"

namespace spacetraffic::core {

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian civil date.
 */
[[nodiscard]] int days_from_civil(int y, unsigned m, unsigned d);

/**
 * @brief UTC seconds at 00:00:00 of a civil date.
 */
[[nodiscard]] double ymd_to_utc_seconds(int y, unsigned m, unsigned d);

/**
 * @brief Parse `YYYY-MM-DD` or `YYYY-MM-DDThh:mm:ss[.fff][Z]` into a UTC epoch.
 * @return Epoch, or `std::nullopt` for malformed or out-of-range text.
 */
[[nodiscard]] std::optional<Epoch> parse_utc_timestamp(std::string_view text);

/**
 * @brief Start of the UTC day containing an epoch.
 */
[[nodiscard]] Epoch utc_day_start(const Epoch& epoch);

/**
 * @brief Format the UTC date of an epoch as `YYYY-MM-DD`.
 */
[[nodiscard]] std::string format_utc_date(const Epoch& epoch);

}  // namespace spacetraffic::core
