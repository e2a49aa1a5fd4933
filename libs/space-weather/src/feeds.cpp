/**
 * @file feeds.cpp
 * @brief Environment scalar reduction over external feeds.
 * @author Watosn
 */

#include "spacetraffic/weather/feeds.hpp"

#include <algorithm>

#include "spacetraffic/core/constants.hpp"
#include "spacetraffic/core/time_utils.hpp"

namespace spacetraffic::weather {

namespace constants = spacetraffic::core::constants;

namespace {

constexpr double kRecentStormWindowDays = 7.0;
constexpr double kWideStormWindowDays = 30.0;
constexpr double kNeoLookaheadDays = 7.0;

bool has_records(const StormFeedResult& r) {
  const auto* a = std::get_if<Available<GeomagneticStormRecord>>(&r);
  return a && !a->records.empty();
}

}  // namespace

double storm_density_multiplier(const StormFeedResult& storms) {
  const auto* a = std::get_if<Available<GeomagneticStormRecord>>(&storms);
  if (!a || a->records.empty()) {
    return 1.0;
  }
  const auto latest = std::max_element(a->records.begin(), a->records.end(), [](const auto& l, const auto& r) {
    return l.start.utc_seconds < r.start.utc_seconds;
  });
  if (latest->kp_samples.empty()) {
    return 1.0;
  }
  const double kp = latest->kp_samples.back().kp;
  return 1.0 + std::max(0.0, kp) / 100.0;
}

double asteroid_influence(const NeoFeedResult& approaches, const spacetraffic::core::Epoch& day) {
  const auto* a = std::get_if<Available<NearEarthObjectRecord>>(&approaches);
  if (!a) {
    return 1.0;
  }
  const double day_start = spacetraffic::core::utc_day_start(day).utc_seconds;
  const double day_end = day_start + constants::kSecondsPerDay;
  const auto today = std::count_if(a->records.begin(), a->records.end(), [&](const NearEarthObjectRecord& r) {
    return r.close_approach.utc_seconds >= day_start && r.close_approach.utc_seconds < day_end;
  });
  return 1.0 + 0.05 * static_cast<double>(today);
}

EnvironmentalFactors gather_environment(const ISpaceWeatherFeed* weather,
                                        const INearEarthObjectFeed* neo,
                                        const spacetraffic::core::Epoch& now) {
  EnvironmentalFactors out{};

  if (weather) {
    auto storms = weather->storms({now.utc_seconds - kRecentStormWindowDays * constants::kSecondsPerDay}, now);
    if (!has_records(storms)) {
      storms = weather->storms({now.utc_seconds - kWideStormWindowDays * constants::kSecondsPerDay}, now);
    }
    out.storm_data_available = std::holds_alternative<Available<GeomagneticStormRecord>>(storms);
    out.storm_multiplier = storm_density_multiplier(storms);
  }

  if (neo) {
    const auto day = spacetraffic::core::utc_day_start(now);
    const auto approaches = neo->approaches(day, {day.utc_seconds + kNeoLookaheadDays * constants::kSecondsPerDay});
    out.neo_data_available = std::holds_alternative<Available<NearEarthObjectRecord>>(approaches);
    out.asteroid_influence = asteroid_influence(approaches, now);
  }

  return out;
}

}  // namespace spacetraffic::weather
