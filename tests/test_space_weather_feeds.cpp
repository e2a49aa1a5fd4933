/**
 * @file test_space_weather_feeds.cpp
 * @brief Environment reduction over static feeds.
 * @author Watosn
 */

#include <cmath>
#include <cstddef>
#include <vector>

#include <spdlog/spdlog.h>

#include "spacetraffic/weather/feeds.hpp"
#include "spacetraffic/weather/static_feed.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

constexpr double kNow = 1772323200.0 + 36000.0;  // 2026-03-01T10:00:00Z
constexpr double kDay = 86400.0;

spacetraffic::weather::GeomagneticStormRecord storm(double start, std::vector<double> kps) {
  spacetraffic::weather::GeomagneticStormRecord r{.start = {start}};
  for (std::size_t i = 0; i < kps.size(); ++i) {
    r.kp_samples.push_back({.observed = {start + 10800.0 * static_cast<double>(i)}, .kp = kps[i]});
  }
  return r;
}

spacetraffic::weather::NearEarthObjectRecord neo(const char* name, double when) {
  return spacetraffic::weather::NearEarthObjectRecord{
      .designation = name, .close_approach = {when}, .miss_distance_km = 4.0e6, .hazardous = false};
}

}  // namespace

int main() {
  using namespace spacetraffic;

  const core::Epoch now{kNow};
  const double today = kNow - 36000.0;

  const weather::StaticSpaceWeatherFeed storms({storm(kNow - 5.0 * kDay, {5.0, 3.0}), storm(kNow - 2.0 * kDay, {4.0, 6.0})});
  const weather::StaticNearEarthObjectFeed neos({neo("2026 AB", today + 100.0), neo("2026 CD", today + 50000.0),
                                                 neo("2026 EF", today + kDay - 1.0), neo("2026 GH", today + kDay + 5.0),
                                                 neo("2026 IJ", today - 10.0)});

  const auto env = weather::gather_environment(&storms, &neos, now);
  if (!env.storm_data_available || !env.neo_data_available || !approx(env.storm_multiplier, 1.06, 1e-12) ||
      !approx(env.asteroid_influence, 1.15, 1e-12)) {
    spdlog::error("environment mismatch: storm={} neo={}", env.storm_multiplier, env.asteroid_influence);
    return 1;
  }

  const auto none = weather::gather_environment(nullptr, nullptr, now);
  if (none.storm_data_available || none.neo_data_available || none.storm_multiplier != 1.0 || none.asteroid_influence != 1.0) {
    spdlog::error("absent feeds should be neutral");
    return 2;
  }

  // Nothing in the last week widens the lookback to thirty days.
  const weather::StaticSpaceWeatherFeed older({storm(kNow - 20.0 * kDay, {8.0})});
  const auto widened = weather::gather_environment(&older, nullptr, now);
  if (!widened.storm_data_available || !approx(widened.storm_multiplier, 1.08, 1e-12)) {
    spdlog::error("lookback widening mismatch");
    return 3;
  }

  const weather::StaticSpaceWeatherFeed stale({storm(kNow - 40.0 * kDay, {9.0})});
  const auto stale_env = weather::gather_environment(&stale, nullptr, now);
  if (!stale_env.storm_data_available || stale_env.storm_multiplier != 1.0) {
    spdlog::error("stale storm should not count");
    return 4;
  }

  const auto offline_weather = weather::StaticSpaceWeatherFeed::Offline("upstream timeout");
  const auto offline_neo = weather::StaticNearEarthObjectFeed::Offline("rate limited");
  const auto offline = weather::gather_environment(&offline_weather, &offline_neo, now);
  if (offline.storm_data_available || offline.neo_data_available || offline.storm_multiplier != 1.0 ||
      offline.asteroid_influence != 1.0) {
    spdlog::error("offline feeds should degrade to neutral");
    return 5;
  }
  const auto reason = offline_weather.storms({0.0}, now);
  const auto* u = std::get_if<weather::Unavailable>(&reason);
  if (!u || u->reason != "upstream timeout") {
    spdlog::error("offline reason lost");
    return 6;
  }

  // Latest storm wins regardless of record order; a storm without samples is neutral.
  const weather::StormFeedResult unordered =
      weather::Available<weather::GeomagneticStormRecord>{{storm(kNow - kDay, {2.0, 7.0}), storm(kNow - 3.0 * kDay, {9.0})}};
  const weather::StormFeedResult empty_samples =
      weather::Available<weather::GeomagneticStormRecord>{{weather::GeomagneticStormRecord{.start = {kNow}}}};
  if (!approx(weather::storm_density_multiplier(unordered), 1.07, 1e-12) ||
      weather::storm_density_multiplier(empty_samples) != 1.0 ||
      weather::storm_density_multiplier(weather::Unavailable{.reason = "x"}) != 1.0) {
    spdlog::error("storm multiplier reduction mismatch");
    return 7;
  }

  const weather::StaticNearEarthObjectFeed quiet_sky(std::vector<weather::NearEarthObjectRecord>{});
  const auto quiet = weather::gather_environment(nullptr, &quiet_sky, now);
  if (!quiet.neo_data_available || quiet.asteroid_influence != 1.0) {
    spdlog::error("empty NEO feed should be available and neutral");
    return 8;
  }

  return 0;
}
