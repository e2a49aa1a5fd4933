/**
 * @file static_feed.hpp
 * @brief Fixed-record feeds for testing and deterministic runs.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "spacetraffic/weather/feeds.hpp"

namespace spacetraffic::weather {

namespace detail {

template <typename Record, typename TimeOf>
FeedResult<Record> select_window(const std::optional<std::string>& offline_reason,
                                 const std::vector<Record>& records,
                                 const spacetraffic::core::Epoch& start,
                                 const spacetraffic::core::Epoch& end,
                                 TimeOf time_of) {
  if (offline_reason) {
    return Unavailable{.reason = *offline_reason};
  }
  Available<Record> out{};
  for (const auto& r : records) {
    const double t = time_of(r).utc_seconds;
    if (t >= start.utc_seconds && t <= end.utc_seconds) {
      out.records.push_back(r);
    }
  }
  return out;
}

}  // namespace detail

/**
 * @brief Storm feed serving a fixed record list.
 */
class StaticSpaceWeatherFeed final : public ISpaceWeatherFeed {
 public:
  explicit StaticSpaceWeatherFeed(std::vector<GeomagneticStormRecord> records) : records_(std::move(records)) {}

  /**
   * @brief Feed that reports every request as unavailable.
   */
  static StaticSpaceWeatherFeed Offline(std::string reason) {
    StaticSpaceWeatherFeed feed{std::vector<GeomagneticStormRecord>{}};
    feed.offline_reason_ = std::move(reason);
    return feed;
  }

  [[nodiscard]] StormFeedResult storms(const spacetraffic::core::Epoch& start,
                                       const spacetraffic::core::Epoch& end) const override {
    return detail::select_window(offline_reason_, records_, start, end,
                                 [](const GeomagneticStormRecord& r) { return r.start; });
  }

 private:
  std::vector<GeomagneticStormRecord> records_{};
  std::optional<std::string> offline_reason_{};
};

/**
 * @brief Near-Earth object feed serving a fixed record list.
 */
class StaticNearEarthObjectFeed final : public INearEarthObjectFeed {
 public:
  explicit StaticNearEarthObjectFeed(std::vector<NearEarthObjectRecord> records) : records_(std::move(records)) {}

  static StaticNearEarthObjectFeed Offline(std::string reason) {
    StaticNearEarthObjectFeed feed{std::vector<NearEarthObjectRecord>{}};
    feed.offline_reason_ = std::move(reason);
    return feed;
  }

  [[nodiscard]] NeoFeedResult approaches(const spacetraffic::core::Epoch& start,
                                         const spacetraffic::core::Epoch& end) const override {
    return detail::select_window(offline_reason_, records_, start, end,
                                 [](const NearEarthObjectRecord& r) { return r.close_approach; });
  }

 private:
  std::vector<NearEarthObjectRecord> records_{};
  std::optional<std::string> offline_reason_{};
};

}  // namespace spacetraffic::weather
