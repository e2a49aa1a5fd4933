/**
 * @file feeds.hpp
 * @brief External space-environment feed boundary.
 * @author Watosn
 */
#pragma once

#include <string>
#include <variant>
#include <vector>

#include "spacetraffic/core/types.hpp"

namespace spacetraffic::weather {

/**
 * @brief One 3-hourly planetary Kp observation.
 */
struct KpSample {
  spacetraffic::core::Epoch observed{};
  double kp{};
};

/**
 * @brief Geomagnetic storm event with its Kp history, ordered by observation time.
 */
struct GeomagneticStormRecord {
  spacetraffic::core::Epoch start{};
  std::vector<KpSample> kp_samples{};
};

/**
 * @brief Near-Earth object close approach.
 */
struct NearEarthObjectRecord {
  std::string designation{};
  spacetraffic::core::Epoch close_approach{};
  double miss_distance_km{};
  bool hazardous{};
};

template <typename Record>
struct Available {
  std::vector<Record> records{};
};

/**
 * @brief Feed could not serve the request.
 */
struct Unavailable {
  std::string reason{};
};

template <typename Record>
using FeedResult = std::variant<Available<Record>, Unavailable>;

using StormFeedResult = FeedResult<GeomagneticStormRecord>;
using NeoFeedResult = FeedResult<NearEarthObjectRecord>;

/**
 * @brief Source of geomagnetic storm history.
 */
class ISpaceWeatherFeed {
 public:
  virtual ~ISpaceWeatherFeed() = default;
  /**
   * @brief Storms that started in [start, end], ordered by start.
   */
  [[nodiscard]] virtual StormFeedResult storms(const spacetraffic::core::Epoch& start,
                                               const spacetraffic::core::Epoch& end) const = 0;
};

/**
 * @brief Source of near-Earth object close approaches.
 */
class INearEarthObjectFeed {
 public:
  virtual ~INearEarthObjectFeed() = default;
  /**
   * @brief Close approaches in [start, end].
   */
  [[nodiscard]] virtual NeoFeedResult approaches(const spacetraffic::core::Epoch& start,
                                                 const spacetraffic::core::Epoch& end) const = 0;
};

/**
 * @brief Environment scalars consumed by the scenario evaluator.
 */
struct EnvironmentalFactors {
  /// Density multiplier from geomagnetic activity, >= 1.
  double storm_multiplier{1.0};
  /// Debris-spread multiplier from near-Earth objects, >= 1.
  double asteroid_influence{1.0};
  bool storm_data_available{false};
  bool neo_data_available{false};
};

/**
 * @brief 1 + kp/100 for the latest Kp sample of the latest storm; 1 when unavailable or empty.
 */
[[nodiscard]] double storm_density_multiplier(const StormFeedResult& storms);

/**
 * @brief 1 + 0.05 per close approach on the UTC day containing @p day; 1 when unavailable.
 */
[[nodiscard]] double asteroid_influence(const NeoFeedResult& approaches, const spacetraffic::core::Epoch& day);

/**
 * @brief Query both feeds around @p now and reduce them to environment scalars.
 *
 * Storms are looked up over the previous 7 days, widened to 30 days when that window is empty.
 * Approaches are looked up over the next 7 days and counted for the current UTC day. A null feed
 * is treated as unavailable.
 */
[[nodiscard]] EnvironmentalFactors gather_environment(const ISpaceWeatherFeed* weather,
                                                      const INearEarthObjectFeed* neo,
                                                      const spacetraffic::core::Epoch& now);

}  // namespace spacetraffic::weather
