/**
 * @file celestrak_kp_feed.hpp
 * @brief Geomagnetic storm feed backed by CelesTrak SW-Last5Years CSV.
 * @author Watosn
 */
#pragma once

#include <array>
#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "spacetraffic/weather/feeds.hpp"

namespace spacetraffic::weather {

/**
 * @brief Storm feed derived from CelesTrak daily 3-hourly Kp columns.
 *
 * Each day with at least one 3-hourly Kp at or above the storm threshold becomes one storm record
 * starting at the first such slot.
 */
class CelesTrakKpCsvFeed final : public ISpaceWeatherFeed {
 public:
  /**
   * @brief Normalized in-memory daily sample.
   */
  struct DailySample {
    double day_start_utc_s{};
    std::array<double, 8> kp_3h_utc{};
  };

  /**
   * @brief CSV feed configuration.
   */
  struct Config {
    std::filesystem::path csv_file{};
    double storm_kp_threshold{5.0};
  };

  /**
   * @brief Factory helper that parses CSV input. Unreadable files yield a feed with no samples.
   */
  static std::unique_ptr<CelesTrakKpCsvFeed> Create(const Config& config);

  [[nodiscard]] StormFeedResult storms(const spacetraffic::core::Epoch& start,
                                       const spacetraffic::core::Epoch& end) const override;

  [[nodiscard]] std::size_t sample_count() const { return samples_.size(); }

 private:
  CelesTrakKpCsvFeed(std::vector<DailySample> samples, double threshold)
      : samples_(std::move(samples)), storm_kp_threshold_(threshold) {}

  std::vector<DailySample> samples_{};
  double storm_kp_threshold_{};
};

}  // namespace spacetraffic::weather
