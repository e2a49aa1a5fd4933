/**
 * @file celestrak_kp_feed.cpp
 * @brief CelesTrak SW-Last5Years Kp storm feed implementation.
 * @author Watosn
 */

#include "spacetraffic/weather/celestrak_kp_feed.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

#include "spacetraffic/core/constants.hpp"
#include "spacetraffic/core/time_utils.hpp"

namespace spacetraffic::weather {
namespace {

constexpr std::size_t kMinCelesTrakColumns = 12;
constexpr std::size_t kDateCol = 0;
constexpr std::size_t kKp1Col = 3;
constexpr double kSecondsPer3h = 10800.0;

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  fields.reserve(40);
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(token);
  }
  return fields;
}

bool parse_double(const std::string& text, double& value) {
  const char* first = text.data();
  const char* last = text.data() + text.size();
  while (first < last && *first == ' ') {
    ++first;
  }
  const auto [ptr, ec] = std::from_chars(first, last, value);
  return ec == std::errc{} && ptr != first;
}

}  // namespace

std::unique_ptr<CelesTrakKpCsvFeed> CelesTrakKpCsvFeed::Create(const Config& config) {
  std::ifstream in(config.csv_file);
  if (!in) {
    return std::unique_ptr<CelesTrakKpCsvFeed>(new CelesTrakKpCsvFeed({}, config.storm_kp_threshold));
  }

  std::vector<DailySample> samples;
  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    if (!header_consumed) {
      header_consumed = true;
      if (line.find("DATE") != std::string::npos) {
        continue;
      }
    }

    const auto fields = split_csv_line(line);
    if (fields.size() < kMinCelesTrakColumns || fields[kDateCol].size() != 10) {
      continue;
    }
    const auto day = spacetraffic::core::parse_utc_timestamp(fields[kDateCol]);
    if (!day) {
      continue;
    }

    DailySample s{.day_start_utc_s = day->utc_seconds};
    bool ok_slots = true;
    for (std::size_t i = 0; i < 8; ++i) {
      double kp_raw = 0.0;
      if (!parse_double(fields[kKp1Col + i], kp_raw)) {
        ok_slots = false;
        break;
      }
      s.kp_3h_utc[i] = kp_raw / 10.0;  // CelesTrak KP columns are tenths.
    }
    if (!ok_slots) {
      continue;
    }
    samples.push_back(s);
  }

  std::sort(samples.begin(), samples.end(),
            [](const DailySample& a, const DailySample& b) { return a.day_start_utc_s < b.day_start_utc_s; });
  return std::unique_ptr<CelesTrakKpCsvFeed>(new CelesTrakKpCsvFeed(std::move(samples), config.storm_kp_threshold));
}

StormFeedResult CelesTrakKpCsvFeed::storms(const spacetraffic::core::Epoch& start,
                                           const spacetraffic::core::Epoch& end) const {
  if (samples_.empty()) {
    return Unavailable{.reason = "no CelesTrak Kp samples loaded"};
  }
  const double coverage_end = samples_.back().day_start_utc_s + spacetraffic::core::constants::kSecondsPerDay;
  if (end.utc_seconds < samples_.front().day_start_utc_s || start.utc_seconds >= coverage_end) {
    return Unavailable{.reason = "requested window outside CelesTrak coverage"};
  }

  Available<GeomagneticStormRecord> out{};
  for (const auto& day : samples_) {
    std::optional<std::size_t> onset{};
    for (std::size_t slot = 0; slot < day.kp_3h_utc.size(); ++slot) {
      if (day.kp_3h_utc[slot] >= storm_kp_threshold_) {
        onset = slot;
        break;
      }
    }
    if (!onset) {
      continue;
    }

    const double storm_start = day.day_start_utc_s + static_cast<double>(*onset) * kSecondsPer3h;
    if (storm_start < start.utc_seconds || storm_start > end.utc_seconds) {
      continue;
    }

    GeomagneticStormRecord record{.start = {storm_start}};
    for (std::size_t slot = *onset; slot < day.kp_3h_utc.size(); ++slot) {
      const double observed = day.day_start_utc_s + static_cast<double>(slot) * kSecondsPer3h;
      if (observed > end.utc_seconds) {
        break;
      }
      record.kp_samples.push_back(KpSample{.observed = {observed}, .kp = day.kp_3h_utc[slot]});
    }
    out.records.push_back(std::move(record));
  }
  return out;
}

}  // namespace spacetraffic::weather
