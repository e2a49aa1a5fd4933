/**
 * @file time_utils.cpp
 * @brief UTC calendar helper implementation.
 * @author Watosn
 */

#include "spacetraffic/core/time_utils.hpp"

#include <cctype>
#include <cmath>

#include <fmt/format.h>

#include "spacetraffic/core/constants.hpp"

namespace spacetraffic::core {
namespace {

bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned days_in_month(int y, unsigned m) {
  static constexpr unsigned kDays[12] = {31U, 28U, 31U, 30U, 31U, 30U, 31U, 31U, 30U, 31U, 30U, 31U};
  if (m == 2U && is_leap_year(y)) {
    return 29U;
  }
  return kDays[m - 1U];
}

bool parse_fixed_digits(std::string_view text, std::size_t pos, std::size_t count, int& value) {
  if (pos + count > text.size()) {
    return false;
  }
  int v = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
    v = v * 10 + (text[i] - '0');
  }
  value = v;
  return true;
}

void civil_from_days(int z, int& y, unsigned& m, unsigned& d) {
  z += 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
  const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
  const unsigned mp = (5U * doy + 2U) / 153U;
  d = doy - (153U * mp + 2U) / 5U + 1U;
  m = mp < 10U ? mp + 3U : mp - 9U;
  y = static_cast<int>(yoe) + era * 400 + static_cast<int>(m <= 2U);
}

}  // namespace

int days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

double ymd_to_utc_seconds(int y, unsigned m, unsigned d) {
  return static_cast<double>(days_from_civil(y, m, d)) * constants::kSecondsPerDay;
}

std::optional<Epoch> parse_utc_timestamp(std::string_view text) {
  int year = 0;
  int month = 0;
  int day = 0;
  if (text.size() < 10 || text[4] != '-' || text[7] != '-' || !parse_fixed_digits(text, 0, 4, year) ||
      !parse_fixed_digits(text, 5, 2, month) || !parse_fixed_digits(text, 8, 2, day)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
    return std::nullopt;
  }

  double seconds_of_day = 0.0;
  if (text.size() > 10) {
    if ((text[10] != 'T' && text[10] != ' ') || text.size() < 19 || text[13] != ':' || text[16] != ':') {
      return std::nullopt;
    }
    int hh = 0;
    int mm = 0;
    int ss = 0;
    if (!parse_fixed_digits(text, 11, 2, hh) || !parse_fixed_digits(text, 14, 2, mm) ||
        !parse_fixed_digits(text, 17, 2, ss) || hh > 23 || mm > 59 || ss > 60) {
      return std::nullopt;
    }
    seconds_of_day = static_cast<double>(hh * 3600 + mm * 60 + ss);

    std::size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      double scale = 0.1;
      const std::size_t digits_begin = pos;
      while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        seconds_of_day += scale * static_cast<double>(text[pos] - '0');
        scale *= 0.1;
        ++pos;
      }
      if (pos == digits_begin) {
        return std::nullopt;
      }
    }
    if (pos < text.size() && text[pos] == 'Z') {
      ++pos;
    }
    if (pos != text.size()) {
      return std::nullopt;
    }
  }

  return Epoch{.utc_seconds = ymd_to_utc_seconds(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) +
                              seconds_of_day};
}

Epoch utc_day_start(const Epoch& epoch) {
  return Epoch{.utc_seconds = std::floor(epoch.utc_seconds / constants::kSecondsPerDay) * constants::kSecondsPerDay};
}

std::string format_utc_date(const Epoch& epoch) {
  if (!std::isfinite(epoch.utc_seconds)) {
    return "invalid";
  }
  const int days = static_cast<int>(std::floor(epoch.utc_seconds / constants::kSecondsPerDay));
  int y = 0;
  unsigned m = 0;
  unsigned d = 0;
  civil_from_days(days, y, m, d);
  return fmt::format("{:04d}-{:02d}-{:02d}", y, m, d);
}

}  // namespace spacetraffic::core
