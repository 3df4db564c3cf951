/**
 * @file time.hpp
 * @brief ISO-8601 UTC timestamp parsing and formatting.
 * @author Watosn
 */
#pragma once

#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "bridgecast/core/types.hpp"

namespace bridgecast::core::time {

inline constexpr double kSecondsPerHour = 3600.0;
inline constexpr double kSecondsPerDay = 86400.0;

/**
 * @brief Calendar date and time-of-day in UTC.
 */
struct CivilTime {
  int year{1970};
  unsigned month{1};
  unsigned day{1};
  unsigned hour{};
  unsigned minute{};
  unsigned second{};
};

inline std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

inline void civil_from_days(std::int64_t z, int& y, unsigned& m, unsigned& d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
  const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
  const unsigned mp = (5U * doy + 2U) / 153U;
  d = doy - (153U * mp + 2U) / 5U + 1U;
  m = mp < 10U ? mp + 3U : mp - 9U;
  y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400) + static_cast<int>(m <= 2U);
}

inline bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

inline unsigned days_in_month(int y, unsigned m) {
  static constexpr unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2U && is_leap_year(y)) {
    return 29U;
  }
  return kDays[m - 1U];
}

inline Epoch epoch_from_civil(const CivilTime& c) {
  const double days = static_cast<double>(days_from_civil(c.year, c.month, c.day));
  return Epoch{.utc_seconds = days * kSecondsPerDay + static_cast<double>(c.hour) * kSecondsPerHour +
                              static_cast<double>(c.minute) * 60.0 + static_cast<double>(c.second)};
}

inline CivilTime civil_from_epoch(const Epoch& epoch) {
  const double whole = std::floor(epoch.utc_seconds);
  const auto days = static_cast<std::int64_t>(std::floor(whole / kSecondsPerDay));
  auto sod = static_cast<std::int64_t>(whole - static_cast<double>(days) * kSecondsPerDay);
  CivilTime c{};
  civil_from_days(days, c.year, c.month, c.day);
  c.hour = static_cast<unsigned>(sod / 3600);
  sod %= 3600;
  c.minute = static_cast<unsigned>(sod / 60);
  c.second = static_cast<unsigned>(sod % 60);
  return c;
}

namespace detail {

inline bool read_digits(std::string_view text, std::size_t pos, std::size_t count, int& value) {
  if (pos + count > text.size()) {
    return false;
  }
  value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
      return false;
    }
    value = value * 10 + (text[i] - '0');
  }
  return true;
}

}  // namespace detail

/**
 * @brief Parse an ISO-8601 timestamp into a UTC epoch.
 *
 * Accepts `YYYY-MM-DD`, optionally followed by `T` or a space and `HH:MM[:SS[.fff]]`, and an
 * optional `Z` or `+HH:MM`/`-HH:MM` offset. Timestamps without an offset are taken as UTC.
 */
inline std::optional<Epoch> parse_iso8601_utc(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }

  int year = 0;
  int month = 0;
  int day = 0;
  if (text.size() < 10 || text[4] != '-' || text[7] != '-' || !detail::read_digits(text, 0, 4, year) ||
      !detail::read_digits(text, 5, 2, month) || !detail::read_digits(text, 8, 2, day)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 ||
      static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
    return std::nullopt;
  }

  CivilTime c{.year = year, .month = static_cast<unsigned>(month), .day = static_cast<unsigned>(day)};
  double fraction = 0.0;
  double offset_s = 0.0;
  std::size_t pos = 10;
  if (pos < text.size()) {
    if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') {
      return std::nullopt;
    }
    ++pos;
    int hour = 0;
    int minute = 0;
    if (!detail::read_digits(text, pos, 2, hour) || pos + 2 >= text.size() || text[pos + 2] != ':' ||
        !detail::read_digits(text, pos + 3, 2, minute)) {
      return std::nullopt;
    }
    pos += 5;
    int second = 0;
    if (pos < text.size() && text[pos] == ':') {
      if (!detail::read_digits(text, pos + 1, 2, second)) {
        return std::nullopt;
      }
      pos += 3;
      if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        double scale = 0.1;
        const std::size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
          fraction += scale * static_cast<double>(text[pos] - '0');
          scale *= 0.1;
          ++pos;
        }
        if (pos == start) {
          return std::nullopt;
        }
      }
    }
    if (hour > 23 || minute > 59 || second > 59) {
      return std::nullopt;
    }
    c.hour = static_cast<unsigned>(hour);
    c.minute = static_cast<unsigned>(minute);
    c.second = static_cast<unsigned>(second);

    if (pos < text.size()) {
      const char sign = text[pos];
      if ((sign == 'Z' || sign == 'z') && pos + 1 == text.size()) {
        pos = text.size();
      } else if (sign == '+' || sign == '-') {
        int off_h = 0;
        int off_m = 0;
        if (!detail::read_digits(text, pos + 1, 2, off_h)) {
          return std::nullopt;
        }
        std::size_t mpos = pos + 3;
        const bool has_colon = mpos < text.size() && text[mpos] == ':';
        if (has_colon) {
          ++mpos;
        }
        if (mpos < text.size() || has_colon) {
          if (!detail::read_digits(text, mpos, 2, off_m) || mpos + 2 != text.size()) {
            return std::nullopt;
          }
        }
        if (off_h > 23 || off_m > 59) {
          return std::nullopt;
        }
        offset_s = static_cast<double>(off_h) * kSecondsPerHour + static_cast<double>(off_m) * 60.0;
        if (sign == '-') {
          offset_s = -offset_s;
        }
        pos = text.size();
      } else {
        return std::nullopt;
      }
    }
  }

  Epoch out = epoch_from_civil(c);
  out.utc_seconds += fraction - offset_s;
  return out;
}

/**
 * @brief Format an epoch as `YYYY-MM-DDTHH:MM:SSZ` (whole seconds).
 */
inline std::string format_iso8601_utc(const Epoch& epoch) {
  const CivilTime c = civil_from_epoch(epoch);
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z", c.year, c.month, c.day, c.hour, c.minute, c.second);
}

}  // namespace bridgecast::core::time
