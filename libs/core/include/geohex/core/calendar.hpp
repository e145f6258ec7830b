/**
 * @file calendar.hpp
 * @brief Civil calendar arithmetic and ISO-8601 day formatting.
 * @author geohex developers
 */
#pragma once

#include <cstdio>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "geohex/core/types.hpp"

namespace geohex::core::calendar {

/**
 * @brief Days since 1970-01-01 for a civil date (Howard Hinnant's algorithm).
 */
constexpr int days_from_civil(int y, unsigned m, unsigned d) noexcept {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

constexpr CalendarDate civil_from_days(int z) noexcept {
  z += 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
  const int y = static_cast<int>(yoe) + era * 400;
  const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
  const unsigned mp = (5U * doy + 2U) / 153U;
  const unsigned d = doy - (153U * mp + 2U) / 5U + 1U;
  const unsigned m = mp < 10U ? mp + 3U : mp - 9U;
  return CalendarDate{.year = y + static_cast<int>(m <= 2U), .month = m, .day = d};
}

constexpr bool is_leap_year(int y) noexcept { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

constexpr unsigned days_in_month(int y, unsigned m) noexcept {
  constexpr unsigned kDays[12] = {31U, 28U, 31U, 30U, 31U, 30U, 31U, 31U, 30U, 31U, 30U, 31U};
  if (m < 1U || m > 12U) {
    return 0U;
  }
  return (m == 2U && is_leap_year(y)) ? 29U : kDays[m - 1U];
}

constexpr bool is_valid(const CalendarDate& d) noexcept {
  return d.month >= 1U && d.month <= 12U && d.day >= 1U && d.day <= days_in_month(d.year, d.month);
}

constexpr int to_serial(const CalendarDate& d) noexcept { return days_from_civil(d.year, d.month, d.day); }

constexpr CalendarDate add_days(const CalendarDate& d, int n) noexcept { return civil_from_days(to_serial(d) + n); }

constexpr CalendarDate first_of_month(const CalendarDate& d) noexcept {
  return CalendarDate{.year = d.year, .month = d.month, .day = 1U};
}

constexpr CalendarDate last_of_month(const CalendarDate& d) noexcept {
  return CalendarDate{.year = d.year, .month = d.month, .day = days_in_month(d.year, d.month)};
}

/**
 * @brief Convert a year and 1-based day-of-year into a civil date.
 */
inline std::optional<CalendarDate> from_year_day_of_year(int year, int doy) {
  const int len = is_leap_year(year) ? 366 : 365;
  if (doy < 1 || doy > len) {
    return std::nullopt;
  }
  return add_days(CalendarDate{.year = year, .month = 1U, .day = 1U}, doy - 1);
}

inline std::string to_iso(const CalendarDate& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", d.year, d.month, d.day);
  return std::string(buf);
}

inline std::string to_iso(const std::optional<CalendarDate>& d) { return d.has_value() ? to_iso(*d) : "unknown"; }

/**
 * @brief Parse a strict `YYYY-MM-DD` day.
 */
inline std::optional<CalendarDate> parse_iso(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  int y = 0;
  unsigned m = 0;
  unsigned d = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7) {
      continue;
    }
    if (text[i] < '0' || text[i] > '9') {
      return std::nullopt;
    }
  }
  for (std::size_t i = 0; i < 4; ++i) {
    y = y * 10 + (text[i] - '0');
  }
  m = static_cast<unsigned>((text[5] - '0') * 10 + (text[6] - '0'));
  d = static_cast<unsigned>((text[8] - '0') * 10 + (text[9] - '0'));
  const CalendarDate out{.year = y, .month = m, .day = d};
  if (!is_valid(out)) {
    return std::nullopt;
  }
  return out;
}

/**
 * @brief Parse a compact `YYYYMMDD` day.
 */
inline std::optional<CalendarDate> parse_compact(std::string_view text) {
  if (text.size() != 8) {
    return std::nullopt;
  }
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }
  const std::string iso = std::string(text.substr(0, 4)) + "-" + std::string(text.substr(4, 2)) + "-" +
                          std::string(text.substr(6, 2));
  return parse_iso(iso);
}

/**
 * @brief Find an `AYYYYDDD` year/day-of-year token (e.g. `AQUA_MODIS.A2024321...`).
 */
inline std::optional<CalendarDate> find_year_day_of_year(const std::string& identifier) {
  static const std::regex kPattern("A(\\d{4})(\\d{3})");
  std::smatch m;
  if (!std::regex_search(identifier, m, kPattern)) {
    return std::nullopt;
  }
  return from_year_day_of_year(std::stoi(m[1].str()), std::stoi(m[2].str()));
}

/**
 * @brief Find a dot-delimited `.YYYYMMDD.` token (e.g. `AQUA_MODIS.20241117.L3m...`).
 */
inline std::optional<CalendarDate> find_dotted_compact_date(const std::string& identifier) {
  static const std::regex kPattern("\\.(\\d{8})\\.");
  std::smatch m;
  if (!std::regex_search(identifier, m, kPattern)) {
    return std::nullopt;
  }
  return parse_compact(m[1].str());
}

}  // namespace geohex::core::calendar
