/**
 * @file types.hpp
 * @brief Core domain types for geohex.
 * @author geohex developers
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>

namespace geohex::core {

/**
 * @brief Standard status code used by pipeline stages.
 */
enum class Status : std::uint8_t {
  Ok,
  InvalidInput,
  NotFound,
  DataUnavailable,
  StructuralMismatch,
  TransportError,
  AlreadyExists,
  IoError
};

inline const char* status_to_string(Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::NotFound:
      return "not_found";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::StructuralMismatch:
      return "structural_mismatch";
    case Status::TransportError:
      return "transport_error";
    case Status::AlreadyExists:
      return "already_exists";
    case Status::IoError:
      return "io_error";
    default:
      return "unknown";
  }
}

/**
 * @brief Proleptic Gregorian calendar day.
 */
struct CalendarDate {
  int year{1970};
  unsigned month{1};
  unsigned day{1};

  friend bool operator==(const CalendarDate&, const CalendarDate&) = default;
  friend auto operator<=>(const CalendarDate&, const CalendarDate&) = default;
};

/**
 * @brief Closed date interval [start, end] used as a unit of work.
 */
struct TimeWindow {
  CalendarDate start{};
  CalendarDate end{};

  friend bool operator==(const TimeWindow&, const TimeWindow&) = default;
};

/**
 * @brief Closed numeric interval; empty until the first sample is included.
 */
struct ValueRange {
  double min{std::numeric_limits<double>::quiet_NaN()};
  double max{std::numeric_limits<double>::quiet_NaN()};

  [[nodiscard]] bool empty() const noexcept { return std::isnan(min) || std::isnan(max); }

  void include(double v) noexcept {
    if (!std::isfinite(v)) {
      return;
    }
    if (empty()) {
      min = v;
      max = v;
      return;
    }
    min = (v < min) ? v : min;
    max = (v > max) ? v : max;
  }

  void merge(const ValueRange& other) noexcept {
    include(other.min);
    include(other.max);
  }
};

/**
 * @brief Geographic position in degrees.
 */
struct LatLon {
  double lat_deg{};
  double lon_deg{};
};

/**
 * @brief Canonical point produced from any raw input.
 *
 * A NaN `value` marks a missing primary sample. `date == std::nullopt` is the
 * explicit unknown-date marker.
 */
struct PointRecord {
  double latitude{};
  double longitude{};
  double value{std::numeric_limits<double>::quiet_NaN()};
  std::optional<CalendarDate> date{};
  std::optional<std::string> category{};
  std::map<std::string, double> ancillary{};
};

[[nodiscard]] inline bool has_valid_coordinates(const PointRecord& p) noexcept {
  return std::isfinite(p.latitude) && std::isfinite(p.longitude) && p.latitude >= -90.0 && p.latitude <= 90.0 &&
         p.longitude >= -180.0 && p.longitude <= 180.0;
}

/**
 * @brief Constant metadata of one unit, repeated on every output row.
 */
struct UnitMetadata {
  std::optional<CalendarDate> date{};
  std::string date_created{};
  ValueRange value_range{};
  ValueRange lat_range{};
  ValueRange lon_range{};
};

}  // namespace geohex::core
