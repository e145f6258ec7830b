/**
 * @file date_resolver.hpp
 * @brief Ordered date inference strategies for fetched units.
 * @author geohex developers
 */
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "geohex/core/dataset.hpp"
#include "geohex/core/types.hpp"

namespace geohex::raster {

/**
 * @brief Inputs every strategy may probe.
 */
struct DateContext {
  const std::map<std::string, std::string>& attributes;
  std::string identifier{};
};

/**
 * @brief One named inference step.
 */
struct DateStrategy {
  std::string name{};
  std::function<std::optional<core::CalendarDate>(const DateContext&)> resolve{};
};

/**
 * @brief Resolved day plus the strategy that produced it.
 *
 * `date == std::nullopt` means no strategy succeeded; `strategy` is empty then.
 */
struct ResolvedDate {
  std::optional<core::CalendarDate> date{};
  std::string strategy{};
};

/**
 * @brief First-success chain of date strategies.
 */
class DateResolver {
 public:
  explicit DateResolver(std::vector<DateStrategy> strategies) : strategies_(std::move(strategies)) {}

  /**
   * @brief Chain used for satellite granules:
   * `time_coverage_start` → `time_coverage_end` → `AYYYYDDD` in the file name →
   * `date_created` → `.YYYYMMDD.` in the file name.
   */
  static DateResolver with_default_strategies();

  [[nodiscard]] ResolvedDate resolve(const DateContext& context) const;
  [[nodiscard]] ResolvedDate resolve(const core::RasterDataset& dataset) const;

  [[nodiscard]] const std::vector<DateStrategy>& strategies() const noexcept { return strategies_; }

 private:
  std::vector<DateStrategy> strategies_{};
};

/**
 * @brief Parse an attribute value holding a timestamp (`2024-11-17T00:00:00Z`),
 * an ISO day, or a compact `YYYYMMDD` day.
 */
[[nodiscard]] std::optional<core::CalendarDate> parse_timestamp_day(std::string_view text);

}  // namespace geohex::raster
