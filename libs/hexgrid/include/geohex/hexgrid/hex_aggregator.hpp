/**
 * @file hex_aggregator.hpp
 * @brief Group points by hexagonal cell and compute per-cell statistics.
 * @author geohex developers
 */
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "geohex/core/types.hpp"
#include "geohex/hexgrid/hex_indexer.hpp"

namespace geohex::hexgrid {

/**
 * @brief Statistics of the primary value inside one group.
 *
 * `std_dev` is the sample standard deviation (n - 1 denominator); a group of
 * one sample has `std_dev == 0`.
 */
struct CellStatistics {
  std::size_t count{};
  double mean{};
  double min{};
  double max{};
  double std_dev{};
};

/**
 * @brief One output row: a (cell[, category][, date]) group.
 */
struct AggregatedRow {
  CellId cell{};
  std::optional<std::string> category{};
  std::optional<core::CalendarDate> date{};
  CellStatistics stats{};
  core::LatLon centroid{};
  std::string confidence{};
  double anomaly{};
  /// Mean of each ancillary field over the group's accepted points (finite samples only).
  std::map<std::string, double> ancillary_means{};
};

/**
 * @brief Aggregated rows of one unit plus the unit's constant metadata.
 */
struct AggregatedTable {
  int resolution{};
  core::UnitMetadata metadata{};
  std::vector<AggregatedRow> rows{};
  std::size_t rejected_points{};
  std::size_t filtered_groups{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Confidence label for a sample count: `high` (> 5), `medium` (> 1), `low`.
 */
[[nodiscard]] const char* confidence_label(std::size_t count) noexcept;

/**
 * @brief Statistics of a sample set. Independent of input order.
 */
[[nodiscard]] CellStatistics compute_statistics(std::vector<double> values);

/**
 * @brief Fixed-resolution cell aggregator.
 */
class HexAggregator {
 public:
  struct Config {
    int resolution{5};
    bool group_by_category{false};
    bool group_by_date{false};
    std::size_t min_count{1};
  };

  HexAggregator(Config config, const IHexIndexer& indexer) : config_(config), indexer_(indexer) {}

  /**
   * @brief True when the indexer supports the configured resolution.
   */
  [[nodiscard]] bool valid() const noexcept;

  /**
   * @brief Aggregate `points`; rows are ordered by (cell, category, date).
   *
   * Points with a NaN value or invalid coordinates are rejected and never
   * counted. Groups with fewer than `min_count` samples are removed after
   * statistics, confidence and anomaly have been computed.
   */
  [[nodiscard]] AggregatedTable aggregate(const std::vector<core::PointRecord>& points,
                                          const core::UnitMetadata& metadata) const;

  [[nodiscard]] const Config& config() const noexcept { return config_; }
  [[nodiscard]] const IHexIndexer& indexer() const noexcept { return indexer_; }

 private:
  Config config_{};
  const IHexIndexer& indexer_;
};

}  // namespace geohex::hexgrid
