/**
 * @file hex_aggregator.cpp
 * @brief Cell grouping and statistics.
 * @author geohex developers
 */

#include "geohex/hexgrid/hex_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "geohex/core/calendar.hpp"

namespace geohex::hexgrid {
namespace {

using GroupKey = std::tuple<CellId, std::optional<std::string>, std::optional<int>>;

struct GroupSamples {
  std::vector<double> values{};
  std::map<std::string, std::vector<double>> ancillary{};
};

double sorted_mean(std::vector<double>& values) {
  std::sort(values.begin(), values.end());
  double sum = 0.0;
  for (const double v : values) {
    sum += v;
  }
  return sum / static_cast<double>(values.size());
}

}  // namespace

const char* confidence_label(std::size_t count) noexcept {
  if (count > 5U) {
    return "high";
  }
  if (count > 1U) {
    return "medium";
  }
  return "low";
}

CellStatistics compute_statistics(std::vector<double> values) {
  CellStatistics s{};
  if (values.empty()) {
    return s;
  }
  // Sorting fixes the summation order, so shuffled inputs give bit-identical results.
  std::sort(values.begin(), values.end());
  s.count = values.size();
  s.min = values.front();
  s.max = values.back();

  double sum = 0.0;
  for (const double v : values) {
    sum += v;
  }
  s.mean = sum / static_cast<double>(s.count);
  if (s.count < 2U) {
    s.std_dev = 0.0;
    return s;
  }
  double ss = 0.0;
  for (const double v : values) {
    ss += (v - s.mean) * (v - s.mean);
  }
  s.std_dev = std::sqrt(ss / static_cast<double>(s.count - 1U));
  return s;
}

bool HexAggregator::valid() const noexcept {
  return config_.resolution >= indexer_.min_resolution() && config_.resolution <= indexer_.max_resolution();
}

AggregatedTable HexAggregator::aggregate(const std::vector<core::PointRecord>& points,
                                         const core::UnitMetadata& metadata) const {
  AggregatedTable table{};
  table.resolution = config_.resolution;
  table.metadata = metadata;
  if (!valid()) {
    table.status = core::Status::InvalidInput;
    table.message = fmt::format("resolution {} unsupported by '{}' indexer", config_.resolution, indexer_.name());
    return table;
  }

  std::map<GroupKey, GroupSamples> groups;
  for (const core::PointRecord& p : points) {
    if (std::isnan(p.value) || !core::has_valid_coordinates(p)) {
      ++table.rejected_points;
      continue;
    }
    const auto cell = indexer_.cell(p.latitude, p.longitude, config_.resolution);
    if (!cell.has_value()) {
      ++table.rejected_points;
      continue;
    }
    std::optional<std::string> category{};
    if (config_.group_by_category) {
      category = p.category;
    }
    std::optional<int> day{};
    if (config_.group_by_date && p.date.has_value()) {
      day = core::calendar::to_serial(*p.date);
    }
    GroupSamples& group = groups[GroupKey{*cell, std::move(category), day}];
    group.values.push_back(p.value);
    for (const auto& [name, v] : p.ancillary) {
      if (std::isfinite(v)) {
        group.ancillary[name].push_back(v);
      }
    }
  }

  table.rows.reserve(groups.size());
  double sum_of_means = 0.0;
  for (auto& [key, group] : groups) {
    AggregatedRow row{};
    row.cell = std::get<0>(key);
    row.category = std::get<1>(key);
    if (config_.group_by_date) {
      if (std::get<2>(key).has_value()) {
        row.date = core::calendar::civil_from_days(*std::get<2>(key));
      }
    } else {
      row.date = metadata.date;
    }
    row.stats = compute_statistics(std::move(group.values));
    for (auto& [name, samples] : group.ancillary) {
      row.ancillary_means.emplace(name, sorted_mean(samples));
    }
    row.centroid = indexer_.centroid(row.cell);
    row.confidence = confidence_label(row.stats.count);
    sum_of_means += row.stats.mean;
    table.rows.push_back(std::move(row));
  }

  if (!table.rows.empty()) {
    const double overall = sum_of_means / static_cast<double>(table.rows.size());
    for (AggregatedRow& row : table.rows) {
      row.anomaly = row.stats.mean - overall;
    }
  }

  if (config_.min_count > 1U) {
    const auto before = table.rows.size();
    table.rows.erase(std::remove_if(table.rows.begin(), table.rows.end(),
                                    [this](const AggregatedRow& r) { return r.stats.count < config_.min_count; }),
                     table.rows.end());
    table.filtered_groups = before - table.rows.size();
  }

  spdlog::debug("aggregated {} points into {} cells at resolution {} ({} rejected, {} filtered)", points.size(),
                table.rows.size(), config_.resolution, table.rejected_points, table.filtered_groups);
  return table;
}

}  // namespace geohex::hexgrid
