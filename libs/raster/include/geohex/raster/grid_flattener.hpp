/**
 * @file grid_flattener.hpp
 * @brief Flatten a lat/lon raster variable into canonical point records.
 * @author geohex developers
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "geohex/core/dataset.hpp"
#include "geohex/core/types.hpp"

namespace geohex::raster {

/**
 * @brief Output of flattening one raster unit.
 *
 * Ranges are computed over the whole unit before any point is dropped.
 */
struct FlattenResult {
  std::vector<core::PointRecord> points{};
  core::ValueRange value_range{};
  core::ValueRange lat_range{};
  core::ValueRange lon_range{};
  std::size_t grid_cells{};
  std::size_t dropped{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Raster → point converter.
 *
 * Coordinates are looked up as `lat`/`latitude` and `lon`/`longitude`. The
 * primary field is squeezed to 2D; it must match the (lat, lon) mesh either
 * directly or transposed. Swath products whose coordinates are 2D arrays of
 * the field's shape are flattened element-wise.
 */
class GridFlattener {
 public:
  struct Config {
    std::string primary_variable{};
    std::vector<std::string> ancillary_variables{};
    std::optional<double> valid_min{};
    std::optional<double> valid_max{};
  };

  explicit GridFlattener(Config config) : config_(std::move(config)) {}

  /**
   * @brief Flatten `dataset`; every emitted point carries `date`.
   * @return Points with `status` set; `StructuralMismatch` when a required
   * variable is missing or shapes cannot be reconciled.
   */
  [[nodiscard]] FlattenResult flatten(const core::RasterDataset& dataset,
                                      const std::optional<core::CalendarDate>& date) const;

  /**
   * @brief Names of every variable the flattener may read.
   */
  [[nodiscard]] std::vector<std::string> required_variables() const;

  [[nodiscard]] const Config& config() const noexcept { return config_; }

 private:
  Config config_{};
};

/**
 * @brief Shape with singleton dimensions removed.
 */
[[nodiscard]] std::vector<std::size_t> squeeze_shape(const std::vector<std::size_t>& shape);

/**
 * @brief Wrap longitudes given in (180, 360] into (-180, 0].
 */
[[nodiscard]] double normalize_longitude(double lon_deg) noexcept;

}  // namespace geohex::raster
