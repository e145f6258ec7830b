/**
 * @file planar_hex_indexer.hpp
 * @brief Pointy-top hexagonal grid over the equirectangular (lon, lat) plane.
 * @author geohex developers
 */
#pragma once

#include <cstdint>

#include "geohex/hexgrid/hex_indexer.hpp"

namespace geohex::hexgrid {

/**
 * @brief Global hexagonal partition with `6 * 2^res` columns around each row.
 *
 * Hexagon size is chosen so the column pitch divides 360 degrees exactly,
 * which makes the tiling wrap seamlessly at the antimeridian. Cells are
 * addressed in odd-row offset coordinates:
 *
 * - bits 60..63 resolution
 * - bits 30..59 column, in [0, columns)
 * - bits  0..29 row + 2^29
 */
class PlanarHexIndexer final : public IHexIndexer {
 public:
  static constexpr int kMinResolution = 0;
  static constexpr int kMaxResolution = 15;

  [[nodiscard]] std::string_view name() const noexcept override { return "planar"; }
  [[nodiscard]] int min_resolution() const noexcept override { return kMinResolution; }
  [[nodiscard]] int max_resolution() const noexcept override { return kMaxResolution; }

  [[nodiscard]] std::optional<CellId> cell(double lat_deg, double lon_deg, int resolution) const override;
  [[nodiscard]] int cell_resolution(const CellId& cell) const override;
  [[nodiscard]] core::LatLon centroid(const CellId& cell) const override;
  [[nodiscard]] double circumradius_deg(int resolution) const override;

  [[nodiscard]] static std::int64_t columns(int resolution) noexcept;
};

}  // namespace geohex::hexgrid
