/**
 * @file h3_hex_indexer.hpp
 * @brief Uber H3 backed cell indexer.
 * @author geohex developers
 */
#pragma once

#include "geohex/hexgrid/hex_indexer.hpp"

namespace geohex::hexgrid {

/**
 * @brief Cells of the H3 icosahedral hexagon grid (H3 v4 C API).
 *
 * Cell ids are native `H3Index` values, so `to_string` matches the usual H3
 * string form. Resolutions 0..15.
 */
class H3HexIndexer final : public IHexIndexer {
 public:
  static constexpr int kMinResolution = 0;
  static constexpr int kMaxResolution = 15;

  [[nodiscard]] std::string_view name() const noexcept override { return "h3"; }
  [[nodiscard]] int min_resolution() const noexcept override { return kMinResolution; }
  [[nodiscard]] int max_resolution() const noexcept override { return kMaxResolution; }

  [[nodiscard]] std::optional<CellId> cell(double lat_deg, double lon_deg, int resolution) const override;
  [[nodiscard]] int cell_resolution(const CellId& cell) const override;
  /// NaN coordinates for an id that is not a valid H3 cell.
  [[nodiscard]] core::LatLon centroid(const CellId& cell) const override;
  /// Average hexagon edge length at `resolution` as great-circle degrees.
  [[nodiscard]] double circumradius_deg(int resolution) const override;
};

}  // namespace geohex::hexgrid
