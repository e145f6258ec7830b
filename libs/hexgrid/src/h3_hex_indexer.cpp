/**
 * @file h3_hex_indexer.cpp
 * @brief H3 indexer implementation.
 * @author geohex developers
 */

#include "geohex/hexgrid/h3_hex_indexer.hpp"

#include <cmath>
#include <limits>
#include <numbers>

#include <h3/h3api.h>

namespace geohex::hexgrid {
namespace {

// Mean Earth radius used by H3 (km) -> km per degree of great-circle arc.
constexpr double kKmPerDegree = 6371.007180918475 * std::numbers::pi / 180.0;

}  // namespace

std::optional<CellId> H3HexIndexer::cell(double lat_deg, double lon_deg, int resolution) const {
  if (resolution < kMinResolution || resolution > kMaxResolution) {
    return std::nullopt;
  }
  if (!std::isfinite(lat_deg) || !std::isfinite(lon_deg) || lat_deg < -90.0 || lat_deg > 90.0 || lon_deg < -180.0 ||
      lon_deg > 180.0) {
    return std::nullopt;
  }
  const LatLng point{.lat = degsToRads(lat_deg), .lng = degsToRads(lon_deg)};
  H3Index index = 0;
  if (latLngToCell(&point, resolution, &index) != E_SUCCESS) {
    return std::nullopt;
  }
  return CellId{index};
}

int H3HexIndexer::cell_resolution(const CellId& cell) const { return getResolution(cell.value); }

core::LatLon H3HexIndexer::centroid(const CellId& cell) const {
  LatLng centre{};
  if (isValidCell(cell.value) == 0 || cellToLatLng(cell.value, &centre) != E_SUCCESS) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    return core::LatLon{.lat_deg = nan, .lon_deg = nan};
  }
  return core::LatLon{.lat_deg = radsToDegs(centre.lat), .lon_deg = radsToDegs(centre.lng)};
}

double H3HexIndexer::circumradius_deg(int resolution) const {
  double edge_km = 0.0;
  if (getHexagonEdgeLengthAvgKm(resolution, &edge_km) != E_SUCCESS) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return edge_km / kKmPerDegree;
}

}  // namespace geohex::hexgrid
