/**
 * @file test_h3_indexer.cpp
 * @brief H3 backend tests (built only when H3 is available).
 * @author geohex developers
 */

#include <cmath>
#include <numbers>
#include <vector>

#include <spdlog/spdlog.h>

#include "geohex/hexgrid/h3_hex_indexer.hpp"
#include "geohex/hexgrid/hex_aggregator.hpp"

namespace {

double great_circle_deg(double lat_a, double lon_a, double lat_b, double lon_b) {
  constexpr double kDeg = std::numbers::pi / 180.0;
  const double c = std::sin(lat_a * kDeg) * std::sin(lat_b * kDeg) +
                   std::cos(lat_a * kDeg) * std::cos(lat_b * kDeg) * std::cos((lon_a - lon_b) * kDeg);
  return std::acos(std::fmin(1.0, std::fmax(-1.0, c))) / kDeg;
}

}  // namespace

int main() {
  using namespace geohex;

  const auto indexer = hexgrid::make_hex_indexer("h3");
  if (!indexer || indexer->name() != "h3") {
    spdlog::error("h3 backend unavailable");
    return 1;
  }

  // Reference cell from the H3 documentation.
  const auto ref = indexer->cell(37.3615593, -122.0553238, 5);
  if (!ref.has_value() || ref->value != 0x85283473fffffffULL || hexgrid::to_string(*ref) != "85283473fffffff" ||
      indexer->cell_resolution(*ref) != 5) {
    spdlog::error("reference cell mismatch: {}", ref.has_value() ? hexgrid::to_string(*ref) : "none");
    return 2;
  }

  for (int res = 0; res <= 9; res += 3) {
    for (double lat = -80.0; lat <= 80.0; lat += 20.0) {
      for (double lon = -170.0; lon < 180.0; lon += 40.0) {
        const auto c = indexer->cell(lat, lon, res);
        if (!c.has_value()) {
          spdlog::error("no cell for ({}, {}) at res {}", lat, lon, res);
          return 3;
        }
        const core::LatLon centre = indexer->centroid(*c);
        if (great_circle_deg(lat, lon, centre.lat_deg, centre.lon_deg) > 2.0 * indexer->circumradius_deg(res)) {
          spdlog::error("centroid of ({}, {}) too far at res {}", lat, lon, res);
          return 4;
        }
        if (indexer->cell(centre.lat_deg, centre.lon_deg, res) != c) {
          spdlog::error("centroid does not index back into its own cell");
          return 5;
        }
      }
    }
  }

  if (indexer->cell(91.0, 0.0, 5).has_value() || indexer->cell(0.0, 0.0, 16).has_value() ||
      indexer->cell(std::nan(""), 0.0, 5).has_value() || !std::isnan(indexer->centroid(hexgrid::CellId{0}).lat_deg)) {
    spdlog::error("invalid input must yield no cell");
    return 6;
  }
  if (indexer->circumradius_deg(6) >= indexer->circumradius_deg(5)) {
    spdlog::error("higher resolution must give smaller cells");
    return 7;
  }

  const std::vector<core::PointRecord> points{
      {.latitude = 37.3615593, .longitude = -122.0553238, .value = 2.0},
      {.latitude = 37.3615600, .longitude = -122.0553200, .value = 4.0},
  };
  const hexgrid::HexAggregator aggregator({.resolution = 5}, *indexer);
  const auto table = aggregator.aggregate(points, core::UnitMetadata{});
  if (table.rows.size() != 1U || table.rows[0].cell != *ref || table.rows[0].stats.count != 2U ||
      std::abs(table.rows[0].stats.mean - 3.0) > 1e-12) {
    spdlog::error("aggregation over h3 cells failed");
    return 8;
  }

  return 0;
}
