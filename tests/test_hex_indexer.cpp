/**
 * @file test_hex_indexer.cpp
 * @brief Indexer backend selection, cell id text and planar indexer tests.
 * @author geohex developers
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "geohex/hexgrid/hex_indexer.hpp"
#include "geohex/hexgrid/planar_hex_indexer.hpp"

namespace {

double planar_distance_deg(double lat_a, double lon_a, double lat_b, double lon_b) {
  double dlon = std::abs(lon_a - lon_b);
  if (dlon > 180.0) {
    dlon = 360.0 - dlon;
  }
  return std::hypot(lat_a - lat_b, dlon);
}

}  // namespace

int main() {
  using namespace geohex;

  const auto indexer = hexgrid::make_hex_indexer("planar");
  if (!indexer || indexer->name() != "planar") {
    spdlog::error("planar backend unavailable");
    return 1;
  }
  if (hexgrid::make_hex_indexer("s2") || hexgrid::make_hex_indexer("")) {
    spdlog::error("unknown backend must not be constructed");
    return 2;
  }
#ifdef GEOHEX_HAVE_H3
  const bool h3_expected = true;
#else
  const bool h3_expected = false;
#endif
  if (static_cast<bool>(hexgrid::make_hex_indexer("h3")) != h3_expected) {
    spdlog::error("h3 backend availability does not match the build");
    return 11;
  }

  const auto a = indexer->cell(-23.55, -46.63, 5);
  const auto b = indexer->cell(-23.55, -46.63, 5);
  if (!a.has_value() || !b.has_value() || *a != *b || indexer->cell_resolution(*a) != 5) {
    spdlog::error("indexing is not deterministic");
    return 3;
  }

  for (int res = 0; res <= 8; ++res) {
    for (double lat = -85.0; lat <= 85.0; lat += 7.3) {
      for (double lon = -179.5; lon < 180.0; lon += 11.9) {
        const auto c = indexer->cell(lat, lon, res);
        if (!c.has_value()) {
          spdlog::error("no cell for ({}, {}) at res {}", lat, lon, res);
          return 4;
        }
        const core::LatLon centre = indexer->centroid(*c);
        if (planar_distance_deg(lat, lon, centre.lat_deg, centre.lon_deg) > indexer->circumradius_deg(res) + 1e-9) {
          spdlog::error("point ({}, {}) farther than circumradius from its centroid at res {}", lat, lon, res);
          return 5;
        }
        if (indexer->cell(centre.lat_deg, centre.lon_deg, res) != c) {
          spdlog::error("centroid does not index back into its own cell");
          return 6;
        }
      }
    }
  }

  const auto east = indexer->cell(0.0, 180.0, 4);
  const auto west = indexer->cell(0.0, -180.0, 4);
  if (!east.has_value() || east != west) {
    spdlog::error("antimeridian must map to one cell");
    return 7;
  }

  if (indexer->cell(91.0, 0.0, 5).has_value() || indexer->cell(0.0, 181.0, 5).has_value() ||
      indexer->cell(std::nan(""), 0.0, 5).has_value() || indexer->cell(0.0, 0.0, 16).has_value()) {
    spdlog::error("invalid input must yield no cell");
    return 8;
  }

  if (indexer->circumradius_deg(6) >= indexer->circumradius_deg(5)) {
    spdlog::error("higher resolution must give smaller cells");
    return 9;
  }

  const auto parsed = hexgrid::parse_cell_id(hexgrid::to_string(*a));
  if (!parsed.has_value() || *parsed != *a || hexgrid::parse_cell_id("xyz").has_value() ||
      hexgrid::parse_cell_id("").has_value() || hexgrid::parse_cell_id("12345678901234567").has_value()) {
    spdlog::error("cell id text form failed");
    return 10;
  }
  if (hexgrid::to_string(hexgrid::CellId{0x85283473fffffffULL}) != "85283473fffffff" ||
      hexgrid::parse_cell_id("85283473FFFFFFF") != hexgrid::CellId{0x85283473fffffffULL}) {
    spdlog::error("cell ids must use the unpadded hexadecimal form");
    return 12;
  }

  return 0;
}
