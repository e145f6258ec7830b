/**
 * @file planar_hex_indexer.cpp
 * @brief Planar hexagonal indexer implementation.
 * @author geohex developers
 */

#include "geohex/hexgrid/planar_hex_indexer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numbers>

namespace geohex::hexgrid {
namespace {

constexpr std::int64_t kBaseColumns = 6;
constexpr std::int64_t kRowBias = std::int64_t{1} << 29U;
constexpr std::uint64_t kFieldMask = (std::uint64_t{1} << 30U) - 1U;
constexpr double kSqrt3 = std::numbers::sqrt3;

double hex_size_deg(int resolution) {
  return 360.0 / (static_cast<double>(PlanarHexIndexer::columns(resolution)) * kSqrt3);
}

struct Axial {
  std::int64_t q{};
  std::int64_t r{};
};

Axial cube_round(double qf, double rf) {
  const double sf = -qf - rf;
  double q = std::round(qf);
  double r = std::round(rf);
  const double s = std::round(sf);
  const double dq = std::abs(q - qf);
  const double dr = std::abs(r - rf);
  const double ds = std::abs(s - sf);
  if (dq > dr && dq > ds) {
    q = -r - s;
  } else if (dr > ds) {
    r = -q - s;
  }
  return Axial{static_cast<std::int64_t>(q), static_cast<std::int64_t>(r)};
}

std::int64_t wrap_column(std::int64_t col, std::int64_t columns) { return ((col % columns) + columns) % columns; }

}  // namespace

std::int64_t PlanarHexIndexer::columns(int resolution) noexcept { return kBaseColumns << resolution; }

double PlanarHexIndexer::circumradius_deg(int resolution) const { return hex_size_deg(resolution); }

std::optional<CellId> PlanarHexIndexer::cell(double lat_deg, double lon_deg, int resolution) const {
  if (resolution < kMinResolution || resolution > kMaxResolution) {
    return std::nullopt;
  }
  if (!std::isfinite(lat_deg) || !std::isfinite(lon_deg) || lat_deg < -90.0 || lat_deg > 90.0 || lon_deg < -180.0 ||
      lon_deg > 180.0) {
    return std::nullopt;
  }

  const double size = hex_size_deg(resolution);
  const double qf = (kSqrt3 / 3.0 * lon_deg - lat_deg / 3.0) / size;
  const double rf = (2.0 / 3.0 * lat_deg) / size;
  const Axial a = cube_round(qf, rf);

  const std::int64_t n = columns(resolution);
  const std::int64_t col = wrap_column(a.q + (a.r - (a.r & 1)) / 2, n);
  const std::int64_t row = a.r + kRowBias;

  const std::uint64_t value = (static_cast<std::uint64_t>(resolution) << 60U) |
                              ((static_cast<std::uint64_t>(col) & kFieldMask) << 30U) |
                              (static_cast<std::uint64_t>(row) & kFieldMask);
  return CellId{value};
}

int PlanarHexIndexer::cell_resolution(const CellId& cell) const { return static_cast<int>(cell.value >> 60U); }

core::LatLon PlanarHexIndexer::centroid(const CellId& cell) const {
  const int resolution = cell_resolution(cell);
  const double size = hex_size_deg(resolution);
  const auto col = static_cast<std::int64_t>((cell.value >> 30U) & kFieldMask);
  const std::int64_t row = static_cast<std::int64_t>(cell.value & kFieldMask) - kRowBias;

  double lon = kSqrt3 * size * (static_cast<double>(col) + 0.5 * static_cast<double>(row & 1));
  if (lon >= 180.0) {
    lon -= 360.0;
  }
  const double lat = std::clamp(1.5 * size * static_cast<double>(row), -90.0, 90.0);
  return core::LatLon{.lat_deg = lat, .lon_deg = lon};
}

}  // namespace geohex::hexgrid
