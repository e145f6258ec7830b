/**
 * @file hex_indexer.hpp
 * @brief Discrete global hexagonal cell indexing interface.
 * @author geohex developers
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "geohex/core/types.hpp"

namespace geohex::hexgrid {

/**
 * @brief Opaque 64-bit cell identifier. Its bit layout belongs to the indexer that produced it.
 */
struct CellId {
  std::uint64_t value{};

  friend bool operator==(const CellId&, const CellId&) = default;
  friend auto operator<=>(const CellId&, const CellId&) = default;
};

/**
 * @brief Lowercase hexadecimal form of a cell id without leading zeros (the H3 string form).
 */
[[nodiscard]] std::string to_string(const CellId& cell);
[[nodiscard]] std::optional<CellId> parse_cell_id(std::string_view text);

/**
 * @brief Cell indexing capability selected once at startup.
 */
class IHexIndexer {
 public:
  virtual ~IHexIndexer() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
  [[nodiscard]] virtual int min_resolution() const noexcept = 0;
  [[nodiscard]] virtual int max_resolution() const noexcept = 0;

  /**
   * @brief Deterministic cell containing (lat, lon) at `resolution`.
   * @return std::nullopt for invalid coordinates or an unsupported resolution.
   */
  [[nodiscard]] virtual std::optional<CellId> cell(double lat_deg, double lon_deg, int resolution) const = 0;

  /**
   * @brief Resolution encoded in `cell`.
   */
  [[nodiscard]] virtual int cell_resolution(const CellId& cell) const = 0;

  /**
   * @brief Canonical centre of a cell, independent of any aggregated data.
   */
  [[nodiscard]] virtual core::LatLon centroid(const CellId& cell) const = 0;

  /**
   * @brief Typical centre-to-vertex distance of a cell at `resolution`, in degrees.
   */
  [[nodiscard]] virtual double circumradius_deg(int resolution) const = 0;
};

/**
 * @brief Build the indexer named `backend`: "h3" (when built with H3) or "planar".
 * @return nullptr when the backend is not available in this build.
 */
[[nodiscard]] std::unique_ptr<IHexIndexer> make_hex_indexer(std::string_view backend);

}  // namespace geohex::hexgrid
