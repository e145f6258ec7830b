/**
 * @file hex_indexer.cpp
 * @brief Cell id text form and indexer backend selection.
 * @author geohex developers
 */

#include "geohex/hexgrid/hex_indexer.hpp"

#include <fmt/format.h>

#include "geohex/hexgrid/planar_hex_indexer.hpp"
#ifdef GEOHEX_HAVE_H3
#include "geohex/hexgrid/h3_hex_indexer.hpp"
#endif

namespace geohex::hexgrid {

std::string to_string(const CellId& cell) { return fmt::format("{:x}", cell.value); }

std::optional<CellId> parse_cell_id(std::string_view text) {
  if (text.empty() || text.size() > 16U) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  for (const char c : text) {
    std::uint64_t digit = 0;
    if (c >= '0' && c <= '9') {
      digit = static_cast<std::uint64_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<std::uint64_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<std::uint64_t>(c - 'A' + 10);
    } else {
      return std::nullopt;
    }
    value = (value << 4U) | digit;
  }
  return CellId{value};
}

std::unique_ptr<IHexIndexer> make_hex_indexer(std::string_view backend) {
#ifdef GEOHEX_HAVE_H3
  if (backend == "h3") {
    return std::make_unique<H3HexIndexer>();
  }
#endif
  if (backend == "planar") {
    return std::make_unique<PlanarHexIndexer>();
  }
  return {};
}

}  // namespace geohex::hexgrid
