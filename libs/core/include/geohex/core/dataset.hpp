/**
 * @file dataset.hpp
 * @brief In-memory raster container handed from readers to the flattener.
 * @author geohex developers
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace geohex::core {

/**
 * @brief One named N-dimensional variable.
 *
 * `data` is row-major over `shape` (last dimension varies fastest). Readers
 * store missing samples as NaN.
 */
struct RasterVariable {
  std::vector<std::size_t> shape{};
  std::vector<double> data{};
  std::map<std::string, std::string> attributes{};

  [[nodiscard]] std::size_t element_count() const noexcept {
    if (shape.empty()) {
      return 0U;
    }
    std::size_t n = 1U;
    for (const std::size_t d : shape) {
      n *= d;
    }
    return n;
  }
};

/**
 * @brief Named variables plus global string attributes of one raster file.
 */
struct RasterDataset {
  std::filesystem::path source{};
  std::map<std::string, RasterVariable> variables{};
  std::map<std::string, std::string> attributes{};

  [[nodiscard]] const RasterVariable* find(const std::string& name) const {
    const auto it = variables.find(name);
    return (it == variables.end()) ? nullptr : &it->second;
  }

  [[nodiscard]] std::optional<std::string> attribute(const std::string& name) const {
    const auto it = attributes.find(name);
    if (it == attributes.end() || it->second.empty()) {
      return std::nullopt;
    }
    return it->second;
  }
};

}  // namespace geohex::core
