/**
 * @file interfaces.hpp
 * @brief Core collaborator interfaces shared across geohex libraries.
 * @author geohex developers
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "geohex/core/dataset.hpp"
#include "geohex/core/types.hpp"

namespace geohex::core {

/**
 * @brief Result of reading one raster container.
 */
struct RasterReadResult {
  RasterDataset dataset{};
  Status status{Status::Ok};
  std::string message{};
};

/**
 * @brief Interface for raster container readers (netCDF, in-memory fixtures).
 */
class IRasterReader {
 public:
  virtual ~IRasterReader() = default;
  /**
   * @brief Read the named variables and all global attributes of a file.
   * @param path Container path.
   * @param variables Variable names to load; names absent from the file are ignored.
   * @return Dataset with `status` set.
   */
  [[nodiscard]] virtual RasterReadResult read(const std::filesystem::path& path,
                                              const std::vector<std::string>& variables) const = 0;
};

}  // namespace geohex::core
