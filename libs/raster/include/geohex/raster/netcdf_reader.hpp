/**
 * @file netcdf_reader.hpp
 * @brief netCDF-C backed raster reader.
 * @author geohex developers
 */
#pragma once

#include "geohex/core/interfaces.hpp"

namespace geohex::raster {

/**
 * @brief Reads requested variables and global text attributes from a netCDF file.
 *
 * Values equal to `_FillValue`/`missing_value` become NaN; `scale_factor` and
 * `add_offset` are applied to the rest. Those four attributes are consumed by
 * the unpacking and are not copied into the variable's attribute map.
 */
class NetcdfRasterReader final : public core::IRasterReader {
 public:
  [[nodiscard]] core::RasterReadResult read(const std::filesystem::path& path,
                                            const std::vector<std::string>& variables) const override;
};

}  // namespace geohex::raster
