/**
 * @file netcdf_reader.cpp
 * @brief netCDF-C raster reader implementation.
 * @author geohex developers
 */

#include "geohex/raster/netcdf_reader.hpp"

#include <netcdf.h>

#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace geohex::raster {
namespace {

std::string nc_error(int status) {
  const char* msg = nc_strerror(status);
  return (msg != nullptr) ? std::string(msg) : std::string("unknown netcdf error");
}

/**
 * @brief Closes the dataset handle on scope exit.
 */
class NcFile {
 public:
  explicit NcFile(const std::filesystem::path& path) { status_ = nc_open(path.c_str(), NC_NOWRITE, &ncid_); }
  ~NcFile() {
    if (status_ == NC_NOERR) {
      nc_close(ncid_);
    }
  }
  NcFile(const NcFile&) = delete;
  NcFile& operator=(const NcFile&) = delete;

  [[nodiscard]] int id() const noexcept { return ncid_; }
  [[nodiscard]] int status() const noexcept { return status_; }

 private:
  int ncid_{-1};
  int status_{NC_NOERR};
};

std::optional<std::string> attribute_text(int ncid, int varid, const char* name) {
  nc_type type = NC_NAT;
  std::size_t len = 0;
  if (nc_inq_att(ncid, varid, name, &type, &len) != NC_NOERR) {
    return std::nullopt;
  }
  if (type == NC_CHAR) {
    std::string out(len, '\0');
    if (len > 0 && nc_get_att_text(ncid, varid, name, out.data()) != NC_NOERR) {
      return std::nullopt;
    }
    // Text attributes are not guaranteed to be NUL-terminated.
    while (!out.empty() && (out.back() == '\0' || out.back() == ' ')) {
      out.pop_back();
    }
    return out;
  }
  if (type == NC_STRING) {
    char* value = nullptr;
    if (len != 1 || nc_get_att_string(ncid, varid, name, &value) != NC_NOERR) {
      return std::nullopt;
    }
    std::string out = (value != nullptr) ? std::string(value) : std::string{};
    nc_free_string(1, &value);
    return out;
  }
  if (len == 0) {
    return std::nullopt;
  }
  std::vector<double> values(len);
  if (nc_get_att_double(ncid, varid, name, values.data()) != NC_NOERR) {
    return std::nullopt;
  }
  return fmt::format("{}", values.front());
}

std::map<std::string, std::string> read_attributes(int ncid, int varid, const std::set<std::string>& skip) {
  std::map<std::string, std::string> out;
  int natts = 0;
  if (nc_inq_varnatts(ncid, varid, &natts) != NC_NOERR) {
    return out;
  }
  for (int i = 0; i < natts; ++i) {
    char name[NC_MAX_NAME + 1] = {0};
    if (nc_inq_attname(ncid, varid, i, name) != NC_NOERR || skip.count(name) > 0U) {
      continue;
    }
    if (auto text = attribute_text(ncid, varid, name)) {
      out.emplace(name, std::move(*text));
    }
  }
  return out;
}

std::optional<double> attribute_double(int ncid, int varid, const char* name) {
  nc_type type = NC_NAT;
  std::size_t len = 0;
  if (nc_inq_att(ncid, varid, name, &type, &len) != NC_NOERR || len == 0 || type == NC_CHAR || type == NC_STRING) {
    return std::nullopt;
  }
  std::vector<double> values(len);
  if (nc_get_att_double(ncid, varid, name, values.data()) != NC_NOERR) {
    return std::nullopt;
  }
  return values.front();
}

}  // namespace

core::RasterReadResult NetcdfRasterReader::read(const std::filesystem::path& path,
                                                const std::vector<std::string>& variables) const {
  core::RasterReadResult out{};
  out.dataset.source = path;

  NcFile file(path);
  if (file.status() != NC_NOERR) {
    out.status = core::Status::IoError;
    out.message = fmt::format("nc_open {} failed: {}", path.string(), nc_error(file.status()));
    return out;
  }
  const int ncid = file.id();
  out.dataset.attributes = read_attributes(ncid, NC_GLOBAL, {});

  static const std::set<std::string> kPackingAttributes{"_FillValue", "missing_value", "scale_factor", "add_offset"};
  std::set<std::string> seen;
  for (const std::string& name : variables) {
    if (!seen.insert(name).second) {
      continue;
    }
    int varid = -1;
    if (nc_inq_varid(ncid, name.c_str(), &varid) != NC_NOERR) {
      continue;
    }

    int ndims = 0;
    int rc = nc_inq_varndims(ncid, varid, &ndims);
    if (rc != NC_NOERR) {
      out.status = core::Status::IoError;
      out.message = fmt::format("nc_inq_varndims {} failed: {}", name, nc_error(rc));
      return out;
    }
    std::vector<int> dimids(static_cast<std::size_t>(ndims));
    if (ndims > 0 && (rc = nc_inq_vardimid(ncid, varid, dimids.data())) != NC_NOERR) {
      out.status = core::Status::IoError;
      out.message = fmt::format("nc_inq_vardimid {} failed: {}", name, nc_error(rc));
      return out;
    }

    core::RasterVariable var{};
    for (const int dimid : dimids) {
      std::size_t len = 0;
      if ((rc = nc_inq_dimlen(ncid, dimid, &len)) != NC_NOERR) {
        out.status = core::Status::IoError;
        out.message = fmt::format("nc_inq_dimlen {} failed: {}", name, nc_error(rc));
        return out;
      }
      var.shape.push_back(len);
    }
    if (var.shape.empty()) {
      var.shape.push_back(1U);
    }

    var.data.resize(var.element_count());
    if (!var.data.empty() && (rc = nc_get_var_double(ncid, varid, var.data.data())) != NC_NOERR) {
      out.status = core::Status::IoError;
      out.message = fmt::format("nc_get_var_double {} failed: {}", name, nc_error(rc));
      return out;
    }

    const auto fill = attribute_double(ncid, varid, "_FillValue");
    const auto missing = attribute_double(ncid, varid, "missing_value");
    const double scale = attribute_double(ncid, varid, "scale_factor").value_or(1.0);
    const double offset = attribute_double(ncid, varid, "add_offset").value_or(0.0);
    for (double& v : var.data) {
      if ((fill.has_value() && v == *fill) || (missing.has_value() && v == *missing)) {
        v = std::numeric_limits<double>::quiet_NaN();
        continue;
      }
      v = v * scale + offset;
    }
    var.attributes = read_attributes(ncid, varid, kPackingAttributes);
    out.dataset.variables.emplace(name, std::move(var));
  }

  spdlog::debug("{}: read {} variables, {} global attributes", path.filename().string(),
                out.dataset.variables.size(), out.dataset.attributes.size());
  return out;
}

}  // namespace geohex::raster
