/**
 * @file grid_flattener.cpp
 * @brief Raster flattening implementation.
 * @author geohex developers
 */

#include "geohex/raster/grid_flattener.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>

#include <Eigen/Dense>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace geohex::raster {
namespace {

using RowMajorMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const core::RasterVariable* find_first(const core::RasterDataset& ds, const char* a, const char* b) {
  if (const auto* v = ds.find(a)) {
    return v;
  }
  return ds.find(b);
}

std::optional<double> numeric_attribute(const core::RasterVariable& var, const char* name) {
  const auto it = var.attributes.find(name);
  if (it == var.attributes.end() || it->second.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double v = std::strtod(it->second.c_str(), &end);
  if (end == it->second.c_str()) {
    return std::nullopt;
  }
  return v;
}

/**
 * @brief Copy a squeezed 2D variable into a matrix with sentinels replaced by NaN.
 */
Eigen::MatrixXd masked_matrix(const core::RasterVariable& var, const std::vector<std::size_t>& squeezed,
                              const std::optional<double>& valid_min, const std::optional<double>& valid_max) {
  const auto rows = static_cast<Eigen::Index>(squeezed[0]);
  const auto cols = static_cast<Eigen::Index>(squeezed[1]);
  Eigen::MatrixXd out = Eigen::Map<const RowMajorMatrix>(var.data.data(), rows, cols);

  const auto fill = numeric_attribute(var, "_FillValue");
  const auto missing = numeric_attribute(var, "missing_value");
  out = out.unaryExpr([&](double v) {
    if (!std::isfinite(v)) {
      return kNaN;
    }
    if ((fill.has_value() && v == *fill) || (missing.has_value() && v == *missing)) {
      return kNaN;
    }
    if ((valid_min.has_value() && v < *valid_min) || (valid_max.has_value() && v > *valid_max)) {
      return kNaN;
    }
    return v;
  });
  return out;
}

Eigen::VectorXd coordinate_vector(const core::RasterVariable& var) {
  return Eigen::Map<const Eigen::VectorXd>(var.data.data(), static_cast<Eigen::Index>(var.data.size()));
}

FlattenResult mismatch(std::string message) {
  FlattenResult out{};
  out.status = core::Status::StructuralMismatch;
  out.message = std::move(message);
  return out;
}

std::string shape_string(const std::vector<std::size_t>& shape) {
  std::string s = "(";
  for (std::size_t i = 0; i < shape.size(); ++i) {
    s += fmt::format("{}{}", (i > 0) ? "," : "", shape[i]);
  }
  return s + ")";
}

}  // namespace

std::vector<std::size_t> squeeze_shape(const std::vector<std::size_t>& shape) {
  std::vector<std::size_t> out;
  for (const std::size_t d : shape) {
    if (d != 1U) {
      out.push_back(d);
    }
  }
  return out;
}

double normalize_longitude(double lon_deg) noexcept { return (lon_deg > 180.0) ? lon_deg - 360.0 : lon_deg; }

std::vector<std::string> GridFlattener::required_variables() const {
  std::vector<std::string> names{"lat", "latitude", "lon", "longitude", config_.primary_variable};
  names.insert(names.end(), config_.ancillary_variables.begin(), config_.ancillary_variables.end());
  return names;
}

FlattenResult GridFlattener::flatten(const core::RasterDataset& dataset,
                                     const std::optional<core::CalendarDate>& date) const {
  const core::RasterVariable* lat_var = find_first(dataset, "lat", "latitude");
  const core::RasterVariable* lon_var = find_first(dataset, "lon", "longitude");
  if (lat_var == nullptr || lon_var == nullptr) {
    return mismatch("variables 'lat'/'lon' not found");
  }
  const core::RasterVariable* field_var = dataset.find(config_.primary_variable);
  if (field_var == nullptr) {
    return mismatch(fmt::format("variable '{}' not found", config_.primary_variable));
  }
  if (field_var->data.size() != field_var->element_count()) {
    return mismatch(fmt::format("variable '{}' data does not match its shape", config_.primary_variable));
  }

  const auto field_shape = squeeze_shape(field_var->shape);
  if (field_shape.size() != 2U) {
    return mismatch(fmt::format("'{}' has {} dimensions after squeeze; expected 2D", config_.primary_variable,
                                field_shape.size()));
  }
  Eigen::MatrixXd field = masked_matrix(*field_var, field_shape, config_.valid_min, config_.valid_max);

  const auto lat_shape = squeeze_shape(lat_var->shape);
  const auto lon_shape = squeeze_shape(lon_var->shape);
  const bool swath = lat_shape == field_shape && lon_shape == field_shape;
  const bool regular = lat_shape.size() == 1U && lon_shape.size() == 1U;
  if (!swath && !regular) {
    return mismatch(fmt::format("coordinate shapes lat{} lon{} incompatible with field {}", shape_string(lat_shape),
                                shape_string(lon_shape), shape_string(field_shape)));
  }

  Eigen::MatrixXd lat_grid;
  Eigen::MatrixXd lon_grid;
  bool transposed = false;
  if (swath) {
    if (lat_var->data.size() != static_cast<std::size_t>(field.size()) ||
        lon_var->data.size() != static_cast<std::size_t>(field.size())) {
      return mismatch("swath coordinate data does not match its shape");
    }
    lat_grid = Eigen::Map<const RowMajorMatrix>(lat_var->data.data(), field.rows(), field.cols());
    lon_grid = Eigen::Map<const RowMajorMatrix>(lon_var->data.data(), field.rows(), field.cols());
  } else {
    const Eigen::VectorXd lats = coordinate_vector(*lat_var);
    const Eigen::VectorXd lons = coordinate_vector(*lon_var);
    if (field.rows() != lats.size() || field.cols() != lons.size()) {
      if (field.cols() == lats.size() && field.rows() == lons.size()) {
        field.transposeInPlace();
        transposed = true;
      } else {
        return mismatch(fmt::format("'{}' shape {} does not match grid ({},{})", config_.primary_variable,
                                    shape_string(field_shape), lats.size(), lons.size()));
      }
    }
    // Mesh: latitude constant along a row, longitude varies fastest.
    lat_grid = lats.replicate(1, lons.size());
    lon_grid = lons.transpose().replicate(lats.size(), 1);
  }

  std::map<std::string, Eigen::MatrixXd> ancillary;
  for (const std::string& name : config_.ancillary_variables) {
    const core::RasterVariable* v = dataset.find(name);
    if (v == nullptr || v->data.size() != v->element_count()) {
      spdlog::debug("ancillary variable '{}' unavailable in {}", name, dataset.source.filename().string());
      continue;
    }
    const auto shape = squeeze_shape(v->shape);
    if (shape != field_shape) {
      spdlog::warn("ancillary variable '{}' shape {} differs from {}; skipped", name, shape_string(shape),
                   shape_string(field_shape));
      continue;
    }
    Eigen::MatrixXd m = masked_matrix(*v, shape, std::nullopt, std::nullopt);
    if (transposed) {
      m.transposeInPlace();
    }
    ancillary.emplace(name, std::move(m));
  }

  FlattenResult out{};
  out.grid_cells = static_cast<std::size_t>(field.size());
  for (const double v : lat_var->data) {
    out.lat_range.include(v);
  }
  for (const double v : lon_var->data) {
    out.lon_range.include(v);
  }
  for (Eigen::Index i = 0; i < field.size(); ++i) {
    out.value_range.include(field.data()[i]);
  }

  out.points.reserve(out.grid_cells);
  for (Eigen::Index r = 0; r < field.rows(); ++r) {
    for (Eigen::Index c = 0; c < field.cols(); ++c) {
      core::PointRecord p{};
      p.latitude = lat_grid(r, c);
      p.longitude = normalize_longitude(lon_grid(r, c));
      p.value = field(r, c);
      if (std::isnan(p.value) || !core::has_valid_coordinates(p)) {
        ++out.dropped;
        continue;
      }
      p.date = date;
      for (const auto& [name, m] : ancillary) {
        p.ancillary.emplace(name, m(r, c));
      }
      out.points.push_back(std::move(p));
    }
  }

  spdlog::debug("{}: {} grid cells, {} points kept, {} dropped{}", dataset.source.filename().string(),
                out.grid_cells, out.points.size(), out.dropped, transposed ? " (field transposed)" : "");
  return out;
}

}  // namespace geohex::raster
