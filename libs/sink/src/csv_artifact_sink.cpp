/**
 * @file csv_artifact_sink.cpp
 * @brief CSV artifact sink and artifact key helpers.
 * @author geohex developers
 */

#include "geohex/sink/csv_artifact_sink.hpp"

#include <cmath>
#include <ctime>
#include <fstream>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "geohex/core/calendar.hpp"

namespace geohex::sink {
namespace {

constexpr const char* kSchemaName = "geohex_cells_v1";

std::string number_or_empty(double v) { return std::isfinite(v) ? fmt::format("{}", v) : std::string{}; }

std::string stem_of(const std::string& file_name) {
  const auto dot = file_name.find_last_of('.');
  return (dot == std::string::npos || dot == 0U) ? file_name : file_name.substr(0, dot);
}

}  // namespace

std::string day_unit_key(const std::string& source, int resolution, const core::CalendarDate& day) {
  return fmt::format("{}_hexr{}_{}", source, resolution, core::calendar::to_iso(day));
}

std::string window_unit_key(const std::string& source, int resolution, const core::TimeWindow& window) {
  return fmt::format("{}_hexr{}_{}_{}", source, resolution, core::calendar::to_iso(window.start),
                     core::calendar::to_iso(window.end));
}

std::string file_unit_key(const std::string& source, int resolution, const std::string& file_name) {
  return fmt::format("{}_{}_hexr{}", source, stem_of(file_name), resolution);
}

std::string csv_escape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string out = "\"";
  for (const char c : field) {
    if (c == '"') {
      out += '"';
    }
    out += c;
  }
  out += '"';
  return out;
}

std::string csv_header(const OutputSchema& schema) {
  const std::string& v = schema.value_name;
  std::string out = "cell_id,resolution,";
  if (schema.include_category) {
    out += schema.category_name + ",";
  }
  out += fmt::format("{0}_mean,{0}_min,{0}_max,{0}_std,n,centroid_lat,centroid_lon,date,date_created,"
                     "{0}_range_min,{0}_range_max,lat_min,lat_max,lon_min,lon_max,confidence,anomaly",
                     v);
  for (const std::string& name : schema.ancillary_names) {
    out += fmt::format(",{}_mean", name);
  }
  return out;
}

std::string csv_row(const hexgrid::AggregatedTable& table, const hexgrid::AggregatedRow& row,
                    const OutputSchema& schema) {
  const core::UnitMetadata& m = table.metadata;
  const std::string date = core::calendar::to_iso(row.date);
  const std::string& date_created = m.date_created.empty() ? date : m.date_created;

  std::string out = fmt::format("{},{},", hexgrid::to_string(row.cell), table.resolution);
  if (schema.include_category) {
    out += csv_escape(row.category.value_or("")) + ",";
  }
  out += fmt::format("{},{},{},{},{},{:.6f},{:.6f},{},{},{},{},{},{},{},{},{},{}", row.stats.mean, row.stats.min,
                     row.stats.max, row.stats.std_dev, row.stats.count, row.centroid.lat_deg, row.centroid.lon_deg,
                     date, csv_escape(date_created), number_or_empty(m.value_range.min),
                     number_or_empty(m.value_range.max), number_or_empty(m.lat_range.min), number_or_empty(m.lat_range.max),
                     number_or_empty(m.lon_range.min), number_or_empty(m.lon_range.max), row.confidence,
                     row.anomaly);
  for (const std::string& name : schema.ancillary_names) {
    const auto it = row.ancillary_means.find(name);
    out += "," + ((it != row.ancillary_means.end()) ? number_or_empty(it->second) : std::string{});
  }
  return out;
}

WriteResult publish_artifact(const std::filesystem::path& tmp_path, const std::filesystem::path& final_path) {
  WriteResult result{};
  result.location = final_path.string();
  std::error_code ec;
  std::error_code rm_ec;
  // A hard link fails when the target exists, so a concurrently completed unit is never clobbered.
  std::filesystem::create_hard_link(tmp_path, final_path, ec);
  if (!ec) {
    std::filesystem::remove(tmp_path, rm_ec);
    return result;
  }
  if (std::filesystem::exists(final_path, rm_ec)) {
    std::filesystem::remove(tmp_path, rm_ec);
    result.status = core::Status::AlreadyExists;
    result.message = "artifact appeared while writing";
    return result;
  }
  ec.clear();
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, rm_ec);
    result.status = core::Status::IoError;
    result.message = fmt::format("cannot move artifact into place: {}", ec.message());
  }
  return result;
}

std::filesystem::path CsvArtifactSink::path_for(const std::string& key) const {
  return config_.output_dir / (key + ".csv");
}

bool CsvArtifactSink::exists(const std::string& key) const {
  std::error_code ec;
  return std::filesystem::exists(path_for(key), ec);
}

WriteResult CsvArtifactSink::write(const std::string& key, const hexgrid::AggregatedTable& table,
                                   const OutputSchema& schema) {
  WriteResult result{};
  const std::filesystem::path final_path = path_for(key);
  result.location = final_path.string();
  if (exists(key)) {
    result.status = core::Status::AlreadyExists;
    result.message = "artifact already present";
    return result;
  }

  std::error_code ec;
  std::filesystem::create_directories(config_.output_dir, ec);
  if (ec) {
    result.status = core::Status::IoError;
    result.message = fmt::format("cannot create {}: {}", config_.output_dir.string(), ec.message());
    return result;
  }

  const std::filesystem::path tmp_path = config_.output_dir / ("." + key + ".csv.tmp");
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      result.status = core::Status::IoError;
      result.message = fmt::format("failed to open {}", tmp_path.string());
      return result;
    }
    out << "#record_type=metadata,schema=" << kSchemaName << ",project=geohex,source=" << schema.source
        << ",resolution=" << table.resolution << ",date=" << core::calendar::to_iso(table.metadata.date)
        << ",rows=" << table.rows.size() << ",generated_unix_utc=" << std::time(nullptr) << "\n";
    out << csv_header(schema) << "\n";
    for (const hexgrid::AggregatedRow& row : table.rows) {
      out << csv_row(table, row, schema) << "\n";
    }
    out.flush();
    if (!out) {
      result.status = core::Status::IoError;
      result.message = fmt::format("write to {} failed", tmp_path.string());
      std::filesystem::remove(tmp_path, ec);
      return result;
    }
  }

  const WriteResult published = publish_artifact(tmp_path, final_path);
  if (published.status != core::Status::Ok) {
    result.status = published.status;
    result.message = published.message;
    return result;
  }

  result.rows = table.rows.size();
  spdlog::info("saved {} ({} rows)", final_path.string(), result.rows);
  return result;
}

}  // namespace geohex::sink
