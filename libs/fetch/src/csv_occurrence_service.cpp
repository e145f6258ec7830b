/**
 * @file csv_occurrence_service.cpp
 * @brief CSV-backed occurrence service implementation.
 * @author geohex developers
 */

#include "geohex/fetch/csv_occurrence_service.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "geohex/core/calendar.hpp"

namespace geohex::fetch {
namespace {

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    if (!token.empty() && token.back() == '\r') {
      token.pop_back();
    }
    fields.push_back(token);
  }
  if (!line.empty() && line.back() == ',') {
    fields.emplace_back();
  }
  return fields;
}

std::optional<double> parse_optional_double(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return v;
}

std::optional<std::size_t> column_index(const std::vector<std::string>& header, const std::string& name) {
  const auto it = std::find(header.begin(), header.end(), name);
  if (it == header.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(header.begin(), it));
}

}  // namespace

std::unique_ptr<CsvOccurrenceService> CsvOccurrenceService::Create(const Config& config) {
  std::ifstream in(config.csv_file);
  if (!in) {
    spdlog::error("failed to open occurrence csv: {}", config.csv_file.string());
    return {};
  }

  std::string line;
  if (!std::getline(in, line)) {
    spdlog::error("occurrence csv is empty: {}", config.csv_file.string());
    return {};
  }
  const auto header = split_csv_line(line);
  const auto name_col = column_index(header, "scientificName");
  const auto date_col = column_index(header, "eventDate");
  const auto lat_col = column_index(header, "decimalLatitude");
  const auto lon_col = column_index(header, "decimalLongitude");
  if (!name_col || !date_col || !lat_col || !lon_col) {
    spdlog::error("occurrence csv lacks a required column: {}", config.csv_file.string());
    return {};
  }
  const std::size_t min_fields = std::max({*name_col, *date_col, *lat_col, *lon_col}) + 1U;

  std::vector<core::OccurrenceRecord> records;
  std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    const auto fields = split_csv_line(line);
    if (fields.size() < min_fields) {
      spdlog::warn("skipping malformed occurrence row {}", line_no);
      continue;
    }
    records.push_back(core::OccurrenceRecord{.latitude = parse_optional_double(fields[*lat_col]),
                                             .longitude = parse_optional_double(fields[*lon_col]),
                                             .event_date = fields[*date_col],
                                             .scientific_name = fields[*name_col]});
  }
  return std::unique_ptr<CsvOccurrenceService>(new CsvOccurrenceService(std::move(records)));
}

core::PageReply CsvOccurrenceService::page(const core::OccurrenceQuery& query, std::size_t size, std::size_t offset) {
  core::PageReply reply{};
  std::vector<const core::OccurrenceRecord*> matches;
  for (const core::OccurrenceRecord& r : records_) {
    if (r.scientific_name.rfind(query.scientific_name, 0) != 0) {
      continue;
    }
    const auto day = core::calendar::parse_iso(std::string_view(r.event_date).substr(0, 10));
    if (!day.has_value() || *day < query.start_date || query.end_date < *day) {
      continue;
    }
    matches.push_back(&r);
  }

  reply.payload.total = static_cast<std::int64_t>(matches.size());
  for (std::size_t i = offset; i < matches.size() && i < offset + size; ++i) {
    reply.payload.results.push_back(*matches[i]);
  }
  reply.status = core::Status::Ok;
  reply.http_status = 200;
  return reply;
}

}  // namespace geohex::fetch
