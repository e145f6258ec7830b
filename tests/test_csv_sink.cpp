/**
 * @file test_csv_sink.cpp
 * @brief Artifact key and idempotent CSV sink tests.
 * @author geohex developers
 */

#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "geohex/hexgrid/hex_aggregator.hpp"
#include "geohex/hexgrid/planar_hex_indexer.hpp"
#include "geohex/sink/csv_artifact_sink.hpp"

namespace {

std::vector<std::string> read_lines(const std::filesystem::path& p) {
  std::vector<std::string> lines;
  std::ifstream in(p);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

bool write_text(const std::filesystem::path& p, const std::string& text) {
  std::ofstream out(p);
  out << text;
  return static_cast<bool>(out);
}

}  // namespace

int main() {
  using namespace geohex;
  namespace fs = std::filesystem;
  using core::CalendarDate;

  if (sink::day_unit_key("sharks", 5, CalendarDate{2024, 1, 7}) != "sharks_hexr5_2024-01-07" ||
      sink::window_unit_key("sst", 4, core::TimeWindow{CalendarDate{2024, 2, 1}, CalendarDate{2024, 2, 29}}) !=
          "sst_hexr4_2024-02-01_2024-02-29" ||
      sink::file_unit_key("sst", 5, "AQUA_MODIS.20240101.L3m.DAY.SST.nc") != "sst_AQUA_MODIS.20240101.L3m.DAY.SST_hexr5") {
    spdlog::error("artifact keys are not the expected deterministic names");
    return 1;
  }

  const fs::path dir = fs::temp_directory_path() / "geohex_csv_sink_test";
  fs::remove_all(dir);

  const hexgrid::PlanarHexIndexer indexer{};
  core::UnitMetadata metadata{.date = CalendarDate{2024, 1, 7}, .date_created = "2024-01-09T03:00:00Z"};
  metadata.value_range.include(1.0);
  metadata.value_range.include(3.0);
  std::vector<core::PointRecord> points(3);
  for (std::size_t i = 0; i < points.size(); ++i) {
    points[i].latitude = -10.0;
    points[i].longitude = 20.0;
    points[i].value = static_cast<double>(i + 1);
    points[i].category = "Prionace glauca";
  }
  const hexgrid::HexAggregator aggregator({.resolution = 3, .group_by_category = true}, indexer);
  const auto table = aggregator.aggregate(points, metadata);

  sink::CsvArtifactSink csv({.output_dir = dir});
  const sink::OutputSchema schema{
      .source = "sharks", .value_name = "occurrence", .category_name = "species", .include_category = true};
  const std::string key = sink::day_unit_key("sharks", 3, CalendarDate{2024, 1, 7});
  if (csv.exists(key)) {
    spdlog::error("fresh directory should not contain the artifact");
    return 2;
  }

  const auto first = csv.write(key, table, schema);
  if (first.status != core::Status::Ok || first.rows != 1U || !csv.exists(key)) {
    spdlog::error("first write failed: {}", first.message);
    return 3;
  }
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().extension() == ".tmp") {
      spdlog::error("temporary file left behind: {}", entry.path().string());
      return 4;
    }
  }

  const auto lines = read_lines(csv.path_for(key));
  if (lines.size() != 3U || lines[0].rfind("#record_type=metadata,", 0) != 0 || lines[1] != sink::csv_header(schema)) {
    spdlog::error("artifact layout wrong ({} lines)", lines.size());
    return 5;
  }
  if (lines[1].rfind("cell_id,resolution,species,occurrence_mean,occurrence_min,", 0) != 0) {
    spdlog::error("header columns wrong: {}", lines[1]);
    return 6;
  }
  const std::string& row = lines[2];
  if (row.find(",Prionace glauca,2,1,3,1,3,") == std::string::npos ||
      row.find(",2024-01-07,2024-01-09T03:00:00Z,1,3,") == std::string::npos ||
      row.substr(row.size() - 9) != ",medium,0") {
    spdlog::error("row content wrong: {}", row);
    return 7;
  }

  const auto before = fs::last_write_time(csv.path_for(key));
  hexgrid::AggregatedTable other = table;
  other.rows.clear();
  const auto second = csv.write(key, other, schema);
  if (second.status != core::Status::AlreadyExists || read_lines(csv.path_for(key)) != lines ||
      fs::last_write_time(csv.path_for(key)) != before) {
    spdlog::error("existing artifact must never be rewritten");
    return 8;
  }

  const hexgrid::AggregatedTable empty{.resolution = 3};
  const auto third = csv.write("sharks_hexr3_2024-01-08", empty, schema);
  if (third.status != core::Status::Ok || read_lines(csv.path_for("sharks_hexr3_2024-01-08")).size() != 2U) {
    spdlog::error("empty table should still produce metadata and header");
    return 9;
  }

  if (sink::csv_escape("Prionace glauca") != "Prionace glauca" || sink::csv_escape("a,b") != "\"a,b\"" ||
      sink::csv_escape("say \"hi\"") != "\"say \"\"hi\"\"\"") {
    spdlog::error("csv escaping wrong");
    return 10;
  }

  {
    core::UnitMetadata revised{.date = CalendarDate{2024, 1, 7}, .date_created = "2024-01-09, revised"};
    std::vector<core::PointRecord> tagged = points;
    for (std::size_t i = 0; i < tagged.size(); ++i) {
      tagged[i].category = "Carcharhinus leucas, bull";
      tagged[i].ancillary["quality"] = (i == 2U) ? std::numeric_limits<double>::quiet_NaN() : 1.0 + i;
    }
    const auto tagged_table = aggregator.aggregate(tagged, revised);
    sink::OutputSchema wide = schema;
    wide.ancillary_names = {"quality", "wind"};
    const std::string wide_key = sink::day_unit_key("tagged", 3, CalendarDate{2024, 1, 7});
    if (csv.write(wide_key, tagged_table, wide).status != core::Status::Ok) {
      spdlog::error("write with ancillary columns failed");
      return 11;
    }
    const auto wide_lines = read_lines(csv.path_for(wide_key));
    if (wide_lines.size() != 3U || !wide_lines[1].ends_with(",anomaly,quality_mean,wind_mean")) {
      spdlog::error("ancillary header columns wrong");
      return 12;
    }
    const std::string& wide_row = wide_lines[2];
    if (wide_row.find(",\"Carcharhinus leucas, bull\",2,1,3,") == std::string::npos ||
        wide_row.find(",2024-01-07,\"2024-01-09, revised\",") == std::string::npos ||
        !wide_row.ends_with(",medium,0,1.5,")) {
      spdlog::error("quoted or ancillary row content wrong: {}", wide_row);
      return 13;
    }
  }

  {
    // Another writer finishes the same unit after our temporary file is complete.
    const fs::path tmp = dir / ".late.csv.tmp";
    const fs::path target = dir / "late.csv";
    if (!write_text(tmp, "ours\n") || !write_text(target, "theirs\n")) {
      spdlog::error("failed to create publish fixtures");
      return 14;
    }
    const auto late = sink::publish_artifact(tmp, target);
    if (late.status != core::Status::AlreadyExists || read_lines(target) != std::vector<std::string>{"theirs"} ||
        fs::exists(tmp)) {
      spdlog::error("publishing over an existing artifact must be refused and keep its content");
      return 15;
    }

    const fs::path fresh = dir / "fresh.csv";
    if (!write_text(tmp, "ours\n")) {
      return 16;
    }
    const auto placed = sink::publish_artifact(tmp, fresh);
    if (placed.status != core::Status::Ok || read_lines(fresh) != std::vector<std::string>{"ours"} ||
        fs::exists(tmp)) {
      spdlog::error("publishing to a free name failed: {}", placed.message);
      return 17;
    }
  }

  fs::remove_all(dir);
  return 0;
}
