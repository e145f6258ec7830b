/**
 * @file test_occurrence_pipeline.cpp
 * @brief Daily occurrence pipeline over the CSV-backed paginated service.
 * @author geohex developers
 */

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "geohex/fetch/csv_occurrence_service.hpp"
#include "geohex/fetch/paged_occurrence_client.hpp"
#include "geohex/pipeline/occurrence_daily_source.hpp"
#include "geohex/pipeline/pipeline_driver.hpp"
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

}  // namespace

int main() {
  using namespace geohex;
  namespace fs = std::filesystem;
  using core::CalendarDate;

#ifndef GEOHEX_SOURCE_DIR
  spdlog::error("GEOHEX_SOURCE_DIR missing");
  return 10;
#endif

  const fs::path sample = fs::path(GEOHEX_SOURCE_DIR) / "tests" / "data" / "occurrences_sample.csv";
  auto service = fetch::CsvOccurrenceService::Create({.csv_file = sample});
  if (!service || service->size() != 8U) {
    spdlog::error("failed to load occurrence sample");
    return 1;
  }

  fetch::RetryPolicy retry{};
  retry.sleeper = [](std::chrono::milliseconds) {};
  // Page size 2 forces several pages for the first day.
  const fetch::PagedOccurrenceClient client({.page_size = 2, .retry = retry}, *service);
  pipeline::OccurrenceDailySource source(
      {.name = "sharks", .species = {"Carcharodon carcharias", "Galeocerdo cuvier"}}, client);

  pipeline::PipelineDriver::Config config{};
  config.aggregation.resolution = 3;
  config.aggregation.group_by_category = true;
  config.schema.value_name = "occurrence";
  config.schema.category_name = "species";
  config.schema.include_category = true;

  const fs::path dir = fs::temp_directory_path() / "geohex_occurrence_pipeline";
  fs::remove_all(dir);
  sink::CsvArtifactSink csv({.output_dir = dir});
  auto driver = pipeline::PipelineDriver::Create(config, source, csv);
  if (!driver) {
    spdlog::error("driver construction failed");
    return 2;
  }

  const auto summary = driver->run(CalendarDate{2024, 1, 1}, CalendarDate{2024, 1, 3});
  if (summary.counters.written != 2U || summary.counters.fetched != 2U || summary.counters.empty != 1U ||
      summary.counters.failed != 0U) {
    spdlog::error("unexpected counters: written={} fetched={} empty={}", summary.counters.written,
                  summary.counters.fetched, summary.counters.empty);
    return 3;
  }
  if (summary.reports.size() != 3U || summary.reports.front().key != "sharks_hexr3_2024-01-03") {
    spdlog::error("days must be processed newest first");
    return 4;
  }
  if (csv.exists("sharks_hexr3_2024-01-02")) {
    spdlog::error("empty day must not produce an artifact");
    return 5;
  }

  const auto lines = read_lines(csv.path_for("sharks_hexr3_2024-01-01"));
  if (lines.size() != 4U) {
    spdlog::error("expected two species rows for 2024-01-01, got {} lines", lines.size());
    return 6;
  }
  if (lines[2].find(",Carcharodon carcharias,1,1,1,0,3,") == std::string::npos ||
      lines[2].find(",high,") != std::string::npos || lines[3].find(",Galeocerdo cuvier,1,1,1,0,1,") ==
                                                          std::string::npos) {
    spdlog::error("per-species rows wrong:\n{}\n{}", lines[2], lines[3]);
    return 7;
  }

  const auto again = driver->run(CalendarDate{2024, 1, 1}, CalendarDate{2024, 1, 3});
  if (again.counters.skipped != 2U || again.counters.written != 0U) {
    spdlog::error("re-run must skip completed days");
    return 8;
  }

  const fs::path filtered_dir = fs::temp_directory_path() / "geohex_occurrence_pipeline_min2";
  fs::remove_all(filtered_dir);
  sink::CsvArtifactSink filtered_csv({.output_dir = filtered_dir});
  config.aggregation.min_count = 2;
  auto filtered = pipeline::PipelineDriver::Create(config, source, filtered_csv);
  const auto min2 = filtered->run(CalendarDate{2024, 1, 1}, CalendarDate{2024, 1, 3});
  if (min2.counters.written != 1U || min2.counters.empty != 2U ||
      read_lines(filtered_csv.path_for("sharks_hexr3_2024-01-01")).size() != 3U) {
    spdlog::error("min_count filtering in the pipeline failed");
    return 9;
  }

  fs::remove_all(dir);
  fs::remove_all(filtered_dir);
  return 0;
}
