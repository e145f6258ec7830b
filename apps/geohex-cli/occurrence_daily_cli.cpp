/**
 * @file occurrence_daily_cli.cpp
 * @brief Daily occurrence runner: paged records → per-day hex cell CSV artifacts.
 * @author geohex developers
 */

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "geohex/core/calendar.hpp"
#include "geohex/fetch/csv_occurrence_service.hpp"
#include "geohex/fetch/paged_occurrence_client.hpp"
#include "geohex/pipeline/occurrence_daily_source.hpp"
#include "geohex/pipeline/pipeline_driver.hpp"
#include "geohex/sink/csv_artifact_sink.hpp"

namespace {

void apply_log_level() {
  const char* env = std::getenv("GEOHEX_LOG_LEVEL");
  if (env != nullptr && *env != '\0') {
    spdlog::set_level(spdlog::level::from_str(env));
  }
}

std::string hex_backend_from_environment() {
  const char* env = std::getenv("GEOHEX_HEX_BACKEND");
  return (env != nullptr && *env != '\0') ? std::string(env) : std::string("planar");
}

std::vector<std::string> split_list(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  apply_log_level();
  if (argc < 6 || argc > 9) {
    spdlog::error(
        "usage: occurrence_daily_cli <occurrence_csv> <output_dir> <start:YYYY-MM-DD> <end:YYYY-MM-DD> "
        "<species[,species...]> [resolution] [min_count] [source_name]");
    spdlog::error("csv columns: scientificName,eventDate,decimalLatitude,decimalLongitude");
    spdlog::error("GEOHEX_HEX_BACKEND selects the cell indexer (default planar)");
    return 1;
  }

  const std::filesystem::path csv_path = argv[1];
  const std::filesystem::path output_dir = argv[2];
  const auto start = geohex::core::calendar::parse_iso(argv[3]);
  const auto end = geohex::core::calendar::parse_iso(argv[4]);
  const std::vector<std::string> species = split_list(argv[5]);
  const int resolution = (argc >= 7) ? std::atoi(argv[6]) : 5;
  const long min_count = (argc >= 8) ? std::atol(argv[7]) : 1L;
  const std::string source_name = (argc >= 9) ? argv[8] : "occurrences";

  if (!start.has_value() || !end.has_value()) {
    spdlog::error("start and end must be YYYY-MM-DD dates");
    return 2;
  }
  if (min_count < 1L) {
    spdlog::error("min_count must be a positive integer");
    return 2;
  }

  auto service = geohex::fetch::CsvOccurrenceService::Create({.csv_file = csv_path});
  if (!service) {
    spdlog::error("failed to load occurrence csv: {}", csv_path.string());
    return 2;
  }
  spdlog::info("loaded {} occurrence records", service->size());

  const geohex::fetch::PagedOccurrenceClient client({.page_size = 1000}, *service);
  geohex::pipeline::OccurrenceDailySource source({.name = source_name, .species = species}, client);
  geohex::sink::CsvArtifactSink sink({.output_dir = output_dir});

  geohex::pipeline::PipelineDriver::Config config{};
  config.hex_backend = hex_backend_from_environment();
  config.aggregation.resolution = resolution;
  config.aggregation.group_by_category = true;
  config.aggregation.min_count = static_cast<std::size_t>(min_count);
  config.schema.value_name = "occurrence";
  config.schema.category_name = "species";
  config.schema.include_category = true;
  auto driver = geohex::pipeline::PipelineDriver::Create(config, source, sink);
  if (!driver) {
    return 3;
  }

  const geohex::pipeline::RunSummary summary = driver->run(*start, *end);
  if (summary.aborted) {
    return 4;
  }
  return (summary.counters.failed > 0U) ? 5 : 0;
}
