/**
 * @file test_pipeline_driver.cpp
 * @brief Driver state machine tests over the catalog raster source.
 * @author geohex developers
 */

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "geohex/core/calendar.hpp"
#include "geohex/pipeline/catalog_raster_source.hpp"
#include "geohex/pipeline/pipeline_driver.hpp"
#include "geohex/sink/csv_artifact_sink.hpp"

namespace {

using geohex::core::CalendarDate;
using geohex::core::Status;
namespace fs = std::filesystem;

struct FakeGranule {
  std::string name{};
  CalendarDate date{};
};

class FakeCatalog final : public geohex::fetch::ICatalogService {
 public:
  std::vector<FakeGranule> granules{};
  std::set<std::string> broken_downloads{};
  std::set<int> broken_search_months{};
  int searches{0};
  int downloads{0};

  geohex::core::SearchReply search(const geohex::fetch::EarthdataSession&,
                                   const geohex::core::CatalogQuery& query) override {
    ++searches;
    geohex::core::SearchReply reply{};
    if (broken_search_months.count(static_cast<int>(query.temporal.start.month)) > 0U) {
      reply.status = Status::TransportError;
      reply.http_status = 502;
      return reply;
    }
    reply.status = Status::Ok;
    reply.http_status = 200;
    for (const FakeGranule& g : granules) {
      if (query.temporal.start <= g.date && g.date <= query.temporal.end) {
        reply.payload.push_back(geohex::core::GranuleHandle{.id = g.name, .name = g.name});
      }
    }
    return reply;
  }

  geohex::core::DownloadReply download(const geohex::fetch::EarthdataSession&,
                                       const std::vector<geohex::core::GranuleHandle>& handles,
                                       const fs::path& target_dir) override {
    ++downloads;
    geohex::core::DownloadReply reply{};
    for (const auto& h : handles) {
      if (broken_downloads.count(h.name) > 0U) {
        reply.status = Status::TransportError;
        reply.http_status = 503;
        reply.payload.clear();
        return reply;
      }
      reply.payload.push_back(target_dir / h.name);
    }
    reply.status = Status::Ok;
    reply.http_status = 200;
    return reply;
  }
};

/**
 * @brief Serves a small regular grid for every file; "broken" files lack the field.
 */
class FakeReader final : public geohex::core::IRasterReader {
 public:
  geohex::core::RasterReadResult read(const fs::path& path, const std::vector<std::string>&) const override {
    geohex::core::RasterReadResult out{};
    out.dataset.source = path;
    out.dataset.attributes["date_created"] = "2024-03-01T00:00:00Z";
    out.dataset.variables["lat"] = {.shape = {2}, .data = {10.0, 10.5}, .attributes = {}};
    out.dataset.variables["lon"] = {.shape = {2}, .data = {20.0, 20.5}, .attributes = {}};
    if (path.filename().string().find("broken") == std::string::npos) {
      out.dataset.variables["sst"] = {.shape = {1, 2, 2}, .data = {1.0, 2.0, 3.0, 4.0}, .attributes = {}};
    }
    out.dataset.variables["quality"] = {.shape = {2, 2}, .data = {0.5, 0.5, 0.5, 0.5}, .attributes = {}};
    return out;
  }
};

class RejectingAuthenticator final : public geohex::fetch::IAuthenticator {
 public:
  bool login(const geohex::fetch::Credentials&) override { return false; }
};

struct Harness {
  FakeCatalog catalog{};
  geohex::fetch::EarthdataSession session{geohex::fetch::Credentials{.username = "u", .password = "p"}};
  geohex::fetch::AnonymousAuthenticator auth{};
  FakeReader reader{};
  fs::path out_dir{};

  geohex::fetch::CatalogFetchClient::Config client_config() const {
    geohex::fetch::CatalogFetchClient::Config c{.short_name = "SST"};
    c.retry.sleeper = [](std::chrono::milliseconds) {};
    return c;
  }
};

geohex::pipeline::PipelineDriver::Config driver_config(bool by_date) {
  geohex::pipeline::PipelineDriver::Config c{};
  c.aggregation.resolution = 3;
  c.aggregation.group_by_date = by_date;
  c.schema.value_name = "sst";
  return c;
}

std::vector<std::string> read_lines(const fs::path& p) {
  std::vector<std::string> lines;
  std::ifstream in(p);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

fs::path fresh_dir(const char* name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

}  // namespace

int main() {
  using namespace geohex;
  const CalendarDate jan1{2024, 1, 1};
  const CalendarDate feb29{2024, 2, 29};

  {
    Harness h{};
    h.out_dir = fresh_dir("geohex_driver_idempotent");
    h.catalog.granules = {{"A2024015.SST.nc", CalendarDate{2024, 1, 15}}};
    const fetch::CatalogFetchClient client(h.client_config(), h.catalog, h.session);
    pipeline::CatalogRasterSource source(
        {.name = "sst", .mode = pipeline::UnitMode::PerFile, .download_dir = h.out_dir / "granules",
         .flatten = {.primary_variable = "sst", .ancillary_variables = {"quality"}}},
        client, h.auth, h.reader);
    sink::CsvArtifactSink csv({.output_dir = h.out_dir});
    auto config = driver_config(false);
    config.schema.ancillary_names = {"quality"};
    auto driver = pipeline::PipelineDriver::Create(config, source, csv);
    if (!driver) {
      spdlog::error("driver construction failed");
      return 1;
    }

    const auto first = driver->run(jan1, CalendarDate{2024, 1, 31});
    if (first.aborted || first.counters.written != 1U || first.counters.fetched != 1U ||
        !csv.exists("sst_A2024015.SST_hexr3")) {
      spdlog::error("first run should write one artifact (written={})", first.counters.written);
      return 2;
    }
    const auto lines = read_lines(csv.path_for("sst_A2024015.SST_hexr3"));
    if (lines.size() < 3U || !lines[1].ends_with(",quality_mean") || !lines[2].ends_with(",0.5")) {
      spdlog::error("ancillary field missing from the artifact");
      return 13;
    }
    const int downloads_after_first = h.catalog.downloads;

    const auto second = driver->run(jan1, CalendarDate{2024, 1, 31});
    if (second.counters.skipped != 1U || second.counters.written != 0U || second.counters.fetched != 0U ||
        h.catalog.downloads != downloads_after_first || second.reports.at(0).state != pipeline::UnitState::Skipped) {
      spdlog::error("second run must skip the completed unit without downloading");
      return 3;
    }
    fs::remove_all(h.out_dir);
  }

  {
    // January download fails on every attempt; February must still be processed.
    Harness h{};
    h.out_dir = fresh_dir("geohex_driver_failure");
    h.catalog.granules = {{"A2024010.SST.nc", CalendarDate{2024, 1, 10}},
                          {"A2024040.SST.nc", CalendarDate{2024, 2, 9}},
                          {"A2024045.broken.nc", CalendarDate{2024, 2, 14}}};
    h.catalog.broken_downloads = {"A2024010.SST.nc"};
    const fetch::CatalogFetchClient client(h.client_config(), h.catalog, h.session);
    pipeline::CatalogRasterSource source(
        {.name = "sst", .download_dir = h.out_dir / "granules", .flatten = {.primary_variable = "sst"}}, client,
        h.auth, h.reader);
    sink::CsvArtifactSink csv({.output_dir = h.out_dir});
    auto driver = pipeline::PipelineDriver::Create(driver_config(false), source, csv);
    const auto summary = driver->run(jan1, feb29);
    if (summary.aborted || summary.counters.written != 1U || summary.counters.failed != 2U) {
      spdlog::error("expected 1 written and 2 failed, got {} / {}", summary.counters.written,
                    summary.counters.failed);
      return 4;
    }
    if (summary.reports.size() != 3U || summary.reports.back().state != pipeline::UnitState::Failed ||
        !csv.exists("sst_A2024040.SST_hexr3") || csv.exists("sst_A2024045.broken_hexr3")) {
      spdlog::error("failed units must not leave artifacts; newest window goes first");
      return 5;
    }
    if (summary.reports.back().message.rfind("fetching failed", 0) != 0U ||
        summary.reports.at(1).message.rfind("flattening failed", 0) != 0U) {
      spdlog::error("failure reports must name the failing stage: '{}' / '{}'", summary.reports.back().message,
                    summary.reports.at(1).message);
      return 12;
    }
    fs::remove_all(h.out_dir);
  }

  {
    // A window whose search fails is one failed unit; the other window continues.
    Harness h{};
    h.out_dir = fresh_dir("geohex_driver_listing");
    h.catalog.granules = {{"A2024010.SST.nc", CalendarDate{2024, 1, 10}}};
    h.catalog.broken_search_months = {2};
    const fetch::CatalogFetchClient client(h.client_config(), h.catalog, h.session);
    pipeline::CatalogRasterSource source(
        {.name = "sst", .download_dir = h.out_dir / "granules", .flatten = {.primary_variable = "sst"}}, client,
        h.auth, h.reader);
    sink::CsvArtifactSink csv({.output_dir = h.out_dir});
    auto driver = pipeline::PipelineDriver::Create(driver_config(false), source, csv);
    const auto summary = driver->run(jan1, feb29);
    if (summary.counters.failed != 1U || summary.counters.written != 1U || h.catalog.searches != 4) {
      spdlog::error("listing failure handling wrong (failed={}, searches={})", summary.counters.failed,
                    h.catalog.searches);
      return 6;
    }
    fs::remove_all(h.out_dir);
  }

  {
    // Per-window units: keyed before any I/O, rows grouped by granule date.
    Harness h{};
    h.out_dir = fresh_dir("geohex_driver_window");
    h.catalog.granules = {{"A2024005.SST.nc", CalendarDate{2024, 1, 5}},
                          {"A2024006.SST.nc", CalendarDate{2024, 1, 6}}};
    const fetch::CatalogFetchClient client(h.client_config(), h.catalog, h.session);
    pipeline::CatalogRasterSource source(
        {.name = "sst", .mode = pipeline::UnitMode::PerWindow, .download_dir = h.out_dir / "granules",
         .flatten = {.primary_variable = "sst"}},
        client, h.auth, h.reader);
    sink::CsvArtifactSink csv({.output_dir = h.out_dir});
    auto driver = pipeline::PipelineDriver::Create(driver_config(true), source, csv);
    const auto summary = driver->run(jan1, feb29);
    // February has no granules: an empty unit, no artifact.
    if (summary.counters.written != 1U || summary.counters.empty != 1U ||
        !csv.exists("sst_hexr3_2024-01-01_2024-01-31") || csv.exists("sst_hexr3_2024-02-01_2024-02-29")) {
      spdlog::error("per-window run wrong (written={}, empty={})", summary.counters.written, summary.counters.empty);
      return 7;
    }
    const int searches = h.catalog.searches;
    const auto again = driver->run(jan1, CalendarDate{2024, 1, 31});
    if (again.counters.skipped != 1U || h.catalog.searches != searches) {
      spdlog::error("per-window skip must happen before any search");
      return 8;
    }
    fs::remove_all(h.out_dir);
  }

  {
    Harness h{};
    h.out_dir = fresh_dir("geohex_driver_empty");
    const fetch::CatalogFetchClient client(h.client_config(), h.catalog, h.session);
    pipeline::CatalogRasterSource source(
        {.name = "sst", .mode = pipeline::UnitMode::PerWindow, .download_dir = h.out_dir / "granules",
         .flatten = {.primary_variable = "sst"}},
        client, h.auth, h.reader);
    sink::CsvArtifactSink csv({.output_dir = h.out_dir});
    auto config = driver_config(true);
    config.write_empty_units = true;
    auto driver = pipeline::PipelineDriver::Create(config, source, csv);
    const auto summary = driver->run(jan1, CalendarDate{2024, 1, 31});
    if (summary.counters.empty != 1U || summary.counters.written != 1U ||
        !csv.exists("sst_hexr3_2024-01-01_2024-01-31")) {
      spdlog::error("write_empty_units should persist an empty artifact");
      return 9;
    }
    fs::remove_all(h.out_dir);
  }

  {
    Harness h{};
    const fetch::CatalogFetchClient client(h.client_config(), h.catalog, h.session);
    pipeline::CatalogRasterSource source({.name = "sst", .flatten = {.primary_variable = "sst"}}, client, h.auth,
                                         h.reader);
    sink::CsvArtifactSink csv({.output_dir = fs::temp_directory_path() / "geohex_driver_unused"});

    auto unknown = driver_config(false);
    unknown.hex_backend = "s2";
    auto bad_res = driver_config(false);
    bad_res.aggregation.resolution = 42;
    if (pipeline::PipelineDriver::Create(unknown, source, csv) ||
        pipeline::PipelineDriver::Create(bad_res, source, csv)) {
      spdlog::error("unavailable hex backend or resolution must abort construction");
      return 10;
    }

    RejectingAuthenticator rejecting{};
    fetch::EarthdataSession locked(fetch::Credentials{});
    const fetch::CatalogFetchClient locked_client(h.client_config(), h.catalog, locked);
    pipeline::CatalogRasterSource locked_source({.name = "sst", .flatten = {.primary_variable = "sst"}},
                                                locked_client, rejecting, h.reader);
    auto driver = pipeline::PipelineDriver::Create(driver_config(false), locked_source, csv);
    const auto summary = driver->run(jan1, feb29);
    if (!summary.aborted || h.catalog.searches != 0 || !summary.reports.empty()) {
      spdlog::error("authentication failure must abort the run before any search");
      return 11;
    }
  }

  return 0;
}
