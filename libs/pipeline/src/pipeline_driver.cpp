/**
 * @file pipeline_driver.cpp
 * @brief Pipeline driver implementation.
 * @author geohex developers
 */

#include "geohex/pipeline/pipeline_driver.hpp"

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "geohex/core/calendar.hpp"

namespace geohex::pipeline {

const char* unit_state_to_string(UnitState s) noexcept {
  switch (s) {
    case UnitState::Pending:
      return "pending";
    case UnitState::Fetching:
      return "fetching";
    case UnitState::Flattening:
      return "flattening";
    case UnitState::Aggregating:
      return "aggregating";
    case UnitState::Writing:
      return "writing";
    case UnitState::Done:
      return "done";
    case UnitState::Skipped:
      return "skipped";
    case UnitState::Failed:
      return "failed";
    default:
      return "unknown";
  }
}

std::unique_ptr<PipelineDriver> PipelineDriver::Create(const Config& config, IUnitSource& source,
                                                       sink::IArtifactSink& sink) {
  auto indexer = hexgrid::make_hex_indexer(config.hex_backend);
  if (!indexer) {
    spdlog::error("hex backend '{}' is not available", config.hex_backend);
    return nullptr;
  }
  if (config.aggregation.resolution < indexer->min_resolution() ||
      config.aggregation.resolution > indexer->max_resolution()) {
    spdlog::error("resolution {} outside [{}, {}] for hex backend '{}'", config.aggregation.resolution,
                  indexer->min_resolution(), indexer->max_resolution(), config.hex_backend);
    return nullptr;
  }
  Config resolved = config;
  if (resolved.schema.source.empty()) {
    resolved.schema.source = std::string(source.name());
  }
  return std::unique_ptr<PipelineDriver>(new PipelineDriver(std::move(resolved), std::move(indexer), source, sink));
}

PipelineDriver::PipelineDriver(Config config, std::unique_ptr<hexgrid::IHexIndexer> indexer, IUnitSource& source,
                               sink::IArtifactSink& sink)
    : config_(std::move(config)),
      indexer_(std::move(indexer)),
      aggregator_(config_.aggregation, *indexer_),
      source_(source),
      sink_(sink) {}

RunSummary PipelineDriver::run(const core::CalendarDate& start, const core::CalendarDate& end) {
  return run(windows::reversed(windows::partition(start, end, source_.granularity())));
}

RunSummary PipelineDriver::run(const std::vector<core::TimeWindow>& windows) {
  RunSummary summary{};
  const core::Status prepared = source_.prepare();
  if (prepared != core::Status::Ok) {
    summary.aborted = true;
    summary.message = fmt::format("source '{}' unavailable: {}", source_.name(), core::status_to_string(prepared));
    spdlog::error("{}", summary.message);
    return summary;
  }

  spdlog::info("{}: {} windows at resolution {}", source_.name(), windows.size(), config_.aggregation.resolution);
  for (const core::TimeWindow& window : windows) {
    const std::string window_label =
        fmt::format("{}..{}", core::calendar::to_iso(window.start), core::calendar::to_iso(window.end));
    UnitListing listing = source_.list_units(window, config_.aggregation.resolution);
    if (listing.status != core::Status::Ok) {
      spdlog::error("window {}: {}", window_label, listing.message);
      ++summary.counters.failed;
      summary.reports.push_back(UnitReport{.key = window_label, .state = UnitState::Failed, .message = listing.message});
      continue;
    }
    if (listing.units.empty()) {
      spdlog::info("window {}: no units", window_label);
      continue;
    }
    for (const UnitDescriptor& unit : listing.units) {
      UnitReport report = process(unit, summary.counters);
      if (report.state == UnitState::Failed) {
        spdlog::error("{}: {}", unit.label.empty() ? unit.key : unit.label, report.message);
      } else {
        spdlog::debug("{}: {}", unit.key, unit_state_to_string(report.state));
      }
      summary.reports.push_back(std::move(report));
    }
  }

  const RunCounters& c = summary.counters;
  spdlog::info("{} summary: fetched={} written={} skipped={} failed={} empty={}", source_.name(), c.fetched, c.written,
               c.skipped, c.failed, c.empty);
  return summary;
}

UnitReport PipelineDriver::process(const UnitDescriptor& unit, RunCounters& counters) {
  UnitReport report{.key = unit.key};
  if (sink_.exists(unit.key)) {
    spdlog::info("{} already exists, skipping", unit.key);
    report.state = UnitState::Skipped;
    ++counters.skipped;
    return report;
  }

  report.state = UnitState::Fetching;
  const fetch::FetchOutcome<RawUnit> fetched = source_.fetch(unit);
  spdlog::debug("{}: fetch {} after {} attempts", unit.key, fetch::fetch_status_to_string(fetched.status),
                fetched.attempts);
  if (fetched.status == fetch::FetchStatus::Failed) {
    return fail(report, fetched.message.empty() ? std::string("no data") : fetched.message, counters);
  }

  hexgrid::AggregatedTable table{};
  table.resolution = config_.aggregation.resolution;
  if (unit.window.start == unit.window.end) {
    table.metadata.date = unit.window.start;
  }
  if (fetched.status == fetch::FetchStatus::Results) {
    ++counters.fetched;

    report.state = UnitState::Flattening;
    FlattenedUnit flat = source_.flatten(unit, fetched.payload);
    if (flat.status != core::Status::Ok) {
      return fail(report, fmt::format("{}: {}", core::status_to_string(flat.status), flat.message), counters);
    }

    report.state = UnitState::Aggregating;
    table = aggregator_.aggregate(flat.points, flat.metadata);
    if (table.status != core::Status::Ok) {
      return fail(report, table.message, counters);
    }
  }

  if (table.rows.empty()) {
    ++counters.empty;
    if (!config_.write_empty_units) {
      spdlog::info("{}: no data", unit.key);
      report.state = UnitState::Done;
      report.message = "no data";
      return report;
    }
  }
  return write_table(unit, table, counters);
}

UnitReport PipelineDriver::write_table(const UnitDescriptor& unit, const hexgrid::AggregatedTable& table,
                                       RunCounters& counters) {
  UnitReport report{.key = unit.key, .state = UnitState::Writing};
  const sink::WriteResult written = sink_.write(unit.key, table, config_.schema);
  switch (written.status) {
    case core::Status::Ok:
      report.state = UnitState::Done;
      ++counters.written;
      break;
    case core::Status::AlreadyExists:
      report.state = UnitState::Skipped;
      report.message = written.message;
      ++counters.skipped;
      break;
    default:
      return fail(report, written.message, counters);
  }
  return report;
}

UnitReport PipelineDriver::fail(UnitReport report, const std::string& message, RunCounters& counters) {
  report.message = fmt::format("{} failed: {}", unit_state_to_string(report.state), message);
  report.state = UnitState::Failed;
  ++counters.failed;
  return report;
}

}  // namespace geohex::pipeline
