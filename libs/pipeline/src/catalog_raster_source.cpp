/**
 * @file catalog_raster_source.cpp
 * @brief Catalog raster unit source implementation.
 * @author geohex developers
 */

#include "geohex/pipeline/catalog_raster_source.hpp"

#include <iterator>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "geohex/core/calendar.hpp"
#include "geohex/sink/artifact_sink.hpp"

namespace geohex::pipeline {
namespace {

std::string window_label(const core::TimeWindow& window) {
  return fmt::format("{}..{}", core::calendar::to_iso(window.start), core::calendar::to_iso(window.end));
}

}  // namespace

const char* unit_mode_to_string(UnitMode m) noexcept {
  switch (m) {
    case UnitMode::PerFile:
      return "file";
    case UnitMode::PerWindow:
      return "window";
    default:
      return "unknown";
  }
}

bool parse_unit_mode(std::string_view text, UnitMode& out) noexcept {
  if (text == "file") {
    out = UnitMode::PerFile;
    return true;
  }
  if (text == "window") {
    out = UnitMode::PerWindow;
    return true;
  }
  return false;
}

CatalogRasterSource::CatalogRasterSource(Config config, const fetch::CatalogFetchClient& client,
                                         fetch::IAuthenticator& authenticator, const core::IRasterReader& reader)
    : config_(std::move(config)),
      client_(client),
      authenticator_(authenticator),
      reader_(reader),
      flattener_(config_.flatten),
      resolver_(raster::DateResolver::with_default_strategies()) {}

core::Status CatalogRasterSource::prepare() {
  if (!client_.session().ensure_authenticated(authenticator_)) {
    spdlog::error("{}: authentication failed", config_.name);
    return core::Status::DataUnavailable;
  }
  spdlog::info("{}: {} units of {}", config_.name, unit_mode_to_string(config_.mode), client_.config().short_name);
  return core::Status::Ok;
}

UnitListing CatalogRasterSource::list_units(const core::TimeWindow& window, int resolution) {
  UnitListing listing{};
  if (config_.mode == UnitMode::PerWindow) {
    listing.units.push_back(UnitDescriptor{.key = sink::window_unit_key(config_.name, resolution, window),
                                           .label = window_label(window),
                                           .window = window});
    return listing;
  }

  const auto found = client_.search(window);
  if (found.status == fetch::FetchStatus::Failed) {
    listing.status = core::Status::TransportError;
    listing.message = fmt::format("search failed after {} attempts: {}", found.attempts, found.message);
    return listing;
  }
  for (const core::GranuleHandle& granule : found.payload) {
    listing.units.push_back(UnitDescriptor{.key = sink::file_unit_key(config_.name, resolution, granule.name),
                                           .label = granule.name,
                                           .window = window,
                                           .granules = {granule}});
  }
  return listing;
}

fetch::FetchOutcome<RawUnit> CatalogRasterSource::fetch(const UnitDescriptor& unit) {
  fetch::FetchOutcome<RawUnit> out{};
  std::vector<core::GranuleHandle> granules = unit.granules;
  if (config_.mode == UnitMode::PerWindow) {
    auto found = client_.search(unit.window);
    out.attempts = found.attempts;
    if (!found.has_results()) {
      out.status = found.status;
      out.message = found.message;
      return out;
    }
    granules = std::move(found.payload);
  }

  auto downloaded = client_.download(granules, config_.download_dir);
  out.attempts += downloaded.attempts;
  out.status = downloaded.status;
  out.message = downloaded.message;
  out.payload.files = std::move(downloaded.payload);
  return out;
}

FlattenedUnit CatalogRasterSource::flatten(const UnitDescriptor& unit, const RawUnit& raw) const {
  FlattenedUnit out{};
  const std::vector<std::string> variables = flattener_.required_variables();
  for (const std::filesystem::path& file : raw.files) {
    const core::RasterReadResult read = reader_.read(file, variables);
    if (read.status != core::Status::Ok) {
      out.status = read.status;
      out.message = fmt::format("{}: {}", file.filename().string(), read.message);
      return out;
    }

    const raster::ResolvedDate resolved = resolver_.resolve(read.dataset);
    raster::FlattenResult flat = flattener_.flatten(read.dataset, resolved.date);
    if (flat.status != core::Status::Ok) {
      out.status = flat.status;
      out.message = fmt::format("{}: {}", file.filename().string(), flat.message);
      return out;
    }
    spdlog::info("{}: {} points ({} dropped), date {} via {}", file.filename().string(), flat.points.size(),
                 flat.dropped, core::calendar::to_iso(resolved.date),
                 resolved.strategy.empty() ? "none" : resolved.strategy);

    out.metadata.value_range.merge(flat.value_range);
    out.metadata.lat_range.merge(flat.lat_range);
    out.metadata.lon_range.merge(flat.lon_range);
    if (config_.mode == UnitMode::PerFile) {
      out.metadata.date = resolved.date;
      out.metadata.date_created = read.dataset.attribute("date_created").value_or("");
    }
    out.points.insert(out.points.end(), std::make_move_iterator(flat.points.begin()),
                      std::make_move_iterator(flat.points.end()));
  }
  spdlog::debug("{}: {} points from {} files", unit.key, out.points.size(), raw.files.size());
  return out;
}

}  // namespace geohex::pipeline
