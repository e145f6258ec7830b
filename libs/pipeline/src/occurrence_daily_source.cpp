/**
 * @file occurrence_daily_source.cpp
 * @brief Occurrence unit source implementation.
 * @author geohex developers
 */

#include "geohex/pipeline/occurrence_daily_source.hpp"

#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "geohex/core/calendar.hpp"
#include "geohex/sink/artifact_sink.hpp"

namespace geohex::pipeline {

core::Status OccurrenceDailySource::prepare() {
  if (config_.species.empty()) {
    spdlog::error("{}: no species configured", config_.name);
    return core::Status::InvalidInput;
  }
  return core::Status::Ok;
}

UnitListing OccurrenceDailySource::list_units(const core::TimeWindow& window, int resolution) {
  UnitListing listing{};
  for (core::CalendarDate day = window.start; day <= window.end; day = core::calendar::add_days(day, 1)) {
    listing.units.push_back(UnitDescriptor{.key = sink::day_unit_key(config_.name, resolution, day),
                                           .label = core::calendar::to_iso(day),
                                           .window = core::TimeWindow{day, day}});
  }
  return listing;
}

fetch::FetchOutcome<RawUnit> OccurrenceDailySource::fetch(const UnitDescriptor& unit) {
  fetch::FetchOutcome<RawUnit> out{};
  for (const std::string& species : config_.species) {
    const core::OccurrenceQuery query{
        .scientific_name = species, .start_date = unit.window.start, .end_date = unit.window.end};
    auto batch = client_.fetch(query);
    out.attempts += batch.attempts;
    if (batch.status == fetch::FetchStatus::Failed) {
      out.status = fetch::FetchStatus::Failed;
      out.message = fmt::format("{}: {}", species, batch.message);
      out.payload.records.clear();
      return out;
    }
    spdlog::info("{} {}: {} records", unit.label, species, batch.payload.records.size());
    for (core::OccurrenceRecord& record : batch.payload.records) {
      record.scientific_name = species;
      out.payload.records.push_back(std::move(record));
    }
  }
  out.status = out.payload.records.empty() ? fetch::FetchStatus::Empty : fetch::FetchStatus::Results;
  return out;
}

FlattenedUnit OccurrenceDailySource::flatten(const UnitDescriptor& unit, const RawUnit& raw) const {
  FlattenedUnit out{};
  out.metadata.date = unit.window.start;
  std::size_t without_position = 0;
  for (const core::OccurrenceRecord& record : raw.records) {
    if (!record.latitude.has_value() || !record.longitude.has_value()) {
      ++without_position;
      continue;
    }
    core::PointRecord p{};
    p.latitude = *record.latitude;
    p.longitude = *record.longitude;
    p.value = 1.0;
    p.category = record.scientific_name;
    p.date = core::calendar::parse_iso(std::string_view(record.event_date).substr(0, 10));
    if (!p.date.has_value()) {
      p.date = unit.window.start;
    }
    out.metadata.value_range.include(p.value);
    out.metadata.lat_range.include(p.latitude);
    out.metadata.lon_range.include(p.longitude);
    out.points.push_back(std::move(p));
  }
  if (without_position > 0U) {
    spdlog::debug("{}: {} records without coordinates", unit.key, without_position);
  }
  return out;
}

}  // namespace geohex::pipeline
