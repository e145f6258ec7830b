/**
 * @file date_resolver.cpp
 * @brief Date inference strategies.
 * @author geohex developers
 */

#include "geohex/raster/date_resolver.hpp"

#include <initializer_list>
#include <utility>

#include <spdlog/spdlog.h>

#include "geohex/core/calendar.hpp"

namespace geohex::raster {
namespace {

std::optional<core::CalendarDate> from_attributes(const DateContext& ctx, std::initializer_list<const char*> names) {
  for (const char* name : names) {
    const auto it = ctx.attributes.find(name);
    if (it == ctx.attributes.end() || it->second.empty()) {
      continue;
    }
    if (auto d = parse_timestamp_day(it->second)) {
      return d;
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<core::CalendarDate> parse_timestamp_day(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '"')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '"')) {
    text.remove_suffix(1);
  }
  if (text.size() == 8U) {
    return core::calendar::parse_compact(text);
  }
  if (text.size() == 10U || (text.size() > 10U && (text[10] == 'T' || text[10] == ' '))) {
    return core::calendar::parse_iso(text.substr(0, 10));
  }
  return std::nullopt;
}

DateResolver DateResolver::with_default_strategies() {
  std::vector<DateStrategy> s;
  s.push_back(DateStrategy{.name = "time_coverage_start", .resolve = [](const DateContext& ctx) {
                             return from_attributes(ctx, {"time_coverage_start", "start_time"});
                           }});
  s.push_back(DateStrategy{.name = "time_coverage_end", .resolve = [](const DateContext& ctx) {
                             return from_attributes(ctx, {"time_coverage_end", "end_time"});
                           }});
  s.push_back(DateStrategy{.name = "identifier_year_day_of_year", .resolve = [](const DateContext& ctx) {
                             return core::calendar::find_year_day_of_year(ctx.identifier);
                           }});
  s.push_back(DateStrategy{.name = "date_created", .resolve = [](const DateContext& ctx) {
                             return from_attributes(ctx, {"date_created"});
                           }});
  s.push_back(DateStrategy{.name = "identifier_calendar_date", .resolve = [](const DateContext& ctx) {
                             return core::calendar::find_dotted_compact_date(ctx.identifier);
                           }});
  return DateResolver(std::move(s));
}

ResolvedDate DateResolver::resolve(const DateContext& context) const {
  for (const DateStrategy& strategy : strategies_) {
    if (!strategy.resolve) {
      continue;
    }
    if (auto d = strategy.resolve(context)) {
      spdlog::debug("{}: date {} from {}", context.identifier, core::calendar::to_iso(*d), strategy.name);
      return ResolvedDate{.date = d, .strategy = strategy.name};
    }
  }
  spdlog::warn("{}: no date strategy succeeded; unit marked with unknown date", context.identifier);
  return ResolvedDate{};
}

ResolvedDate DateResolver::resolve(const core::RasterDataset& dataset) const {
  return resolve(DateContext{.attributes = dataset.attributes, .identifier = dataset.source.filename().string()});
}

}  // namespace geohex::raster
