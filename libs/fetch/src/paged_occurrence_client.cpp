/**
 * @file paged_occurrence_client.cpp
 * @brief Paginated occurrence client implementation.
 * @author geohex developers
 */

#include "geohex/fetch/paged_occurrence_client.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "geohex/core/calendar.hpp"

namespace geohex::fetch {

FetchOutcome<OccurrenceBatch> PagedOccurrenceClient::fetch(const core::OccurrenceQuery& query) const {
  FetchOutcome<OccurrenceBatch> out{};
  const std::size_t page_size = (config_.page_size > 0U) ? config_.page_size : 1U;
  std::size_t offset = 0;

  while (true) {
    if (offset > 0U) {
      config_.retry.pause(config_.retry.politeness_delay);
    }

    const std::string label = fmt::format("{} {}..{} offset={}", query.scientific_name,
                                          core::calendar::to_iso(query.start_date),
                                          core::calendar::to_iso(query.end_date), offset);
    int attempts = 0;
    const core::PageReply reply =
        call_with_retry(config_.retry, label, [&]() { return service_.page(query, page_size, offset); }, &attempts);
    out.attempts += attempts;
    if (!reply.ok()) {
      out.status = FetchStatus::Failed;
      out.message = fmt::format("page at offset {} failed after {} attempts", offset, attempts);
      if (!out.payload.records.empty()) {
        spdlog::warn("{}: discarding {} records from earlier pages", query.scientific_name,
                     out.payload.records.size());
        out.payload.records.clear();
      }
      return out;
    }

    ++out.payload.pages;
    if (reply.payload.total.has_value()) {
      out.payload.reported_total = reply.payload.total;
    }
    if (reply.payload.results.empty()) {
      break;
    }
    out.payload.records.insert(out.payload.records.end(), reply.payload.results.begin(), reply.payload.results.end());

    offset += page_size;
    if (out.payload.reported_total.has_value() &&
        static_cast<std::int64_t>(offset) >= *out.payload.reported_total) {
      break;
    }
  }

  out.status = out.payload.records.empty() ? FetchStatus::Empty : FetchStatus::Results;
  spdlog::debug("{}: {} records in {} pages", query.scientific_name, out.payload.records.size(), out.payload.pages);
  return out;
}

}  // namespace geohex::fetch
