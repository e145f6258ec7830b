/**
 * @file catalog_fetch_client.cpp
 * @brief Catalog/download client implementation.
 * @author geohex developers
 */

#include "geohex/fetch/catalog_fetch_client.hpp"

#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "geohex/core/calendar.hpp"

namespace geohex::fetch {

FetchOutcome<std::vector<core::GranuleHandle>> CatalogFetchClient::search(const core::TimeWindow& window) const {
  FetchOutcome<std::vector<core::GranuleHandle>> out{};
  if (!session_.authenticated()) {
    out.status = FetchStatus::Failed;
    out.message = "session is not authenticated";
    return out;
  }

  const core::CatalogQuery query{.short_name = config_.short_name,
                                 .provider = config_.provider,
                                 .temporal = window,
                                 .granule_name = config_.granule_name,
                                 .sort_key = config_.sort_key,
                                 .downloadable = true};
  const std::string label = fmt::format("search {} {}..{}", config_.short_name,
                                        core::calendar::to_iso(window.start), core::calendar::to_iso(window.end));
  spdlog::info("searching {} | {} -> {} | granule='{}'", config_.short_name, core::calendar::to_iso(window.start),
               core::calendar::to_iso(window.end), config_.granule_name);

  const core::SearchReply reply =
      call_with_retry(config_.retry, label, [&]() { return service_.search(session_, query); }, &out.attempts);
  if (!reply.ok()) {
    out.status = FetchStatus::Failed;
    out.message = reply.message.empty() ? fmt::format("HTTP {}", reply.http_status) : reply.message;
    return out;
  }

  spdlog::info("  results: {}", reply.payload.size());
  if (reply.payload.empty()) {
    out.status = FetchStatus::Empty;
    return out;
  }

  const std::size_t stride = (config_.granule_stride > 0U) ? config_.granule_stride : 1U;
  for (std::size_t i = 0; i < reply.payload.size(); i += stride) {
    out.payload.push_back(reply.payload[i]);
  }
  if (stride > 1U) {
    spdlog::info("  keeping 1 of every {} granules ({} selected)", stride, out.payload.size());
  }
  out.status = FetchStatus::Results;
  return out;
}

FetchOutcome<std::vector<std::filesystem::path>> CatalogFetchClient::download(
    const std::vector<core::GranuleHandle>& granules, const std::filesystem::path& target_dir) const {
  FetchOutcome<std::vector<std::filesystem::path>> out{};
  if (granules.empty()) {
    out.status = FetchStatus::Empty;
    return out;
  }

  std::error_code ec;
  std::filesystem::create_directories(target_dir, ec);
  if (ec) {
    out.status = FetchStatus::Failed;
    out.message = fmt::format("cannot create {}: {}", target_dir.string(), ec.message());
    return out;
  }

  const core::DownloadReply reply = call_with_retry(
      config_.retry, fmt::format("download {} granules", granules.size()),
      [&]() { return service_.download(session_, granules, target_dir); }, &out.attempts);
  if (!reply.ok()) {
    out.status = FetchStatus::Failed;
    out.message = reply.message.empty() ? fmt::format("HTTP {}", reply.http_status) : reply.message;
    return out;
  }

  spdlog::info("  downloaded: {}", reply.payload.size());
  out.payload = reply.payload;
  out.status = out.payload.empty() ? FetchStatus::Empty : FetchStatus::Results;
  return out;
}

}  // namespace geohex::fetch
