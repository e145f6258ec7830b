/**
 * @file transport.hpp
 * @brief Request/reply types exchanged with upstream catalog and REST services.
 * @author geohex developers
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "geohex/core/types.hpp"

namespace geohex::core {

/**
 * @brief Outcome of one transport call.
 *
 * `http_status` is 200 on success; transport errors that never reached a
 * server leave it at 0.
 */
template <typename T>
struct TransportReply {
  Status status{Status::TransportError};
  int http_status{};
  std::string message{};
  T payload{};

  [[nodiscard]] bool ok() const noexcept { return status == Status::Ok && http_status == 200; }
};

/**
 * @brief Downloadable catalog entry (one granule).
 */
struct GranuleHandle {
  std::string id{};
  std::string name{};
};

/**
 * @brief Catalog search parameters for one window.
 */
struct CatalogQuery {
  std::string short_name{};
  std::string provider{};
  TimeWindow temporal{};
  std::string granule_name{};
  std::string sort_key{"-start_date"};
  bool downloadable{true};
};

/**
 * @brief One occurrence record as returned by a paginated service.
 */
struct OccurrenceRecord {
  std::optional<double> latitude{};
  std::optional<double> longitude{};
  std::string event_date{};
  std::string scientific_name{};
};

/**
 * @brief Filters for a paginated occurrence query.
 */
struct OccurrenceQuery {
  std::string scientific_name{};
  CalendarDate start_date{};
  CalendarDate end_date{};
};

/**
 * @brief `{results: [...], total: int}` page body.
 */
struct OccurrencePage {
  std::vector<OccurrenceRecord> results{};
  std::optional<std::int64_t> total{};
};

using SearchReply = TransportReply<std::vector<GranuleHandle>>;
using DownloadReply = TransportReply<std::vector<std::filesystem::path>>;
using PageReply = TransportReply<OccurrencePage>;

}  // namespace geohex::core
