/**
 * @file services.hpp
 * @brief Upstream service interfaces (catalog search/download and paginated REST).
 * @author geohex developers
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "geohex/core/transport.hpp"
#include "geohex/fetch/session.hpp"

namespace geohex::fetch {

/**
 * @brief Dataset catalog with search and bulk download.
 */
class ICatalogService {
 public:
  virtual ~ICatalogService() = default;
  /**
   * @brief Search downloadable granules of one dataset inside a time window.
   */
  [[nodiscard]] virtual core::SearchReply search(const EarthdataSession& session, const core::CatalogQuery& query) = 0;
  /**
   * @brief Download granules into `target_dir` and return their local paths.
   */
  [[nodiscard]] virtual core::DownloadReply download(const EarthdataSession& session,
                                                     const std::vector<core::GranuleHandle>& granules,
                                                     const std::filesystem::path& target_dir) = 0;
};

/**
 * @brief Paginated occurrence REST endpoint.
 */
class IOccurrenceService {
 public:
  virtual ~IOccurrenceService() = default;
  [[nodiscard]] virtual core::PageReply page(const core::OccurrenceQuery& query, std::size_t size,
                                             std::size_t offset) = 0;
};

}  // namespace geohex::fetch
