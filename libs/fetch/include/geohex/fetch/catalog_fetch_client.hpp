/**
 * @file catalog_fetch_client.hpp
 * @brief Per-window catalog search and bulk download with bounded retry.
 * @author geohex developers
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "geohex/fetch/fetch_outcome.hpp"
#include "geohex/fetch/retry_policy.hpp"
#include "geohex/fetch/services.hpp"

namespace geohex::fetch {

/**
 * @brief Catalog/download client: one search per window, one bulk download.
 */
class CatalogFetchClient {
 public:
  /**
   * @brief Dataset selection for catalog searches.
   */
  struct Config {
    std::string short_name{};
    std::string provider{};
    std::string granule_name{};
    std::string sort_key{"-start_date"};
    std::size_t granule_stride{1};
    RetryPolicy retry{};
  };

  CatalogFetchClient(Config config, ICatalogService& service, EarthdataSession& session)
      : config_(std::move(config)), service_(service), session_(session) {}

  /**
   * @brief Search granules of one window. No results is `Empty`, not an error.
   *
   * With `granule_stride > 1` only every N-th result is kept.
   */
  [[nodiscard]] FetchOutcome<std::vector<core::GranuleHandle>> search(const core::TimeWindow& window) const;

  /**
   * @brief Download the given granules in one call.
   */
  [[nodiscard]] FetchOutcome<std::vector<std::filesystem::path>> download(
      const std::vector<core::GranuleHandle>& granules, const std::filesystem::path& target_dir) const;

  [[nodiscard]] const Config& config() const noexcept { return config_; }

  /**
   * @brief Session used for every search and download of this client.
   */
  [[nodiscard]] EarthdataSession& session() const noexcept { return session_; }

 private:
  Config config_{};
  ICatalogService& service_;
  EarthdataSession& session_;
};

}  // namespace geohex::fetch
