/**
 * @file paged_occurrence_client.hpp
 * @brief Offset-paginated occurrence fetching with bounded retry.
 * @author geohex developers
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "geohex/fetch/fetch_outcome.hpp"
#include "geohex/fetch/retry_policy.hpp"
#include "geohex/fetch/services.hpp"

namespace geohex::fetch {

/**
 * @brief Records accumulated over all pages of one query.
 */
struct OccurrenceBatch {
  std::vector<core::OccurrenceRecord> records{};
  std::size_t pages{};
  std::optional<std::int64_t> reported_total{};
};

/**
 * @brief Paginated REST client.
 *
 * Pages of `page_size` records are requested with an advancing offset until a
 * page comes back empty or the offset reaches the server-reported total.
 * Successive requests are separated by the policy's politeness delay.
 */
class PagedOccurrenceClient {
 public:
  struct Config {
    std::size_t page_size{1000};
    RetryPolicy retry{};
  };

  PagedOccurrenceClient(Config config, IOccurrenceService& service) : config_(std::move(config)), service_(service) {}

  /**
   * @brief Fetch every page of `query`.
   *
   * A page that still fails after retries makes the whole outcome `Failed`,
   * even when earlier pages succeeded.
   */
  [[nodiscard]] FetchOutcome<OccurrenceBatch> fetch(const core::OccurrenceQuery& query) const;

  [[nodiscard]] const Config& config() const noexcept { return config_; }

 private:
  Config config_{};
  IOccurrenceService& service_;
};

}  // namespace geohex::fetch
