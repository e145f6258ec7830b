/**
 * @file directory_catalog_service.hpp
 * @brief Catalog backed by a local directory of granule files.
 * @author geohex developers
 */
#pragma once

#include <filesystem>
#include <string_view>
#include <utility>
#include <vector>

#include "geohex/fetch/services.hpp"

namespace geohex::fetch {

/**
 * @brief Local mirror of a remote catalog.
 *
 * `search` lists regular files whose name matches the granule glob (`*`, `?`)
 * and whose name-encoded day (`AYYYYDDD` or `.YYYYMMDD.`) lies inside the
 * window. `download` copies files into the target directory, leaving files
 * that are already there untouched.
 */
class DirectoryCatalogService final : public ICatalogService {
 public:
  struct Config {
    std::filesystem::path source_dir{};
  };

  explicit DirectoryCatalogService(Config config) : config_(std::move(config)) {}

  [[nodiscard]] core::SearchReply search(const EarthdataSession& session, const core::CatalogQuery& query) override;
  [[nodiscard]] core::DownloadReply download(const EarthdataSession& session,
                                             const std::vector<core::GranuleHandle>& granules,
                                             const std::filesystem::path& target_dir) override;

 private:
  Config config_{};
};

/**
 * @brief Shell-style glob match supporting `*` and `?`.
 */
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view text) noexcept;

}  // namespace geohex::fetch
