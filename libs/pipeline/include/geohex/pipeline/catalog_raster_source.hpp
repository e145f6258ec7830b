/**
 * @file catalog_raster_source.hpp
 * @brief Unit source for gridded satellite granules found through a catalog.
 * @author geohex developers
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "geohex/core/interfaces.hpp"
#include "geohex/fetch/catalog_fetch_client.hpp"
#include "geohex/pipeline/unit_source.hpp"
#include "geohex/raster/date_resolver.hpp"
#include "geohex/raster/grid_flattener.hpp"

namespace geohex::pipeline {

/**
 * @brief How granules map to artifacts.
 *
 * `PerFile`: one artifact per granule; the window search runs while listing
 * and each granule is checked against the sink before it is downloaded.
 * `PerWindow`: one artifact per window, keyed before any network I/O; rows are
 * grouped by cell and by the date resolved for each granule.
 */
enum class UnitMode : std::uint8_t { PerFile, PerWindow };

[[nodiscard]] const char* unit_mode_to_string(UnitMode m) noexcept;
[[nodiscard]] bool parse_unit_mode(std::string_view text, UnitMode& out) noexcept;

class CatalogRasterSource final : public IUnitSource {
 public:
  struct Config {
    std::string name{};
    UnitMode mode{UnitMode::PerFile};
    std::filesystem::path download_dir{};
    raster::GridFlattener::Config flatten{};
  };

  /**
   * @brief `prepare()` authenticates the session owned by `client`.
   */
  CatalogRasterSource(Config config, const fetch::CatalogFetchClient& client, fetch::IAuthenticator& authenticator,
                      const core::IRasterReader& reader);

  [[nodiscard]] std::string_view name() const noexcept override { return config_.name; }
  [[nodiscard]] windows::Granularity granularity() const noexcept override { return windows::Granularity::Month; }

  [[nodiscard]] core::Status prepare() override;
  [[nodiscard]] UnitListing list_units(const core::TimeWindow& window, int resolution) override;
  [[nodiscard]] fetch::FetchOutcome<RawUnit> fetch(const UnitDescriptor& unit) override;
  [[nodiscard]] FlattenedUnit flatten(const UnitDescriptor& unit, const RawUnit& raw) const override;

 private:
  Config config_{};
  const fetch::CatalogFetchClient& client_;
  fetch::IAuthenticator& authenticator_;
  const core::IRasterReader& reader_;
  raster::GridFlattener flattener_;
  raster::DateResolver resolver_;
};

}  // namespace geohex::pipeline
