/**
 * @file occurrence_daily_source.hpp
 * @brief Unit source producing one artifact per day of occurrence records.
 * @author geohex developers
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "geohex/fetch/paged_occurrence_client.hpp"
#include "geohex/pipeline/unit_source.hpp"

namespace geohex::pipeline {

/**
 * @brief Daily occurrence counts for a fixed list of taxa.
 *
 * Every taxon is paged separately; records are tagged with the queried name so
 * rows group by (cell, taxon). Each record contributes the value 1.0, so the
 * aggregated `n` is the observation count.
 */
class OccurrenceDailySource final : public IUnitSource {
 public:
  struct Config {
    std::string name{};
    std::vector<std::string> species{};
  };

  OccurrenceDailySource(Config config, const fetch::PagedOccurrenceClient& client)
      : config_(std::move(config)), client_(client) {}

  [[nodiscard]] std::string_view name() const noexcept override { return config_.name; }
  [[nodiscard]] windows::Granularity granularity() const noexcept override { return windows::Granularity::Day; }

  [[nodiscard]] core::Status prepare() override;
  [[nodiscard]] UnitListing list_units(const core::TimeWindow& window, int resolution) override;
  [[nodiscard]] fetch::FetchOutcome<RawUnit> fetch(const UnitDescriptor& unit) override;
  [[nodiscard]] FlattenedUnit flatten(const UnitDescriptor& unit, const RawUnit& raw) const override;

 private:
  Config config_{};
  const fetch::PagedOccurrenceClient& client_;
};

}  // namespace geohex::pipeline
