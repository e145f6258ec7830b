/**
 * @file unit_source.hpp
 * @brief Source of independently processed units of work.
 * @author geohex developers
 */
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "geohex/core/transport.hpp"
#include "geohex/core/types.hpp"
#include "geohex/fetch/fetch_outcome.hpp"
#include "geohex/windows/window_partitioner.hpp"

namespace geohex::pipeline {

/**
 * @brief One unit of work inside a window, identified by its artifact key.
 */
struct UnitDescriptor {
  std::string key{};
  std::string label{};
  core::TimeWindow window{};
  std::vector<core::GranuleHandle> granules{};
};

/**
 * @brief Units of one window. A non-Ok status means the window could not be listed.
 */
struct UnitListing {
  std::vector<UnitDescriptor> units{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Raw data of one fetched unit: local raster files or occurrence records.
 */
struct RawUnit {
  std::vector<std::filesystem::path> files{};
  std::vector<core::OccurrenceRecord> records{};
};

/**
 * @brief Canonical points of one unit plus its constant metadata.
 */
struct FlattenedUnit {
  std::vector<core::PointRecord> points{};
  core::UnitMetadata metadata{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Strategy plugged into the pipeline driver for one kind of input.
 */
class IUnitSource {
 public:
  virtual ~IUnitSource() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
  [[nodiscard]] virtual windows::Granularity granularity() const noexcept = 0;

  /**
   * @brief Acquire whatever the source needs for the whole run (login, ...).
   * @return `DataUnavailable` when the run cannot proceed.
   */
  [[nodiscard]] virtual core::Status prepare() = 0;

  /**
   * @brief Units of `window`, keyed for artifacts at `resolution`.
   */
  [[nodiscard]] virtual UnitListing list_units(const core::TimeWindow& window, int resolution) = 0;

  [[nodiscard]] virtual fetch::FetchOutcome<RawUnit> fetch(const UnitDescriptor& unit) = 0;

  [[nodiscard]] virtual FlattenedUnit flatten(const UnitDescriptor& unit, const RawUnit& raw) const = 0;
};

}  // namespace geohex::pipeline
