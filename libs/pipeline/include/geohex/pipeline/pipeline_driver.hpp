/**
 * @file pipeline_driver.hpp
 * @brief Per-unit fetch → flatten → aggregate → write state machine.
 * @author geohex developers
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "geohex/hexgrid/hex_aggregator.hpp"
#include "geohex/hexgrid/hex_indexer.hpp"
#include "geohex/pipeline/unit_source.hpp"
#include "geohex/sink/artifact_sink.hpp"

namespace geohex::pipeline {

enum class UnitState : std::uint8_t { Pending, Fetching, Flattening, Aggregating, Writing, Done, Skipped, Failed };

[[nodiscard]] const char* unit_state_to_string(UnitState s) noexcept;

/**
 * @brief Per-run tallies.
 */
struct RunCounters {
  std::size_t fetched{};
  std::size_t written{};
  std::size_t skipped{};
  std::size_t failed{};
  std::size_t empty{};
};

struct UnitReport {
  std::string key{};
  UnitState state{UnitState::Pending};
  std::string message{};
};

/**
 * @brief Outcome of a run. `aborted` is set only when the source could not be prepared.
 */
struct RunSummary {
  bool aborted{false};
  std::string message{};
  RunCounters counters{};
  std::vector<UnitReport> reports{};
};

/**
 * @brief Sequential driver: windows in the given order, units one at a time.
 *
 * Every unit is checked against the sink before any I/O for it. A failing unit
 * is recorded and the run continues.
 */
class PipelineDriver {
 public:
  struct Config {
    std::string hex_backend{"planar"};
    hexgrid::HexAggregator::Config aggregation{};
    sink::OutputSchema schema{};
    bool write_empty_units{false};
  };

  /**
   * @brief Build a driver.
   * @return nullptr when the hex backend is unavailable or rejects the resolution.
   */
  static std::unique_ptr<PipelineDriver> Create(const Config& config, IUnitSource& source, sink::IArtifactSink& sink);

  /**
   * @brief Process `windows` in order.
   */
  [[nodiscard]] RunSummary run(const std::vector<core::TimeWindow>& windows);

  /**
   * @brief Partition [start, end] at the source's granularity and process it newest first.
   */
  [[nodiscard]] RunSummary run(const core::CalendarDate& start, const core::CalendarDate& end);

  [[nodiscard]] const Config& config() const noexcept { return config_; }

 private:
  PipelineDriver(Config config, std::unique_ptr<hexgrid::IHexIndexer> indexer, IUnitSource& source,
                 sink::IArtifactSink& sink);

  UnitReport process(const UnitDescriptor& unit, RunCounters& counters);
  UnitReport write_table(const UnitDescriptor& unit, const hexgrid::AggregatedTable& table, RunCounters& counters);
  /**
   * @brief Mark `report` failed in its current stage.
   */
  static UnitReport fail(UnitReport report, const std::string& message, RunCounters& counters);

  Config config_{};
  std::unique_ptr<hexgrid::IHexIndexer> indexer_;
  hexgrid::HexAggregator aggregator_;
  IUnitSource& source_;
  sink::IArtifactSink& sink_;
};

}  // namespace geohex::pipeline
