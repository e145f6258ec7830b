/**
 * @file artifact_sink.hpp
 * @brief Deterministic artifact keys and the idempotent sink interface.
 * @author geohex developers
 */
#pragma once

#include <string>
#include <vector>

#include "geohex/core/types.hpp"
#include "geohex/hexgrid/hex_aggregator.hpp"

namespace geohex::sink {

/**
 * @brief Column naming for one source's artifacts.
 */
struct OutputSchema {
  std::string source{};
  std::string value_name{"value"};
  std::string category_name{"category"};
  bool include_category{false};
  /// Ancillary fields written as trailing `{name}_mean` columns, in this order.
  std::vector<std::string> ancillary_names{};
};

/**
 * @brief `{source}_hexr{res}_{YYYY-MM-DD}`.
 */
[[nodiscard]] std::string day_unit_key(const std::string& source, int resolution, const core::CalendarDate& day);

/**
 * @brief `{source}_hexr{res}_{start}_{end}`.
 */
[[nodiscard]] std::string window_unit_key(const std::string& source, int resolution, const core::TimeWindow& window);

/**
 * @brief `{source}_{stem}_hexr{res}`, where `stem` is the file name without its last extension.
 */
[[nodiscard]] std::string file_unit_key(const std::string& source, int resolution, const std::string& file_name);

/**
 * @brief Outcome of a write request.
 */
struct WriteResult {
  core::Status status{core::Status::Ok};
  std::size_t rows{};
  std::string location{};
  std::string message{};
};

/**
 * @brief Persistent store with at-most-once artifacts per key.
 */
class IArtifactSink {
 public:
  virtual ~IArtifactSink() = default;
  [[nodiscard]] virtual bool exists(const std::string& key) const = 0;
  /**
   * @brief Persist `table` under `key` as a whole.
   * @return `AlreadyExists` (nothing written) if the key is already present.
   */
  [[nodiscard]] virtual WriteResult write(const std::string& key, const hexgrid::AggregatedTable& table,
                                          const OutputSchema& schema) = 0;
};

}  // namespace geohex::sink
