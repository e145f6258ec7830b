/**
 * @file csv_artifact_sink.hpp
 * @brief One CSV file per unit, written atomically.
 * @author geohex developers
 */
#pragma once

#include <filesystem>
#include <string>

#include "geohex/sink/artifact_sink.hpp"

namespace geohex::sink {

/**
 * @brief CSV artifact store rooted at a directory.
 *
 * Each artifact starts with a `#record_type=metadata,...` comment line
 * followed by a header row. Rows are first written to a hidden temporary
 * sibling and renamed into place, so readers only ever see complete files.
 */
class CsvArtifactSink final : public IArtifactSink {
 public:
  struct Config {
    std::filesystem::path output_dir{};
  };

  explicit CsvArtifactSink(Config config) : config_(std::move(config)) {}

  [[nodiscard]] bool exists(const std::string& key) const override;
  [[nodiscard]] WriteResult write(const std::string& key, const hexgrid::AggregatedTable& table,
                                  const OutputSchema& schema) override;

  [[nodiscard]] std::filesystem::path path_for(const std::string& key) const;

 private:
  Config config_{};
};

/**
 * @brief `field` as a CSV cell, double-quoted when it contains a comma, quote or line break.
 */
[[nodiscard]] std::string csv_escape(const std::string& field);

/**
 * @brief Header row for `schema`.
 */
[[nodiscard]] std::string csv_header(const OutputSchema& schema);

/**
 * @brief One data row for `row` of `table`.
 */
[[nodiscard]] std::string csv_row(const hexgrid::AggregatedTable& table, const hexgrid::AggregatedRow& row,
                                  const OutputSchema& schema);

/**
 * @brief Move a completed temporary file to `final_path` without replacing an existing artifact.
 *
 * `tmp_path` is removed in every case. Returns `AlreadyExists` when
 * `final_path` is present, leaving it untouched.
 */
[[nodiscard]] WriteResult publish_artifact(const std::filesystem::path& tmp_path,
                                           const std::filesystem::path& final_path);

}  // namespace geohex::sink
