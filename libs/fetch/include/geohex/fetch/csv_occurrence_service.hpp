/**
 * @file csv_occurrence_service.hpp
 * @brief Paginated occurrence service over a local CSV export.
 * @author geohex developers
 */
#pragma once

#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "geohex/fetch/services.hpp"

namespace geohex::fetch {

/**
 * @brief Occurrence service backed by a CSV file with a header row.
 *
 * Required columns (any order): `scientificName`, `eventDate`,
 * `decimalLatitude`, `decimalLongitude`. A query matches records whose name
 * starts with `scientific_name` (so a genus matches its species) and whose
 * event day lies in [start_date, end_date].
 */
class CsvOccurrenceService final : public IOccurrenceService {
 public:
  struct Config {
    std::filesystem::path csv_file{};
  };

  /**
   * @brief Factory helper that parses the CSV. Returns nullptr when the file
   * cannot be opened or lacks a required column.
   */
  static std::unique_ptr<CsvOccurrenceService> Create(const Config& config);

  [[nodiscard]] core::PageReply page(const core::OccurrenceQuery& query, std::size_t size,
                                     std::size_t offset) override;

  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

 private:
  explicit CsvOccurrenceService(std::vector<core::OccurrenceRecord> records) : records_(std::move(records)) {}

  std::vector<core::OccurrenceRecord> records_{};
};

}  // namespace geohex::fetch
