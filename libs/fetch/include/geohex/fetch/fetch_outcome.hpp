/**
 * @file fetch_outcome.hpp
 * @brief Tri-state result of fetching one unit of work.
 * @author geohex developers
 */
#pragma once

#include <cstdint>
#include <string>

namespace geohex::fetch {

enum class FetchStatus : std::uint8_t { Results, Empty, Failed };

inline const char* fetch_status_to_string(FetchStatus s) {
  switch (s) {
    case FetchStatus::Results:
      return "results";
    case FetchStatus::Empty:
      return "empty";
    case FetchStatus::Failed:
      return "failed";
    default:
      return "unknown";
  }
}

/**
 * @brief `Results(payload)`, `Empty` or `Failed`.
 *
 * `Failed` means "no data available for this unit"; callers never treat it
 * as fatal to a run.
 */
template <typename Payload>
struct FetchOutcome {
  FetchStatus status{FetchStatus::Empty};
  Payload payload{};
  int attempts{};
  std::string message{};

  [[nodiscard]] bool has_results() const noexcept { return status == FetchStatus::Results; }
};

}  // namespace geohex::fetch
