/**
 * @file window_partitioner.hpp
 * @brief Partition a date range into ordered, contiguous time windows.
 * @author geohex developers
 */
#pragma once

#include <vector>

#include "geohex/core/types.hpp"

namespace geohex::windows {

/**
 * @brief Window granularity.
 */
enum class Granularity { Month, Day };

/**
 * @brief Ascending calendar-month windows covering [start, end].
 *
 * The first window starts at `start`, the last ends at `end`, interior windows
 * bound exactly one calendar month. Returns no windows when start > end.
 */
[[nodiscard]] std::vector<core::TimeWindow> month_windows(const core::CalendarDate& start,
                                                          const core::CalendarDate& end);

/**
 * @brief Ascending single-day windows covering [start, end].
 */
[[nodiscard]] std::vector<core::TimeWindow> day_windows(const core::CalendarDate& start,
                                                        const core::CalendarDate& end);

[[nodiscard]] std::vector<core::TimeWindow> partition(const core::CalendarDate& start, const core::CalendarDate& end,
                                                      Granularity granularity);

/**
 * @brief Most-recent-first view of a fully materialised ascending sequence.
 */
[[nodiscard]] std::vector<core::TimeWindow> reversed(std::vector<core::TimeWindow> ascending);

/**
 * @brief True when windows are ordered, non-overlapping, gap-free and cover [start, end].
 */
[[nodiscard]] bool covers_exactly(const std::vector<core::TimeWindow>& windows, const core::CalendarDate& start,
                                  const core::CalendarDate& end);

}  // namespace geohex::windows
