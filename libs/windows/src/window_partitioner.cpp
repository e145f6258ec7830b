/**
 * @file window_partitioner.cpp
 * @brief Month/day window partitioning.
 * @author geohex developers
 */

#include "geohex/windows/window_partitioner.hpp"

#include <algorithm>
#include <utility>

#include "geohex/core/calendar.hpp"

namespace geohex::windows {
namespace cal = geohex::core::calendar;

std::vector<core::TimeWindow> month_windows(const core::CalendarDate& start, const core::CalendarDate& end) {
  std::vector<core::TimeWindow> out;
  if (end < start) {
    return out;
  }

  core::CalendarDate cur = cal::first_of_month(start);
  const core::CalendarDate last = cal::first_of_month(end);
  while (cur <= last) {
    const core::CalendarDate month_end = cal::last_of_month(cur);
    out.push_back(core::TimeWindow{.start = std::max(cur, start), .end = std::min(month_end, end)});
    cur = cal::add_days(month_end, 1);
  }
  return out;
}

std::vector<core::TimeWindow> day_windows(const core::CalendarDate& start, const core::CalendarDate& end) {
  std::vector<core::TimeWindow> out;
  if (end < start) {
    return out;
  }
  const int first = cal::to_serial(start);
  const int last = cal::to_serial(end);
  out.reserve(static_cast<std::size_t>(last - first + 1));
  for (int s = first; s <= last; ++s) {
    const core::CalendarDate d = cal::civil_from_days(s);
    out.push_back(core::TimeWindow{.start = d, .end = d});
  }
  return out;
}

std::vector<core::TimeWindow> partition(const core::CalendarDate& start, const core::CalendarDate& end,
                                        Granularity granularity) {
  return (granularity == Granularity::Month) ? month_windows(start, end) : day_windows(start, end);
}

std::vector<core::TimeWindow> reversed(std::vector<core::TimeWindow> ascending) {
  std::reverse(ascending.begin(), ascending.end());
  return ascending;
}

bool covers_exactly(const std::vector<core::TimeWindow>& windows, const core::CalendarDate& start,
                    const core::CalendarDate& end) {
  if (windows.empty()) {
    return false;
  }
  if (windows.front().start != start || windows.back().end != end) {
    return false;
  }
  for (std::size_t i = 0; i < windows.size(); ++i) {
    if (windows[i].end < windows[i].start) {
      return false;
    }
    if (i > 0 && cal::to_serial(windows[i].start) != cal::to_serial(windows[i - 1].end) + 1) {
      return false;
    }
  }
  return true;
}

}  // namespace geohex::windows
