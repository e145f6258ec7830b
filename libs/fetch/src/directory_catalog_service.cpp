/**
 * @file directory_catalog_service.cpp
 * @brief Directory-backed catalog implementation.
 * @author geohex developers
 */

#include "geohex/fetch/directory_catalog_service.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "geohex/core/calendar.hpp"

namespace geohex::fetch {
namespace {

std::optional<core::CalendarDate> date_from_name(const std::string& name) {
  if (auto d = core::calendar::find_year_day_of_year(name)) {
    return d;
  }
  return core::calendar::find_dotted_compact_date(name);
}

}  // namespace

bool glob_match(std::string_view pattern, std::string_view text) noexcept {
  std::size_t p = 0;
  std::size_t t = 0;
  std::size_t star = std::string_view::npos;
  std::size_t mark = 0;
  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      mark = t;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      t = ++mark;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

core::SearchReply DirectoryCatalogService::search(const EarthdataSession&, const core::CatalogQuery& query) {
  core::SearchReply reply{};
  std::error_code ec;
  if (!std::filesystem::is_directory(config_.source_dir, ec)) {
    reply.status = core::Status::NotFound;
    reply.http_status = 404;
    reply.message = fmt::format("catalog directory not found: {}", config_.source_dir.string());
    return reply;
  }

  std::vector<std::pair<core::CalendarDate, core::GranuleHandle>> hits;
  for (const auto& entry : std::filesystem::directory_iterator(config_.source_dir, ec)) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) {
      continue;
    }
    const std::string name = entry.path().filename().string();
    if (!query.granule_name.empty() && !glob_match(query.granule_name, name)) {
      continue;
    }
    const auto day = date_from_name(name);
    if (!day.has_value() || *day < query.temporal.start || query.temporal.end < *day) {
      continue;
    }
    hits.emplace_back(*day, core::GranuleHandle{.id = entry.path().string(), .name = name});
  }
  if (ec) {
    reply.status = core::Status::IoError;
    reply.message = ec.message();
    return reply;
  }

  const bool descending = !query.sort_key.empty() && query.sort_key.front() == '-';
  std::sort(hits.begin(), hits.end(), [descending](const auto& a, const auto& b) {
    if (a.first != b.first) {
      return descending ? (b.first < a.first) : (a.first < b.first);
    }
    return a.second.name < b.second.name;
  });

  for (auto& hit : hits) {
    reply.payload.push_back(std::move(hit.second));
  }
  reply.status = core::Status::Ok;
  reply.http_status = 200;
  return reply;
}

core::DownloadReply DirectoryCatalogService::download(const EarthdataSession&,
                                                      const std::vector<core::GranuleHandle>& granules,
                                                      const std::filesystem::path& target_dir) {
  core::DownloadReply reply{};
  std::error_code ec;
  std::filesystem::create_directories(target_dir, ec);
  if (ec) {
    reply.status = core::Status::IoError;
    reply.message = ec.message();
    return reply;
  }

  for (const core::GranuleHandle& g : granules) {
    const std::filesystem::path src(g.id);
    const std::filesystem::path dst = target_dir / g.name;
    if (!std::filesystem::exists(dst, ec)) {
      std::filesystem::copy_file(src, dst, std::filesystem::copy_options::skip_existing, ec);
      if (ec) {
        reply.status = core::Status::IoError;
        reply.message = fmt::format("copy {} failed: {}", src.string(), ec.message());
        reply.payload.clear();
        return reply;
      }
    }
    reply.payload.push_back(dst);
  }
  reply.status = core::Status::Ok;
  reply.http_status = 200;
  return reply;
}

}  // namespace geohex::fetch
