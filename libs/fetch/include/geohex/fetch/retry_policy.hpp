/**
 * @file retry_policy.hpp
 * @brief Bounded retry with linear backoff for transport calls.
 * @author geohex developers
 */
#pragma once

#include <chrono>
#include <functional>
#include <string_view>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "geohex/core/transport.hpp"

namespace geohex::fetch {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void sleep_for(std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }

/**
 * @brief Retry configuration shared by all fetch clients.
 *
 * Attempt `k` (1-based) that fails is followed by a sleep of
 * `base_delay * k` before attempt `k + 1`. No sleep follows the last attempt.
 */
struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds politeness_delay{200};
  Sleeper sleeper{sleep_for};

  [[nodiscard]] std::chrono::milliseconds backoff(int attempt) const noexcept { return base_delay * attempt; }

  void pause(std::chrono::milliseconds d) const {
    if (sleeper && d.count() > 0) {
      sleeper(d);
    }
  }
};

/**
 * @brief Call `request` until it returns a successful reply or attempts run out.
 *
 * `attempts_out`, when given, receives the number of attempts made. The last
 * reply is returned either way so callers can inspect the failure.
 */
template <typename Request>
auto call_with_retry(const RetryPolicy& policy, std::string_view label, Request&& request, int* attempts_out = nullptr)
    -> decltype(request()) {
  decltype(request()) reply{};
  const int max_attempts = (policy.max_attempts > 0) ? policy.max_attempts : 1;
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (attempts_out != nullptr) {
      *attempts_out = attempt;
    }
    reply = request();
    if (reply.ok()) {
      return reply;
    }
    if (reply.http_status != 0) {
      spdlog::warn("{}: HTTP {} (attempt {}/{})", label, reply.http_status, attempt, max_attempts);
    } else {
      spdlog::warn("{}: {} {} (attempt {}/{})", label, core::status_to_string(reply.status), reply.message, attempt,
                   max_attempts);
    }
    if (attempt < max_attempts) {
      policy.pause(policy.backoff(attempt));
    }
  }
  return reply;
}

}  // namespace geohex::fetch
