/**
 * @file session.cpp
 * @brief Earthdata session implementation.
 * @author geohex developers
 */

#include "geohex/fetch/session.hpp"

#include <cstdlib>
#include <utility>

#include <spdlog/spdlog.h>

namespace geohex::fetch {
namespace {

std::string env_or_empty(const char* name) {
  const char* raw = std::getenv(name);
  return (raw != nullptr) ? std::string(raw) : std::string{};
}

}  // namespace

EarthdataSession EarthdataSession::from_environment() {
  return EarthdataSession(
      Credentials{.username = env_or_empty("EARTHDATA_USERNAME"), .password = env_or_empty("EARTHDATA_PASSWORD")});
}

bool EarthdataSession::ensure_authenticated(IAuthenticator& authenticator) {
  if (state_ == State::Authenticated) {
    return true;
  }
  if (state_ == State::Failed) {
    spdlog::error("authentication already failed for this session");
    return false;
  }

  spdlog::info("authenticating with Earthdata");
  if (!authenticator.login(credentials_)) {
    state_ = State::Failed;
    spdlog::error("authentication failed");
    return false;
  }
  state_ = State::Authenticated;
  spdlog::info("authenticated");
  return true;
}

}  // namespace geohex::fetch
