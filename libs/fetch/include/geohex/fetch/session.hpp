/**
 * @file session.hpp
 * @brief Explicit Earthdata session passed to catalog operations.
 * @author geohex developers
 */
#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace geohex::fetch {

/**
 * @brief Account credentials for the upstream data provider.
 */
struct Credentials {
  std::string username{};
  std::string password{};

  [[nodiscard]] bool complete() const noexcept { return !username.empty() && !password.empty(); }
};

/**
 * @brief Login backend (remote account service, or a local no-op).
 */
class IAuthenticator {
 public:
  virtual ~IAuthenticator() = default;
  [[nodiscard]] virtual bool login(const Credentials& credentials) = 0;
};

/**
 * @brief Authenticator for collaborators that need no account (local mirrors, fixtures).
 */
class AnonymousAuthenticator final : public IAuthenticator {
 public:
  [[nodiscard]] bool login(const Credentials&) override { return true; }
};

/**
 * @brief Session state owned by the caller and shared by reference with fetch clients.
 *
 * A failed login is sticky: later `ensure_authenticated` calls return false
 * without contacting the authenticator again.
 */
class EarthdataSession {
 public:
  enum class State : std::uint8_t { Unauthenticated, Authenticated, Failed };

  explicit EarthdataSession(Credentials credentials) : credentials_(std::move(credentials)) {}

  /**
   * @brief Build credentials from `EARTHDATA_USERNAME` / `EARTHDATA_PASSWORD`.
   */
  static EarthdataSession from_environment();

  [[nodiscard]] bool ensure_authenticated(IAuthenticator& authenticator);

  [[nodiscard]] State state() const noexcept { return state_; }
  [[nodiscard]] bool authenticated() const noexcept { return state_ == State::Authenticated; }
  [[nodiscard]] const Credentials& credentials() const noexcept { return credentials_; }

 private:
  Credentials credentials_{};
  State state_{State::Unauthenticated};
};

}  // namespace geohex::fetch
