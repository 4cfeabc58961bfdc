#pragma once

#include "core/job_api.h"
#include "infra/config.h"
#include "infra/http_client.h"
#include "infra/token_lifecycle.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ermes::core {
class ILogger;
}

namespace ermes::infra {

struct LoginCredentials {
  std::string username;
  std::string password;
};

/// Authenticated session against the API: runs the login exchange, owns the
/// TokenLifecycle it feeds, and hands out bearer headers.
///
/// Without login credentials the session only uses whatever token was set on
/// the lifecycle (e.g. restored from TokenStorage) and reports TokenExpired
/// once that token is no longer usable.
class ApiSession : public core::IAuthSession {
public:
  using Headers = std::map<std::string, std::string>;
  using TokenIssuedCallback =
      std::function<void(const std::string &token,
                         std::chrono::system_clock::time_point issued_at)>;

  ApiSession(ClientConfig config, std::shared_ptr<IHttpClient> http,
             std::shared_ptr<TokenLifecycle> tokens,
             std::shared_ptr<core::ILogger> logger = nullptr);

  void set_login(LoginCredentials credentials);

  /// Called after every successful login (used to persist the token).
  void on_token_issued(TokenIssuedCallback cb);

  /// POST the login form and store the returned access token.
  core::Result<void, core::JobError>
  login(const std::shared_ptr<core::CancelToken> &cancel_token);

  core::Result<void, core::JobError>
  ensure_authenticated(const std::shared_ptr<core::CancelToken> &cancel_token) override;

  /// Headers for an authenticated call. With `confirm_remotely` the token is
  /// also pinged against the API and replaced via login when rejected.
  core::Result<Headers, core::JobError>
  authorize(const std::shared_ptr<core::CancelToken> &cancel_token,
            bool confirm_remotely = false);

  /// Drop the current token after the API rejected it.
  void invalidate();

  [[nodiscard]] std::shared_ptr<TokenLifecycle> tokens() const { return tokens_; }
  [[nodiscard]] bool can_login() const;

private:
  ClientConfig config_;
  std::shared_ptr<IHttpClient> http_;
  std::shared_ptr<TokenLifecycle> tokens_;
  std::shared_ptr<core::ILogger> logger_;

  mutable std::mutex login_mutex_; // one login exchange at a time
  std::optional<LoginCredentials> credentials_;
  TokenIssuedCallback token_issued_cb_;

  core::Result<void, core::JobError>
  login_locked(const std::shared_ptr<core::CancelToken> &cancel_token);
};

} // namespace ermes::infra
