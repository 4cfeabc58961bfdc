#include "infra/api_session.h"

#include "core/logger.h"
#include "infra/api_json.h"

namespace ermes::infra {

namespace {
using VoidResult = core::Result<void, core::JobError>;
}

ApiSession::ApiSession(ClientConfig config, std::shared_ptr<IHttpClient> http,
                       std::shared_ptr<TokenLifecycle> tokens,
                       std::shared_ptr<core::ILogger> logger)
    : config_(std::move(config)), http_(std::move(http)),
      tokens_(std::move(tokens)), logger_(std::move(logger)) {}

void ApiSession::set_login(LoginCredentials credentials) {
  std::lock_guard<std::mutex> lock(login_mutex_);
  credentials_ = std::move(credentials);
}

void ApiSession::on_token_issued(TokenIssuedCallback cb) {
  std::lock_guard<std::mutex> lock(login_mutex_);
  token_issued_cb_ = std::move(cb);
}

bool ApiSession::can_login() const {
  std::lock_guard<std::mutex> lock(login_mutex_);
  return credentials_.has_value();
}

VoidResult ApiSession::login(const std::shared_ptr<core::CancelToken> &cancel_token) {
  std::lock_guard<std::mutex> lock(login_mutex_);
  return login_locked(cancel_token);
}

VoidResult
ApiSession::login_locked(const std::shared_ptr<core::CancelToken> &cancel_token) {
  if (!credentials_) {
    return VoidResult::Err(core::JobError::AuthFailure(
        "authentication failed: no username/password configured"));
  }
  if (!http_ || !tokens_) {
    return VoidResult::Err(core::JobError::Internal("ApiSession is not wired"));
  }

  HttpRequest request;
  request.method = HttpMethod::POST;
  request.url = config_.url(config_.endpoints.login);
  request.form_fields = {{"username", credentials_->username},
                         {"password", credentials_->password}};
  request.trace_id = "session";
  request.request_id = "login";
  request.timeout = config_.polling.request_timeout;

  auto response = http_->execute(request, cancel_token);
  if (response.is_err()) {
    auto err = response.error();
    if (err.category != core::ErrorCategory::Cancelled) {
      err.user_message = "authentication failed: " + err.user_message;
    }
    return VoidResult::Err(std::move(err));
  }

  auto status = check_http_status(response.value());
  if (status.is_err()) {
    if (logger_) {
      logger_->warn("session", "api_session", "login_rejected",
                    status.error().internal_message);
    }
    // check_http_status reads a 401 as an expired token; here it means bad
    // credentials.
    const std::string reason =
        api_json::extract_error_detail(response.value().body)
            .value_or("HTTP " + std::to_string(response.value().status_code));
    return VoidResult::Err(
        core::JobError::AuthFailure("authentication failed: " + reason));
  }

  auto token = api_json::parse_access_token(response.value().body);
  if (token.is_err()) {
    return VoidResult::Err(core::JobError::AuthFailure(
        "authentication failed: " + token.error().user_message));
  }

  const auto issued_at = std::chrono::system_clock::now();
  tokens_->set(token.value(), issued_at);
  if (logger_) {
    logger_->info("session", "api_session", "login_succeeded",
                  "user=" + credentials_->username);
  }
  if (token_issued_cb_) {
    token_issued_cb_(token.value(), issued_at);
  }
  return VoidResult::Ok();
}

VoidResult ApiSession::ensure_authenticated(
    const std::shared_ptr<core::CancelToken> &cancel_token) {
  if (!tokens_) {
    return VoidResult::Err(core::JobError::Internal("ApiSession has no token tracker"));
  }
  if (cancel_token && cancel_token->is_canceled()) {
    return VoidResult::Err(core::JobError::Cancelled());
  }

  std::lock_guard<std::mutex> lock(login_mutex_);
  if (!tokens_->is_expired_locally()) {
    return VoidResult::Ok();
  }
  if (!credentials_) {
    return VoidResult::Err(tokens_->has_token()
                               ? core::JobError::TokenExpired()
                               : core::JobError::AuthFailure(
                                     "authentication failed: not logged in"));
  }
  return login_locked(cancel_token);
}

core::Result<ApiSession::Headers, core::JobError>
ApiSession::authorize(const std::shared_ptr<core::CancelToken> &cancel_token,
                      bool confirm_remotely) {
  using R = core::Result<Headers, core::JobError>;

  auto auth = ensure_authenticated(cancel_token);
  if (auth.is_err()) {
    return R::Err(auth.error());
  }

  if (confirm_remotely && !tokens_->check_and_handle_expiration()) {
    invalidate();
    auto retry = ensure_authenticated(cancel_token);
    if (retry.is_err()) {
      return R::Err(retry.error().category == core::ErrorCategory::AuthFailure &&
                            !can_login()
                        ? core::JobError::TokenExpired()
                        : retry.error());
    }
  }

  auto bearer = tokens_->bearer_header();
  if (!bearer) {
    return R::Err(core::JobError::TokenExpired());
  }
  return R::Ok(Headers{{"Authorization", *bearer}});
}

void ApiSession::invalidate() {
  if (tokens_) {
    tokens_->clear();
  }
  if (logger_) {
    logger_->warn("session", "api_session", "token_invalidated",
                  "credential cleared after rejection");
  }
}

} // namespace ermes::infra
