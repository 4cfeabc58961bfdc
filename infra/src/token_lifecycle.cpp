#include "infra/token_lifecycle.h"

#include "core/logger.h"

#include <algorithm>

namespace ermes::infra {

TokenLifecycle::TokenLifecycle(TokenSettings settings, std::string validation_url,
                               std::shared_ptr<IHttpClient> http,
                               std::shared_ptr<core::ILogger> logger, Clock clock)
    : settings_(settings), validation_url_(std::move(validation_url)),
      http_(std::move(http)), logger_(std::move(logger)),
      clock_(std::move(clock)) {}

std::chrono::system_clock::time_point TokenLifecycle::now() const {
  return clock_ ? clock_() : std::chrono::system_clock::now();
}

void TokenLifecycle::set(
    const std::string &token,
    std::optional<std::chrono::system_clock::time_point> issued_at,
    std::optional<std::chrono::minutes> lifetime) {
  auto credential = std::make_shared<Credential>();
  credential->token = token;
  credential->issued_at = issued_at.value_or(now());
  credential->lifetime = lifetime.value_or(settings_.lifetime);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    credential_ = std::move(credential);
  }
  if (logger_) {
    logger_->info("session", "token_lifecycle", "token_set",
                  "lifetime_min=" +
                      std::to_string(lifetime.value_or(settings_.lifetime).count()));
  }
}

void TokenLifecycle::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  credential_.reset();
}

bool TokenLifecycle::has_token() const { return snapshot() != nullptr; }

std::shared_ptr<const Credential> TokenLifecycle::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return credential_;
}

bool TokenLifecycle::expired(const Credential &credential) const {
  const auto age = now() - credential.issued_at;
  return age >= credential.lifetime - settings_.expiration_buffer;
}

bool TokenLifecycle::is_expired_locally() const {
  const auto credential = snapshot();
  return !credential || expired(*credential);
}

std::chrono::seconds TokenLifecycle::time_until_expiry() const {
  const auto credential = snapshot();
  if (!credential) {
    return std::chrono::seconds(0);
  }
  const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
      credential->lifetime - (now() - credential->issued_at));
  return std::max(remaining, std::chrono::seconds(0));
}

bool TokenLifecycle::validate_remotely(std::optional<std::chrono::seconds> timeout) {
  const auto credential = snapshot();
  if (!credential) {
    return false;
  }
  if (!http_) {
    return true;
  }

  HttpRequest request;
  request.method = HttpMethod::GET;
  request.url = validation_url_;
  request.headers["Authorization"] = "Bearer " + credential->token;
  request.trace_id = "session";
  request.timeout = timeout.value_or(settings_.validation_timeout);

  auto result = http_->execute(request);
  if (result.is_err()) {
    if (logger_) {
      logger_->warn("session", "token_lifecycle", "validation_fail_open",
                    "transport error, assuming token is valid: " +
                        result.error().internal_message);
    }
    return true;
  }

  const int status = result.value().status_code;
  if (status == 401) {
    return false;
  }
  if (status != 200 && logger_) {
    logger_->warn("session", "token_lifecycle", "validation_fail_open",
                  "status=" + std::to_string(status) +
                      ", assuming token is valid");
  }
  return true;
}

bool TokenLifecycle::check_and_handle_expiration() {
  if (is_expired_locally()) {
    notify_expired("expired locally");
    return false;
  }
  if (!validate_remotely()) {
    notify_expired("rejected by the API");
    return false;
  }
  return true;
}

void TokenLifecycle::on_expired(ExpiredCallback cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  expired_callbacks_.push_back(std::move(cb));
}

void TokenLifecycle::notify_expired(const std::string &reason) {
  std::vector<ExpiredCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks = expired_callbacks_;
  }
  if (logger_) {
    logger_->warn("session", "token_lifecycle", "token_expired", reason);
  }
  for (const auto &cb : callbacks) {
    if (cb) {
      cb();
    }
  }
}

std::optional<std::string> TokenLifecycle::bearer_header() const {
  const auto credential = snapshot();
  if (!credential) {
    return std::nullopt;
  }
  return "Bearer " + credential->token;
}

} // namespace ermes::infra
