#include "infra/http_client.h"

#include "core/logger.h"
#include "infra/api_json.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <thread>

namespace ermes::infra {

namespace {

using Result = core::Result<HttpResponse, core::JobError>;

HttpErrorCode parse_http_error_code(const core::JobError &error) {
  const auto it = error.details.find("http_error_code");
  if (it == error.details.end()) {
    return HttpErrorCode::UNKNOWN;
  }

  int parsed = 0;
  const std::string &value = it->second;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return HttpErrorCode::UNKNOWN;
  }
  return static_cast<HttpErrorCode>(parsed);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Bodies can be whole HTML error pages; keep messages readable.
constexpr std::size_t kMaxRawMessage = 512;

} // namespace

std::optional<std::string> HttpResponse::header(const std::string &name) const {
  const auto it = headers.find(to_lower(name));
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

core::JobError make_http_error(HttpErrorCode code,
                               const std::string &user_message,
                               const std::string &internal_message,
                               bool retryable) {
  core::ErrorCategory category = core::ErrorCategory::Network;
  switch (code) {
  case HttpErrorCode::NETWORK_ERROR:
  case HttpErrorCode::UNKNOWN:
    category = core::ErrorCategory::Network;
    break;
  case HttpErrorCode::TIMEOUT:
    category = core::ErrorCategory::Timeout;
    break;
  case HttpErrorCode::CANCELED:
    category = core::ErrorCategory::Cancelled;
    break;
  case HttpErrorCode::SERVER_ERROR:
  case HttpErrorCode::RATE_LIMIT:
  case HttpErrorCode::CLIENT_ERROR:
    category = core::ErrorCategory::FatalServer;
    break;
  case HttpErrorCode::PARSE_ERROR:
    category = core::ErrorCategory::Internal;
    break;
  }

  std::map<std::string, std::string> details = {
      {"http_error_code", std::to_string(static_cast<int>(code))}};

  return core::JobError(category, static_cast<int>(code), retryable,
                        user_message, internal_message, details);
}

core::Result<void, core::JobError> check_http_status(const HttpResponse &response) {
  if (response.ok()) {
    return core::Result<void, core::JobError>::Ok();
  }

  const int status = response.status_code;
  std::string message;
  if (auto detail = api_json::extract_error_detail(response.body)) {
    message = *detail;
  } else if (!response.body.empty()) {
    message = response.body.substr(0, kMaxRawMessage);
  } else {
    message = "HTTP " + std::to_string(status);
  }

  HttpErrorCode code = HttpErrorCode::CLIENT_ERROR;
  if (status >= 500) {
    code = HttpErrorCode::SERVER_ERROR;
  } else if (status == 429) {
    code = HttpErrorCode::RATE_LIMIT;
  }

  std::map<std::string, std::string> details = {
      {"http_error_code", std::to_string(static_cast<int>(code))},
      {"http_status", std::to_string(status)}};
  if (!response.request_id.empty()) {
    details["request_id"] = response.request_id;
  }

  if (status == 401) {
    core::JobError expired = core::JobError::TokenExpired();
    expired.internal_message = "HTTP 401: " + message;
    expired.details = std::move(details);
    return core::Result<void, core::JobError>::Err(std::move(expired));
  }

  const bool retryable = status >= 500 || status == 429;
  return core::Result<void, core::JobError>::Err(
      core::JobError(core::ErrorCategory::FatalServer, status, retryable, message,
                     "HTTP " + std::to_string(status) + ": " + message,
                     std::move(details)));
}

RetryableHttpClient::RetryableHttpClient(std::shared_ptr<IHttpClient> inner,
                                         RetryPolicy policy,
                                         std::shared_ptr<core::ILogger> logger)
    : inner_(std::move(inner)), policy_(std::move(policy)),
      logger_(std::move(logger)) {}

bool RetryableHttpClient::backoff_interrupted(
    std::chrono::milliseconds backoff,
    const std::shared_ptr<core::CancelToken> &token) const {
  if (token) {
    return token->wait_for(backoff);
  }
  const auto sleep_until = std::chrono::steady_clock::now() + backoff;
  while (std::chrono::steady_clock::now() < sleep_until) {
    std::this_thread::sleep_for(policy_.sleep_slice);
  }
  return false;
}

Result RetryableHttpClient::execute(const HttpRequest &request,
                                    std::shared_ptr<core::CancelToken> cancel_token) {
  int retry_count = 0;
  auto backoff = policy_.initial_backoff;

  auto canceled = [&](const std::string &where) {
    auto err = make_http_error(HttpErrorCode::CANCELED, "Request canceled.",
                               "Cancellation requested " + where, false);
    err.details["retry_count"] = std::to_string(retry_count);
    err.details["request_id"] = request.request_id;
    return Result::Err(std::move(err));
  };

  while (true) {
    if (cancel_token && cancel_token->is_canceled()) {
      return canceled("before HTTP call");
    }

    if (!inner_) {
      auto err = make_http_error(HttpErrorCode::UNKNOWN, "Request failed.",
                                 "RetryableHttpClient has null inner client",
                                 false);
      err.details["request_id"] = request.request_id;
      return Result::Err(err);
    }

    auto result = inner_->execute(request, cancel_token);
    const bool has_attempts_left = retry_count < policy_.max_retries;
    std::string reason;

    if (result.is_ok()) {
      const int status = result.value().status_code;
      if (request.sink || !policy_.should_retry_status(status) ||
          !has_attempts_left) {
        return result;
      }
      reason = "status=" + std::to_string(status);
    } else {
      auto error = result.error();
      const bool should_retry = policy_.should_retry(parse_http_error_code(error));

      error.details["retry_count"] = std::to_string(retry_count);
      if (!request.request_id.empty()) {
        error.details["request_id"] = request.request_id;
      }
      if (!should_retry || !has_attempts_left) {
        return Result::Err(std::move(error));
      }
      reason = error.internal_message;
    }

    if (logger_) {
      logger_->warn(request.trace_id, "http_client", "retry_scheduled",
                    "request_id=" + request.request_id +
                        " retry_count=" + std::to_string(retry_count + 1) +
                        " max_retries=" + std::to_string(policy_.max_retries) +
                        " backoff_ms=" + std::to_string(backoff.count()) +
                        " reason=" + reason);
    }

    if (backoff_interrupted(backoff, cancel_token)) {
      return canceled("during retry backoff");
    }

    auto next_backoff = std::chrono::duration_cast<std::chrono::milliseconds>(
        backoff * policy_.backoff_multiplier);
    backoff = std::min(next_backoff, policy_.max_backoff);
    retry_count++;
  }
}

bool RetryableHttpClient::cancel(const std::string &request_id) {
  return inner_ ? inner_->cancel(request_id) : false;
}

} // namespace ermes::infra
