#pragma once

#include "core/cancel_token.h"
#include "core/job_error.h"
#include "core/result.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ermes::core {
class ILogger;
}

namespace ermes::infra {

enum class HttpMethod { GET, POST, PUT, DELETE };

struct HttpResponse;

/// Receives the body in chunks as it arrives. `head` already carries the
/// status code and headers. Returning false aborts the transfer, which then
/// fails with HttpErrorCode::CANCELED.
using BodySink =
    std::function<bool(const HttpResponse &head, const char *data, std::size_t size)>;

/// One multipart/form-data file part, read from disk by the transport.
struct MultipartFile {
  std::string field = "file";
  std::string path;
  std::string filename;
  std::string content_type = "application/octet-stream";
};

struct HttpRequest {
  HttpMethod method = HttpMethod::GET;
  std::string url;
  std::map<std::string, std::string> headers;
  std::vector<std::pair<std::string, std::string>> query;
  std::vector<std::pair<std::string, std::string>> form_fields; // url-encoded
  std::string body; // ignored when form_fields or file are set
  std::optional<MultipartFile> file;
  std::string trace_id;   // job id, propagated to logs
  std::string request_id; // key for cancel(request_id)
  std::chrono::milliseconds timeout{30000};
  std::size_t buffer_size = 0; // receive buffer hint, 0 = transport default
  BodySink sink;               // streams the body instead of buffering it
};

struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers; // keys lower-cased
  std::string body; // empty when the request had a sink
  std::string request_id;
  std::chrono::milliseconds elapsed_ms{0};

  /// Case-insensitive header lookup.
  std::optional<std::string> header(const std::string &name) const;

  [[nodiscard]] bool ok() const noexcept {
    return status_code >= 200 && status_code < 300;
  }
};

/// Transport failure classification, kept in JobError::details.
enum class HttpErrorCode {
  NETWORK_ERROR = 1001, // DNS, connection refused, reset
  TIMEOUT = 1002,
  CANCELED = 1003,
  SERVER_ERROR = 1004, // 5xx
  CLIENT_ERROR = 1005, // 4xx except 429
  RATE_LIMIT = 1006,   // 429
  PARSE_ERROR = 1007,  // malformed response body
  UNKNOWN = 1999
};

core::JobError make_http_error(HttpErrorCode code,
                               const std::string &user_message,
                               const std::string &internal_message,
                               bool retryable = false);

/// Turns a non-2xx response into a JobError. The message is the JSON
/// `detail` field when present, else the raw body, else "HTTP <status>".
/// 401 maps to TokenExpired, everything else to FatalServer with the HTTP
/// status as code (retryable for 5xx and 429).
core::Result<void, core::JobError> check_http_status(const HttpResponse &response);

/// HTTP seam. execute() returns Ok for every HTTP status; only transport
/// failures (and cancellation) are errors.
class IHttpClient {
public:
  virtual ~IHttpClient() = default;

  virtual core::Result<HttpResponse, core::JobError>
  get(const HttpRequest &request,
      std::shared_ptr<core::CancelToken> cancel_token = nullptr) {
    HttpRequest req = request;
    req.method = HttpMethod::GET;
    return execute(req, std::move(cancel_token));
  }

  virtual core::Result<HttpResponse, core::JobError>
  post(const HttpRequest &request,
       std::shared_ptr<core::CancelToken> cancel_token = nullptr) {
    HttpRequest req = request;
    req.method = HttpMethod::POST;
    return execute(req, std::move(cancel_token));
  }

  /// Abort an in-flight request by id. Returns false when nothing matched.
  virtual bool cancel(const std::string &request_id) = 0;

  virtual core::Result<HttpResponse, core::JobError>
  execute(const HttpRequest &request,
          std::shared_ptr<core::CancelToken> cancel_token = nullptr) = 0;
};

struct RetryPolicy {
  int max_retries = 3;
  std::chrono::milliseconds initial_backoff{1000};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_backoff{30000};
  std::chrono::milliseconds sleep_slice{50}; // backoff granularity without a token

  bool should_retry(HttpErrorCode code) const {
    return code == HttpErrorCode::NETWORK_ERROR ||
           code == HttpErrorCode::TIMEOUT ||
           code == HttpErrorCode::SERVER_ERROR ||
           code == HttpErrorCode::RATE_LIMIT;
  }

  bool should_retry_status(int status_code) const {
    return status_code >= 500 || status_code == 429;
  }
};

/// Decorator retrying transport errors plus 5xx/429 responses with
/// exponential backoff. Streaming requests (with a sink) are never retried
/// on a response since the sink already consumed part of the body.
class RetryableHttpClient : public IHttpClient {
public:
  RetryableHttpClient(std::shared_ptr<IHttpClient> inner,
                      RetryPolicy policy = {},
                      std::shared_ptr<core::ILogger> logger = nullptr);

  core::Result<HttpResponse, core::JobError>
  execute(const HttpRequest &request,
          std::shared_ptr<core::CancelToken> cancel_token = nullptr) override;

  bool cancel(const std::string &request_id) override;

private:
  std::shared_ptr<IHttpClient> inner_;
  RetryPolicy policy_;
  std::shared_ptr<core::ILogger> logger_;

  bool backoff_interrupted(std::chrono::milliseconds backoff,
                           const std::shared_ptr<core::CancelToken> &token) const;
};

} // namespace ermes::infra
