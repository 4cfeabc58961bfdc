#include "infra/curl_http_client.h"

#include "core/logger.h"

#include <curl/curl.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace ermes::infra {

namespace {

struct CurlGlobalInit {
  CurlGlobalInit() { curl_global_init(CURL_GLOBAL_ALL); }
  ~CurlGlobalInit() { curl_global_cleanup(); }
};
static CurlGlobalInit g_curl_init;

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
using MimeHandle = std::unique_ptr<curl_mime, decltype(&curl_mime_free)>;

constexpr std::chrono::milliseconds kMaxConnectTimeout{30000};

std::string trim(const std::string &s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string escape(CURL *curl, const std::string &value) {
  char *out = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
  if (!out) {
    return value;
  }
  std::string escaped(out);
  curl_free(out);
  return escaped;
}

std::string encode_pairs(CURL *curl,
                         const std::vector<std::pair<std::string, std::string>> &pairs) {
  std::string encoded;
  for (const auto &[key, value] : pairs) {
    if (!encoded.empty()) {
      encoded += '&';
    }
    encoded += escape(curl, key) + "=" + escape(curl, value);
  }
  return encoded;
}

HttpErrorCode classify_curl_error(CURLcode curl_code) {
  switch (curl_code) {
  case CURLE_COULDNT_RESOLVE_HOST:
  case CURLE_COULDNT_RESOLVE_PROXY:
  case CURLE_COULDNT_CONNECT:
  case CURLE_SEND_ERROR:
  case CURLE_RECV_ERROR:
  case CURLE_GOT_NOTHING:
  case CURLE_PARTIAL_FILE:
  case CURLE_SSL_CONNECT_ERROR:
    return HttpErrorCode::NETWORK_ERROR;

  case CURLE_OPERATION_TIMEDOUT:
    return HttpErrorCode::TIMEOUT;

  case CURLE_ABORTED_BY_CALLBACK:
    return HttpErrorCode::CANCELED;

  default:
    return HttpErrorCode::UNKNOWN;
  }
}

} // namespace

struct CurlHttpClient::RequestContext {
  CURL *curl = nullptr;
  const HttpRequest *request = nullptr;
  std::shared_ptr<core::CancelToken> cancel_token;
  std::atomic<bool> aborted{false};
  bool sink_refused = false;
  HttpResponse response;

  bool should_stop() const {
    return aborted.load() || (cancel_token && cancel_token->is_canceled());
  }
};

namespace {

using Context = CurlHttpClient::RequestContext;

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  auto *ctx = static_cast<Context *>(userdata);
  const size_t total = size * nitems;
  const std::string line(buffer, total);

  // A status line starts a new header block (redirects, 100-continue).
  if (line.rfind("HTTP/", 0) == 0) {
    ctx->response.headers.clear();
    const auto space = line.find(' ');
    if (space != std::string::npos) {
      try {
        ctx->response.status_code = std::stoi(line.substr(space + 1, 3));
      } catch (const std::exception &) {
        ctx->response.status_code = 0;
      }
    }
    return total;
  }

  const auto colon = line.find(':');
  if (colon != std::string::npos) {
    ctx->response.headers[to_lower(trim(line.substr(0, colon)))] =
        trim(line.substr(colon + 1));
  }
  return total;
}

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *ctx = static_cast<Context *>(userdata);
  const size_t total = size * nmemb;
  if (ctx->should_stop()) {
    return 0;
  }

  if (!ctx->request->sink) {
    ctx->response.body.append(ptr, total);
    return total;
  }

  long http_code = 0;
  curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code > 0) {
    ctx->response.status_code = static_cast<int>(http_code);
  }
  if (!ctx->request->sink(ctx->response, ptr, total)) {
    ctx->sink_refused = true;
    return 0;
  }
  return total;
}

int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                      curl_off_t) {
  auto *ctx = static_cast<Context *>(clientp);
  return ctx->should_stop() ? 1 : 0;
}

} // namespace

CurlHttpClient::CurlHttpClient(std::shared_ptr<core::ILogger> logger)
    : logger_(std::move(logger)) {}

CurlHttpClient::~CurlHttpClient() = default;

void CurlHttpClient::register_request(const std::string &request_id,
                                      RequestContext *ctx) {
  if (request_id.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  in_flight_requests_[request_id] = ctx;
}

void CurlHttpClient::unregister_request(const std::string &request_id) {
  if (request_id.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  in_flight_requests_.erase(request_id);
}

bool CurlHttpClient::cancel(const std::string &request_id) {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  auto it = in_flight_requests_.find(request_id);
  if (it == in_flight_requests_.end()) {
    return false;
  }
  it->second->aborted.store(true);
  return true;
}

core::Result<HttpResponse, core::JobError>
CurlHttpClient::execute(const HttpRequest &request,
                        std::shared_ptr<core::CancelToken> cancel_token) {
  using Result = core::Result<HttpResponse, core::JobError>;

  if (cancel_token && cancel_token->is_canceled()) {
    return Result::Err(make_http_error(HttpErrorCode::CANCELED,
                                       "Request was canceled.",
                                       "Cancelled before the request started"));
  }

  EasyHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    return Result::Err(make_http_error(HttpErrorCode::UNKNOWN, "Request failed.",
                                       "curl_easy_init returned null"));
  }

  RequestContext ctx;
  ctx.curl = curl.get();
  ctx.request = &request;
  ctx.cancel_token = cancel_token;

  std::string url = request.url;
  if (!request.query.empty()) {
    url += (url.find('?') == std::string::npos ? "?" : "&") +
           encode_pairs(curl.get(), request.query);
  }
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);

  if (request.timeout.count() > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                     static_cast<long>(request.timeout.count()));
  }
  const auto connect_timeout =
      request.timeout.count() > 0 ? std::min(request.timeout, kMaxConnectTimeout)
                                  : kMaxConnectTimeout;
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(connect_timeout.count()));
  if (request.buffer_size > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE,
                     static_cast<long>(request.buffer_size));
  }

  // Body: multipart file, url-encoded form, or raw.
  MimeHandle mime(nullptr, &curl_mime_free);
  std::string form_body;
  if (request.file) {
    mime.reset(curl_mime_init(curl.get()));
    for (const auto &[key, value] : request.form_fields) {
      curl_mimepart *field = curl_mime_addpart(mime.get());
      curl_mime_name(field, key.c_str());
      curl_mime_data(field, value.c_str(), CURL_ZERO_TERMINATED);
    }
    curl_mimepart *part = curl_mime_addpart(mime.get());
    curl_mime_name(part, request.file->field.c_str());
    if (curl_mime_filedata(part, request.file->path.c_str()) != CURLE_OK) {
      return Result::Err(make_http_error(
          HttpErrorCode::UNKNOWN, "Could not read the file to upload.",
          "curl_mime_filedata failed for " + request.file->path));
    }
    if (!request.file->filename.empty()) {
      curl_mime_filename(part, request.file->filename.c_str());
    }
    curl_mime_type(part, request.file->content_type.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
  } else if (!request.form_fields.empty()) {
    form_body = encode_pairs(curl.get(), request.form_fields);
  } else {
    form_body = request.body;
  }

  switch (request.method) {
  case HttpMethod::GET:
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    break;
  case HttpMethod::POST:
    if (!mime) {
      curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, form_body.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(form_body.size()));
    }
    break;
  case HttpMethod::PUT:
  case HttpMethod::DELETE:
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST,
                     request.method == HttpMethod::PUT ? "PUT" : "DELETE");
    if (!mime && !form_body.empty()) {
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, form_body.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(form_body.size()));
    }
    break;
  }

  HeaderList headers(nullptr, &curl_slist_free_all);
  for (const auto &[key, value] : request.headers) {
    const std::string line = key + ": " + value;
    headers.reset(curl_slist_append(headers.release(), line.c_str()));
  }
  if (!request.form_fields.empty() && !mime &&
      request.headers.find("Content-Type") == request.headers.end()) {
    headers.reset(curl_slist_append(
        headers.release(), "Content-Type: application/x-www-form-urlencoded"));
  }
  if (headers) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  }

  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &header_callback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &progress_callback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

  char error_buffer[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

  register_request(request.request_id, &ctx);
  const auto start_time = std::chrono::steady_clock::now();
  const CURLcode res = curl_easy_perform(curl.get());
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_time);
  unregister_request(request.request_id);

  if (res != CURLE_OK) {
    HttpErrorCode error_code = classify_curl_error(res);
    if (ctx.should_stop() || ctx.sink_refused) {
      error_code = HttpErrorCode::CANCELED;
    }

    std::string user_message;
    switch (error_code) {
    case HttpErrorCode::NETWORK_ERROR:
      user_message = "Network error occurred. Please check your connection.";
      break;
    case HttpErrorCode::TIMEOUT:
      user_message = "Request timed out. Please try again.";
      break;
    case HttpErrorCode::CANCELED:
      user_message = "Request was canceled.";
      break;
    default:
      user_message = "Request failed.";
      break;
    }

    const std::string detail =
        error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
    const std::string internal_message = "CURL error: " + detail +
                                         " (code: " + std::to_string(res) + ")";
    if (logger_ && error_code != HttpErrorCode::CANCELED) {
      logger_->warn(request.trace_id, "http_client", "transport_error",
                    "url=" + request.url + " " + internal_message);
    }

    auto err = make_http_error(error_code, user_message, internal_message,
                               error_code == HttpErrorCode::NETWORK_ERROR ||
                                   error_code == HttpErrorCode::TIMEOUT);
    err.details["request_id"] = request.request_id;
    return Result::Err(std::move(err));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

  HttpResponse response = std::move(ctx.response);
  response.status_code = static_cast<int>(http_code);
  response.elapsed_ms = elapsed;
  if (auto server_id = response.header("x-request-id")) {
    response.request_id = *server_id;
  } else {
    response.request_id = request.request_id;
  }
  return Result::Ok(std::move(response));
}

} // namespace ermes::infra
