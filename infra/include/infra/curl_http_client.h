#pragma once

#include "infra/http_client.h"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ermes::core {
class ILogger;
}

namespace ermes::infra {

/// libcurl-backed IHttpClient. Every execute() call owns a fresh easy handle,
/// so one instance may be shared by the poller, the transfer engine and the
/// token validator running on different threads.
///
/// Cancellation reaches curl through the transfer-info callback, which polls
/// both the caller's CancelToken and the cancel(request_id) flag.
class CurlHttpClient : public IHttpClient {
public:
  explicit CurlHttpClient(std::shared_ptr<core::ILogger> logger = nullptr);
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  core::Result<HttpResponse, core::JobError>
  execute(const HttpRequest &request,
          std::shared_ptr<core::CancelToken> cancel_token = nullptr) override;

  bool cancel(const std::string &request_id) override;

  struct RequestContext;

private:
  std::shared_ptr<core::ILogger> logger_;
  std::mutex in_flight_mutex_;
  std::unordered_map<std::string, RequestContext *> in_flight_requests_;

  void register_request(const std::string &request_id, RequestContext *ctx);
  void unregister_request(const std::string &request_id);
};

} // namespace ermes::infra
