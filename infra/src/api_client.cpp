#include "infra/api_client.h"

#include "core/logger.h"
#include "infra/api_json.h"

namespace ermes::infra {

HttpJobApi::HttpJobApi(ClientConfig config, std::shared_ptr<IHttpClient> http,
                       std::shared_ptr<ApiSession> session,
                       std::shared_ptr<core::ILogger> logger)
    : config_(std::move(config)), http_(std::move(http)),
      session_(std::move(session)), logger_(std::move(logger)) {}

core::Result<HttpResponse, core::JobError>
HttpJobApi::authorized_get(const std::string &url, const std::string &trace_id,
                           const std::shared_ptr<core::CancelToken> &cancel_token) {
  using R = core::Result<HttpResponse, core::JobError>;

  if (!http_ || !session_) {
    return R::Err(core::JobError::Internal("HttpJobApi is not wired"));
  }

  for (int attempt = 0; attempt < 2; ++attempt) {
    auto headers = session_->authorize(cancel_token);
    if (headers.is_err()) {
      if (attempt > 0 && !session_->can_login()) {
        return R::Err(core::JobError::TokenExpired());
      }
      return R::Err(headers.error());
    }

    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = url;
    request.headers = headers.value();
    request.trace_id = trace_id;
    request.request_id = trace_id + ":" + url;
    request.timeout = config_.polling.request_timeout;

    auto response = http_->execute(request, cancel_token);
    if (response.is_err() || response.value().status_code != 401) {
      return response;
    }

    if (logger_) {
      logger_->warn(trace_id, "job_api", "unauthorized",
                    "url=" + url + " attempt=" + std::to_string(attempt + 1));
    }
    session_->invalidate();
  }

  return R::Err(core::JobError::AuthFailure(
      "authentication failed: token rejected by the API"));
}

core::Result<core::JobHandle, core::JobError>
HttpJobApi::fetch_job(const std::string &job_id,
                      const std::shared_ptr<core::CancelToken> &cancel_token) {
  using R = core::Result<core::JobHandle, core::JobError>;

  auto response = authorized_get(
      config_.url(config_.endpoints.jobs_detail, job_id), job_id, cancel_token);
  if (response.is_err()) {
    return R::Err(response.error());
  }
  auto status = check_http_status(response.value());
  if (status.is_err()) {
    return R::Err(status.error());
  }
  return api_json::parse_job_handle(job_id, response.value().body);
}

core::Result<std::vector<core::JobSummary>, core::JobError>
HttpJobApi::list_jobs(const std::shared_ptr<core::CancelToken> &cancel_token) {
  using R = core::Result<std::vector<core::JobSummary>, core::JobError>;

  auto response = authorized_get(config_.url(config_.endpoints.jobs_list),
                                 "registry", cancel_token);
  if (response.is_err()) {
    return R::Err(response.error());
  }
  auto status = check_http_status(response.value());
  if (status.is_err()) {
    return R::Err(status.error());
  }
  return api_json::parse_job_list(response.value().body);
}

} // namespace ermes::infra
