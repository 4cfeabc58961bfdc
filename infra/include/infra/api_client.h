#pragma once

#include "core/job_api.h"
#include "infra/api_session.h"
#include "infra/config.h"
#include "infra/http_client.h"

#include <memory>
#include <string>
#include <vector>

namespace ermes::core {
class ILogger;
}

namespace ermes::infra {

/// IJobApi over HTTP + JSON. Every call asks the session for bearer headers
/// first; a 401 clears the credential, logs in again and retries the call
/// once. A second 401 is an AuthFailure.
class HttpJobApi final : public core::IJobApi {
public:
  HttpJobApi(ClientConfig config, std::shared_ptr<IHttpClient> http,
             std::shared_ptr<ApiSession> session,
             std::shared_ptr<core::ILogger> logger = nullptr);

  core::Result<core::JobHandle, core::JobError>
  fetch_job(const std::string &job_id,
            const std::shared_ptr<core::CancelToken> &cancel_token) override;

  core::Result<std::vector<core::JobSummary>, core::JobError>
  list_jobs(const std::shared_ptr<core::CancelToken> &cancel_token) override;

private:
  ClientConfig config_;
  std::shared_ptr<IHttpClient> http_;
  std::shared_ptr<ApiSession> session_;
  std::shared_ptr<core::ILogger> logger_;

  core::Result<HttpResponse, core::JobError>
  authorized_get(const std::string &url, const std::string &trace_id,
                 const std::shared_ptr<core::CancelToken> &cancel_token);
};

} // namespace ermes::infra
