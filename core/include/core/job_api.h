#pragma once

#include "core/cancel_token.h"
#include "core/job.h"
#include "core/job_error.h"
#include "core/result.h"

#include <memory>
#include <string>
#include <vector>

namespace ermes::core {

/// Authentication seam used by the poller and the registry.
/// The HTTP implementation (infra::ApiSession) owns the login exchange and the
/// credential tracker.
class IAuthSession {
public:
  virtual ~IAuthSession() = default;

  /// Ensure a usable bearer credential exists, running the login exchange
  /// when the credential is absent or locally expired.
  virtual Result<void, JobError>
  ensure_authenticated(const std::shared_ptr<CancelToken> &cancel_token) = 0;
};

/// Job endpoints the client consumes. Implementations re-authenticate
/// transparently before every call.
class IJobApi {
public:
  virtual ~IJobApi() = default;

  /// GET jobs_detail(job_id). Transport failures and non-2xx statuses come
  /// back as Err; job-level errors come back as a JobHandle with
  /// status == Error.
  virtual Result<JobHandle, JobError>
  fetch_job(const std::string &job_id,
            const std::shared_ptr<CancelToken> &cancel_token) = 0;

  /// GET jobs_list.
  virtual Result<std::vector<JobSummary>, JobError>
  list_jobs(const std::shared_ptr<CancelToken> &cancel_token) = 0;
};

} // namespace ermes::core
