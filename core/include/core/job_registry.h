#pragma once

#include "core/cancel_token.h"
#include "core/job.h"
#include "core/job_api.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ermes::core {

class ILogger;

/// JobRegistry periodically lists every job owned by the authenticated user.
/// List failures are reported and the loop carries on; only cancellation
/// ends it.
class JobRegistry {
public:
  using JobsCallback = std::function<void(const std::vector<JobSummary> &)>;
  using ErrorCallback = std::function<void(const std::string &message)>;
  using FinishedCallback = std::function<void()>;

  JobRegistry(std::shared_ptr<IAuthSession> session,
              std::shared_ptr<IJobApi> api,
              std::chrono::milliseconds refresh_interval =
                  std::chrono::seconds(30),
              std::shared_ptr<ILogger> logger = nullptr);

  void on_jobs_updated(JobsCallback cb);
  void on_error(ErrorCallback cb);
  void on_finished(FinishedCallback cb);

  /// Single authenticated fetch of the job list.
  Result<std::vector<JobSummary>, JobError>
  refresh(const std::shared_ptr<CancelToken> &cancel_token);

  /// Fetch, notify, sleep; repeat until cancelled. on_finished fires once.
  void run(const std::shared_ptr<CancelToken> &cancel_token);

private:
  std::shared_ptr<IAuthSession> session_;
  std::shared_ptr<IJobApi> api_;
  std::chrono::milliseconds refresh_interval_;
  std::shared_ptr<ILogger> logger_;

  JobsCallback jobs_cb_;
  ErrorCallback error_cb_;
  FinishedCallback finished_cb_;
};

} // namespace ermes::core
