#include "core/job_registry.h"

#include "core/logger.h"

namespace ermes::core {

JobRegistry::JobRegistry(std::shared_ptr<IAuthSession> session,
                         std::shared_ptr<IJobApi> api,
                         std::chrono::milliseconds refresh_interval,
                         std::shared_ptr<ILogger> logger)
    : session_(std::move(session)), api_(std::move(api)),
      refresh_interval_(refresh_interval), logger_(std::move(logger)) {}

void JobRegistry::on_jobs_updated(JobsCallback cb) { jobs_cb_ = std::move(cb); }

void JobRegistry::on_error(ErrorCallback cb) { error_cb_ = std::move(cb); }

void JobRegistry::on_finished(FinishedCallback cb) {
  finished_cb_ = std::move(cb);
}

Result<std::vector<JobSummary>, JobError>
JobRegistry::refresh(const std::shared_ptr<CancelToken> &cancel_token) {
  using R = Result<std::vector<JobSummary>, JobError>;
  if (!session_ || !api_) {
    return R::Err(JobError::Internal("JobRegistry is missing a collaborator"));
  }
  auto auth = session_->ensure_authenticated(cancel_token);
  if (auth.is_err()) {
    return R::Err(auth.error());
  }
  return api_->list_jobs(cancel_token);
}

void JobRegistry::run(const std::shared_ptr<CancelToken> &cancel_token) {
  auto token = cancel_token ? cancel_token : CancelToken::create();

  while (!token->is_canceled()) {
    auto jobs = refresh(token);
    if (jobs.is_ok()) {
      if (logger_) {
        logger_->info("registry", "job_registry", "jobs_updated",
                      "count=" + std::to_string(jobs.value().size()));
      }
      if (jobs_cb_) {
        jobs_cb_(jobs.value());
      }
    } else if (jobs.error().category != ErrorCategory::Cancelled) {
      if (logger_) {
        logger_->warn("registry", "job_registry", "list_failed",
                      jobs.error().internal_message);
      }
      if (error_cb_) {
        error_cb_("Failed to fetch jobs: " + jobs.error().user_message);
      }
    }

    if (token->wait_for(refresh_interval_)) {
      break;
    }
  }

  if (finished_cb_) {
    finished_cb_();
  }
}

} // namespace ermes::core
