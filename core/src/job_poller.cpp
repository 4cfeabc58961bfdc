#include "core/job_poller.h"

#include "core/logger.h"

#include <thread>

namespace ermes::core {

namespace {

const char *kComponent = "job_poller";

JobError as_cancelled(const std::string &job_id) {
  return JobError::Cancelled("Monitoring of job " + job_id + " cancelled");
}

/// Returns true when the sleep was cut short by cancellation.
bool sleep_or_cancel(const std::shared_ptr<CancelToken> &cancel_token,
                     std::chrono::milliseconds duration) {
  if (cancel_token) {
    return cancel_token->wait_for(duration);
  }
  std::this_thread::sleep_for(duration);
  return false;
}

} // namespace

JobPoller::JobPoller(PollingPolicy policy, std::shared_ptr<IAuthSession> session,
                     std::shared_ptr<IJobApi> api,
                     std::shared_ptr<ITransferEngine> transfers,
                     std::shared_ptr<IEventSink> events,
                     std::shared_ptr<ILogger> logger)
    : policy_(policy), session_(std::move(session)), api_(std::move(api)),
      transfers_(std::move(transfers)), events_(std::move(events)),
      logger_(std::move(logger)) {}

JobOutcome JobPoller::run(const std::string &job_id,
                          const std::shared_ptr<CancelToken> &cancel_token) {
  state_.store(PollerState::Authenticating, std::memory_order_release);
  JobOutcome outcome;

  auto canceled = [&cancel_token]() {
    return cancel_token && cancel_token->is_canceled();
  };

  status("Worker: Starting to monitor job " + job_id, StatusLevel::Info);
  if (logger_) {
    logger_->info(job_id, kComponent, "monitor_start",
                  "interval_ms=" + std::to_string(policy_.interval.count()) +
                      " error_sleep_ms=" +
                      std::to_string(policy_.error_sleep.count()));
  }

  // ---- Authenticating ----
  if (canceled()) {
    return fail(job_id, std::move(outcome), as_cancelled(job_id));
  }
  if (!session_ || !api_ || !transfers_) {
    return fail(job_id, std::move(outcome),
                JobError::Internal("JobPoller is missing a collaborator"));
  }

  auto auth = session_->ensure_authenticated(cancel_token);
  if (auth.is_err()) {
    if (auth.error().category == ErrorCategory::Cancelled || canceled()) {
      return fail(job_id, std::move(outcome), as_cancelled(job_id));
    }
    JobError err = auth.error();
    err.category = ErrorCategory::AuthFailure;
    err.user_message = "authentication failed: " + auth.error().user_message;
    return fail(job_id, std::move(outcome), std::move(err));
  }
  if (auto moved = advance(job_id, PollerState::Polling); moved.is_err()) {
    return fail(job_id, std::move(outcome), moved.error());
  }

  // ---- Polling ----
  while (true) {
    if (canceled()) {
      return fail(job_id, std::move(outcome), as_cancelled(job_id));
    }

    auto polled = api_->fetch_job(job_id, cancel_token);
    if (polled.is_err()) {
      if (polled.error().category == ErrorCategory::Cancelled || canceled()) {
        return fail(job_id, std::move(outcome), as_cancelled(job_id));
      }
      // Transport and HTTP failures are not retried here.
      JobError err = polled.error();
      err.user_message = "API request error: " + polled.error().user_message;
      return fail(job_id, std::move(outcome), std::move(err));
    }

    const JobHandle job = std::move(polled).value();
    outcome.last_status = job;

    if (job.status == JobStatus::End) {
      if (!job.resource_available) {
        return fail(job_id, std::move(outcome),
                    JobError(ErrorCategory::FatalServer, job.status_code,
                             "Job " + job_id +
                                 " completed but no resource URL provided"));
      }
      break;
    }

    if (job.status == JobStatus::Error) {
      // The pipeline reports "no image yet" as a 404 job error; it clears on
      // its own, so it is a warning on this endpoint only.
      if (job.status_code == 404) {
        ++outcome.soft_errors;
        outcome.last_soft_error = JobError::TransientServer(
            job.status_code, "Job Warning: " + job.result_message);
        status(outcome.last_soft_error->user_message, StatusLevel::Warning);
        if (logger_) {
          logger_->warn(job_id, kComponent, "soft_error",
                        "status_code=404 sleep_ms=" +
                            std::to_string(policy_.error_sleep.count()) +
                            " result=" + job.result_message);
        }
        if (sleep_or_cancel(cancel_token, policy_.error_sleep)) {
          return fail(job_id, std::move(outcome), as_cancelled(job_id));
        }
        continue;
      }
      return fail(job_id, std::move(outcome),
                  JobError::FatalServer(
                      job.status_code, "Job Error: " +
                                           std::to_string(job.status_code) +
                                           " - " + job.result_message));
    }

    if (job.in_progress()) {
      status("Job " + job_id + " status: " + job.status_text + " - " +
                 job.result_message,
             StatusLevel::Info);
      if (sleep_or_cancel(cancel_token, policy_.interval)) {
        return fail(job_id, std::move(outcome), as_cancelled(job_id));
      }
      continue;
    }

    return fail(job_id, std::move(outcome),
                JobError::FatalServer(job.status_code,
                                      "Unknown job status: " + job.status_text));
  }

  // ---- Downloading ----
  if (auto moved = advance(job_id, PollerState::Downloading); moved.is_err()) {
    return fail(job_id, std::move(outcome), moved.error());
  }
  status("Job " + job_id +
             " status: success - Request completed, downloading layer",
         StatusLevel::Info);

  DownloadRequest request;
  request.job_id = job_id;
  request.datatype_id = outcome.last_status->datatype_id;

  auto downloaded = transfers_->download(request, cancel_token, events_);
  if (downloaded.is_err()) {
    if (downloaded.error().category == ErrorCategory::Cancelled) {
      return fail(job_id, std::move(outcome), as_cancelled(job_id));
    }
    return fail(job_id, std::move(outcome), downloaded.error());
  }

  if (auto moved = advance(job_id, PollerState::Done); moved.is_err()) {
    return fail(job_id, std::move(outcome), moved.error());
  }

  outcome.state = PollerState::Done;
  outcome.artifact = std::move(downloaded).value();
  if (events_) {
    events_->transfer_completed(outcome.artifact->local_path,
                                outcome.artifact->datatype_id);
  }
  status("Job " + job_id + " finished: " + outcome.artifact->local_path,
         StatusLevel::Success);
  if (logger_) {
    logger_->info(job_id, kComponent, "monitor_done",
                  "path=" + outcome.artifact->local_path + " bytes=" +
                      std::to_string(outcome.artifact->bytes));
  }
  return finish(std::move(outcome));
}

Result<void, JobError> JobPoller::advance(const std::string &job_id,
                                          PollerState to) {
  const PollerState from = state_.load(std::memory_order_acquire);
  auto legal = check_transition(from, to);
  if (legal.is_err()) {
    return legal;
  }
  state_.store(to, std::memory_order_release);
  if (logger_) {
    logger_->info(job_id, kComponent, "state_changed",
                  std::string(to_string(from)) + " -> " + to_string(to));
  }
  return legal;
}

JobOutcome JobPoller::fail(const std::string &job_id, JobOutcome outcome,
                           JobError error) {
  state_.store(PollerState::Failed, std::memory_order_release);
  outcome.state = PollerState::Failed;

  if (logger_) {
    logger_->error(job_id, kComponent, "monitor_failed",
                   std::string("category=") + to_string(error.category) +
                       " code=" + std::to_string(error.code) + " " +
                       error.internal_message);
  }
  if (events_) {
    events_->job_error(error.user_message);
  }
  outcome.error = std::move(error);
  return finish(std::move(outcome));
}

JobOutcome JobPoller::finish(JobOutcome outcome) {
  if (events_) {
    events_->job_finished();
  }
  return outcome;
}

void JobPoller::status(const std::string &message, StatusLevel level) {
  if (events_) {
    events_->status_update(message, level);
  }
}

} // namespace ermes::core
