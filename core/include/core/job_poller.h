#pragma once

#include "core/cancel_token.h"
#include "core/events.h"
#include "core/job.h"
#include "core/job_api.h"
#include "core/job_error.h"
#include "core/transfer.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace ermes::core {

class ILogger;

/// Poll timing. Defaults match the server-side pipeline: one status fetch per
/// second, five seconds of back-off after a soft (404) job error.
struct PollingPolicy {
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds error_sleep{5000};
};

/// Terminal outcome of one poller run.
struct JobOutcome {
  PollerState state = PollerState::Failed;
  std::optional<TransferResult> artifact; // set when state == Done
  std::optional<JobError> error;          // set when state == Failed
  std::optional<JobHandle> last_status;
  int soft_errors = 0; // 404 warnings survived while polling
  std::optional<JobError> last_soft_error;
};

/// JobPoller drives one job through
///   Authenticating -> Polling -> Downloading -> Done
/// with Failed reachable from every non-terminal state.
///
/// run() blocks the calling thread until a terminal state is reached; callers
/// run it inside a TaskGroup task and cancel through the task's CancelToken.
/// Every run emits exactly one terminal event (transfer_completed on success,
/// job_error on failure) followed by exactly one job_finished.
class JobPoller {
public:
  JobPoller(PollingPolicy policy, std::shared_ptr<IAuthSession> session,
            std::shared_ptr<IJobApi> api,
            std::shared_ptr<ITransferEngine> transfers,
            std::shared_ptr<IEventSink> events,
            std::shared_ptr<ILogger> logger = nullptr);

  JobOutcome run(const std::string &job_id,
                 const std::shared_ptr<CancelToken> &cancel_token);

  [[nodiscard]] PollerState state() const noexcept {
    return state_.load(std::memory_order_acquire);
  }

private:
  PollingPolicy policy_;
  std::shared_ptr<IAuthSession> session_;
  std::shared_ptr<IJobApi> api_;
  std::shared_ptr<ITransferEngine> transfers_;
  std::shared_ptr<IEventSink> events_;
  std::shared_ptr<ILogger> logger_;
  std::atomic<PollerState> state_{PollerState::Authenticating};

  Result<void, JobError> advance(const std::string &job_id, PollerState to);
  JobOutcome fail(const std::string &job_id, JobOutcome outcome,
                  JobError error);
  JobOutcome finish(JobOutcome outcome);

  void status(const std::string &message, StatusLevel level);
};

} // namespace ermes::core
