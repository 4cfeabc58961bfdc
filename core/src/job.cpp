#include "core/job.h"

namespace ermes::core {

JobStatus parse_job_status(const std::string &text) {
  if (text == "pending")
    return JobStatus::Pending;
  if (text == "start")
    return JobStatus::Start;
  if (text == "update")
    return JobStatus::Update;
  if (text == "end")
    return JobStatus::End;
  if (text == "error")
    return JobStatus::Error;
  return JobStatus::Unknown;
}

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Pending:
    return "pending";
  case JobStatus::Start:
    return "start";
  case JobStatus::Update:
    return "update";
  case JobStatus::End:
    return "end";
  case JobStatus::Error:
    return "error";
  case JobStatus::Unknown:
    return "unknown";
  }
  return "unknown";
}

bool JobHandle::in_progress() const noexcept {
  return status == JobStatus::Pending || status == JobStatus::Start ||
         status == JobStatus::Update;
}

const char *to_string(PollerState state) {
  switch (state) {
  case PollerState::Authenticating:
    return "Authenticating";
  case PollerState::Polling:
    return "Polling";
  case PollerState::Downloading:
    return "Downloading";
  case PollerState::Done:
    return "Done";
  case PollerState::Failed:
    return "Failed";
  }
  return "Unknown";
}

bool is_terminal(PollerState state) {
  return state == PollerState::Done || state == PollerState::Failed;
}

Result<void, JobError> check_transition(PollerState from, PollerState to) {
  bool legal = false;

  switch (from) {
  case PollerState::Authenticating:
    legal = (to == PollerState::Polling || to == PollerState::Failed);
    break;
  case PollerState::Polling:
    legal = (to == PollerState::Downloading || to == PollerState::Failed);
    break;
  case PollerState::Downloading:
    legal = (to == PollerState::Done || to == PollerState::Failed);
    break;
  case PollerState::Done:
  case PollerState::Failed:
    legal = false;
    break;
  }

  if (!legal) {
    return Result<void, JobError>::Err(
        JobError::Internal(std::string("Illegal poller transition: ") +
                           to_string(from) + " -> " + to_string(to)));
  }
  return Result<void, JobError>::Ok();
}

} // namespace ermes::core
