#pragma once

#include "core/job_error.h"
#include "core/result.h"

#include <optional>
#include <string>

namespace ermes::core {

// ---- Remote job status ----

/// Status values reported by the job detail endpoint.
enum class JobStatus {
  Pending,
  Start,
  Update,
  End,
  Error,
  Unknown // Anything else the server sends
};

/// Map the server's status string ("pending", "start", ...) to JobStatus.
JobStatus parse_job_status(const std::string &text);

const char *to_string(JobStatus status);

/// One parsed poll response. Replaced wholesale on every successful poll.
struct JobHandle {
  std::string id;
  JobStatus status = JobStatus::Unknown;
  std::string status_text; // Raw status string, kept for "unknown status"
  int status_code = 0;
  std::string result_message;
  bool resource_available = false;
  std::optional<std::string> datatype_id;

  /// pending / start / update
  [[nodiscard]] bool in_progress() const noexcept;
};

/// Row of the job list shown by the registry.
struct JobSummary {
  std::string id;
  std::string status;
  std::string result_message;
  std::optional<std::string> datatype_id;
  std::string raw_json;
};

// ---- Poller state machine ----

enum class PollerState {
  Authenticating, // Initial state
  Polling,
  Downloading,
  Done,  // terminal
  Failed // terminal
};

const char *to_string(PollerState state);

bool is_terminal(PollerState state);

/// Validate a poller transition.
/// Legal transitions:
///   Authenticating -> Polling, Failed
///   Polling        -> Downloading, Failed
///   Downloading    -> Done, Failed
Result<void, JobError> check_transition(PollerState from, PollerState to);

} // namespace ermes::core
