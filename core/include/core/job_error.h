#pragma once

#include <map>
#include <string>

namespace ermes::core {

/// Error categories shared by the poller, the transfer engine and the
/// credential tracker. Callers branch on the category, never on message text.
enum class ErrorCategory {
  AuthFailure,     // Bad credentials or a 401 that survives re-login
  TokenExpired,    // Credential expired (local age or remote 401)
  TransientServer, // Soft job-status error, retried by the poller
  FatalServer,     // Non-2xx response carrying a message
  Network,         // Connection failures
  Timeout,         // Deadline exceeded
  TooLarge,        // Upload exceeds the size ceiling
  Cancelled,       // Cooperative cancellation
  Internal         // Invariant violation / local I/O failure
};

/// Structured error returned through Result<T, JobError>.
struct JobError {
  ErrorCategory category = ErrorCategory::Internal;
  int code = 0; // HTTP status for server errors, HttpErrorCode otherwise
  bool retryable = false;
  std::string user_message;     // Shown in the status channel
  std::string internal_message; // Logged only
  std::map<std::string, std::string> details;

  JobError() = default;

  JobError(ErrorCategory cat, int c, std::string msg)
      : category(cat), code(c), user_message(msg),
        internal_message(std::move(msg)) {}

  JobError(ErrorCategory cat, int c, bool retry, std::string user_msg,
           std::string internal_msg,
           std::map<std::string, std::string> dets = {})
      : category(cat), code(c), retryable(retry),
        user_message(std::move(user_msg)),
        internal_message(std::move(internal_msg)), details(std::move(dets)) {}

  static JobError Cancelled(std::string msg = "Operation cancelled") {
    return {ErrorCategory::Cancelled, 1, std::move(msg)};
  }
  static JobError Timeout(std::string msg = "Deadline exceeded") {
    return {ErrorCategory::Timeout, 2, std::move(msg)};
  }
  static JobError Internal(std::string msg) {
    return {ErrorCategory::Internal, 4, std::move(msg)};
  }
  static JobError AuthFailure(std::string msg = "authentication failed") {
    return {ErrorCategory::AuthFailure, 401, std::move(msg)};
  }
  static JobError TokenExpired(
      std::string msg = "Authentication token has expired. Please login again.") {
    return {ErrorCategory::TokenExpired, 401, std::move(msg)};
  }
  static JobError TooLarge(std::string msg) {
    return {ErrorCategory::TooLarge, 413, std::move(msg)};
  }
  static JobError FatalServer(int http_status, std::string msg) {
    return {ErrorCategory::FatalServer, http_status, std::move(msg)};
  }
  static JobError TransientServer(int http_status, std::string msg) {
    JobError err{ErrorCategory::TransientServer, http_status, std::move(msg)};
    err.retryable = true;
    return err;
  }
};

inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::AuthFailure:
    return "AuthFailure";
  case ErrorCategory::TokenExpired:
    return "TokenExpired";
  case ErrorCategory::TransientServer:
    return "TransientServer";
  case ErrorCategory::FatalServer:
    return "FatalServer";
  case ErrorCategory::Network:
    return "Network";
  case ErrorCategory::Timeout:
    return "Timeout";
  case ErrorCategory::TooLarge:
    return "TooLarge";
  case ErrorCategory::Cancelled:
    return "Cancelled";
  case ErrorCategory::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace ermes::core
