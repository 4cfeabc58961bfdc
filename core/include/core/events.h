#pragma once

#include <optional>
#include <string>

namespace ermes::core {

enum class StatusLevel { Info, Success, Warning, Error };

inline const char *to_string(StatusLevel level) {
  switch (level) {
  case StatusLevel::Info:
    return "info";
  case StatusLevel::Success:
    return "success";
  case StatusLevel::Warning:
    return "warning";
  case StatusLevel::Error:
    return "error";
  }
  return "info";
}

/// Progress report: a percentage in [0, 100], or indeterminate when the
/// total size is unknown.
struct Progress {
  std::optional<int> percent;

  static Progress of(int pct) { return Progress{pct}; }
  static Progress indeterminate() { return Progress{std::nullopt}; }

  [[nodiscard]] bool is_indeterminate() const noexcept {
    return !percent.has_value();
  }
};

/// Outbound event channel from the poller / transfer units to whoever drives
/// the UI. Implementations must not block: events are fired from worker
/// threads in the middle of a job.
///
/// Per job or transfer lifecycle exactly one terminal event is emitted:
/// transfer_completed or transfer_failed for a standalone transfer,
/// transfer_completed or job_error for a polled job, always followed by
/// job_finished for the latter.
class IEventSink {
public:
  virtual ~IEventSink() = default;

  virtual void status_update(const std::string &message,
                             StatusLevel level) = 0;

  virtual void progress(const Progress &progress) = 0;

  virtual void transfer_completed(const std::string &local_path,
                                  const std::optional<std::string> &datatype_id) = 0;

  virtual void transfer_failed(const std::string &message) = 0;

  virtual void job_error(const std::string &message) = 0;

  virtual void job_finished() = 0;
};

} // namespace ermes::core
