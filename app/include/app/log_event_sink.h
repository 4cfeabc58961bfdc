#pragma once

#include "core/events.h"
#include "core/logger.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ermes::app {

/// IEventSink for the command line: every event becomes a log line under the
/// job's trace id, and the terminal outcome is kept for the exit code.
class LogEventSink : public core::IEventSink {
public:
  LogEventSink(std::string trace_id, std::shared_ptr<core::ILogger> logger);

  void status_update(const std::string &message, core::StatusLevel level) override;
  void progress(const core::Progress &progress) override;
  void transfer_completed(const std::string &local_path,
                          const std::optional<std::string> &datatype_id) override;
  void transfer_failed(const std::string &message) override;
  void job_error(const std::string &message) override;
  void job_finished() override;

  [[nodiscard]] std::optional<std::string> artifact() const;
  [[nodiscard]] std::optional<std::string> failure() const;

private:
  std::string trace_id_;
  std::shared_ptr<core::ILogger> logger_;

  mutable std::mutex mutex_;
  std::optional<int> last_percent_;
  bool reported_indeterminate_ = false;
  std::optional<std::string> artifact_;
  std::optional<std::string> failure_;
};

} // namespace ermes::app
