#include "app/log_event_sink.h"

namespace ermes::app {

LogEventSink::LogEventSink(std::string trace_id,
                           std::shared_ptr<core::ILogger> logger)
    : trace_id_(std::move(trace_id)), logger_(std::move(logger)) {}

void LogEventSink::status_update(const std::string &message,
                                 core::StatusLevel level) {
  if (!logger_) {
    return;
  }
  switch (level) {
  case core::StatusLevel::Info:
  case core::StatusLevel::Success:
    logger_->info(trace_id_, "status", core::to_string(level), message);
    break;
  case core::StatusLevel::Warning:
    logger_->warn(trace_id_, "status", core::to_string(level), message);
    break;
  case core::StatusLevel::Error:
    logger_->error(trace_id_, "status", core::to_string(level), message);
    break;
  }
}

void LogEventSink::progress(const core::Progress &progress) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (progress.is_indeterminate()) {
      if (reported_indeterminate_) {
        return;
      }
      reported_indeterminate_ = true;
    } else {
      if (last_percent_ == progress.percent) {
        return;
      }
      last_percent_ = progress.percent;
    }
  }
  if (logger_) {
    logger_->info(trace_id_, "progress", "progress",
                  progress.is_indeterminate()
                      ? std::string("in progress (size unknown)")
                      : std::to_string(*progress.percent) + "%");
  }
}

void LogEventSink::transfer_completed(const std::string &local_path,
                                      const std::optional<std::string> &datatype_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    artifact_ = local_path;
  }
  if (logger_) {
    logger_->info(trace_id_, "transfer", "completed",
                  "path=" + local_path +
                      " datatype_id=" + datatype_id.value_or("-"));
  }
}

void LogEventSink::transfer_failed(const std::string &message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_ = message;
  }
  if (logger_) {
    logger_->error(trace_id_, "transfer", "failed", message);
  }
}

void LogEventSink::job_error(const std::string &message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_ = message;
  }
  if (logger_) {
    logger_->error(trace_id_, "job", "error", message);
  }
}

void LogEventSink::job_finished() {
  if (logger_) {
    logger_->info(trace_id_, "job", "finished", "");
  }
}

std::optional<std::string> LogEventSink::artifact() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return artifact_;
}

std::optional<std::string> LogEventSink::failure() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_;
}

} // namespace ermes::app
