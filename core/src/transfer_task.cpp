#include "core/transfer_task.h"

#include "core/logger.h"

namespace ermes::core {

TransferTask::TransferTask(std::shared_ptr<ITransferEngine> engine,
                           std::shared_ptr<IJobApi> api,
                           std::shared_ptr<IEventSink> events,
                           std::shared_ptr<ILogger> logger)
    : engine_(std::move(engine)), api_(std::move(api)),
      events_(std::move(events)), logger_(std::move(logger)) {}

Result<TransferResult, JobError>
TransferTask::download_job(const std::string &job_id,
                           const std::shared_ptr<CancelToken> &cancel_token) {
  using R = Result<TransferResult, JobError>;

  if (events_) {
    events_->status_update("Preparing to download job " + job_id + "...",
                           StatusLevel::Info);
    events_->status_update("Fetching job details for " + job_id + "...",
                           StatusLevel::Info);
  }
  if (!engine_ || !api_) {
    return complete(job_id, TransferDirection::Download,
                    R::Err(JobError::Internal(
                        "TransferTask is missing a collaborator")));
  }
  if (cancel_token && cancel_token->is_canceled()) {
    return complete(job_id, TransferDirection::Download,
                    R::Err(JobError::Cancelled()));
  }

  DownloadRequest request;
  request.job_id = job_id;

  auto detail = api_->fetch_job(job_id, cancel_token);
  if (detail.is_err()) {
    return complete(job_id, TransferDirection::Download,
                    R::Err(detail.error()));
  }
  request.datatype_id = detail.value().datatype_id;

  return complete(job_id, TransferDirection::Download,
                  engine_->download(request, cancel_token, events_));
}

Result<TransferResult, JobError>
TransferTask::upload_file(const UploadRequest &request,
                          const std::shared_ptr<CancelToken> &cancel_token) {
  using R = Result<TransferResult, JobError>;

  const std::string trace_id =
      request.trace_id.empty() ? request.file_path : request.trace_id;
  if (!engine_) {
    return complete(trace_id, TransferDirection::Upload,
                    R::Err(JobError::Internal(
                        "TransferTask is missing a transfer engine")));
  }
  return complete(trace_id, TransferDirection::Upload,
                  engine_->upload(request, cancel_token, events_));
}

Result<TransferResult, JobError>
TransferTask::complete(const std::string &trace_id, TransferDirection direction,
                       Result<TransferResult, JobError> result) {
  const bool upload = direction == TransferDirection::Upload;

  if (result.is_ok()) {
    const auto &done = result.value();
    if (events_) {
      events_->transfer_completed(done.local_path, done.datatype_id);
      events_->status_update(upload ? "Inference completed successfully!"
                                    : "Download completed for job " +
                                          trace_id + "!",
                             StatusLevel::Success);
    }
    if (logger_) {
      logger_->info(trace_id, "transfer_task", "transfer_completed",
                    std::string(to_string(direction)) +
                        " path=" + done.local_path);
    }
    return result;
  }

  const JobError &err = result.error();
  std::string message = err.user_message;
  if (err.category == ErrorCategory::Cancelled) {
    message = upload ? "Inference cancelled" : "Download cancelled";
  }

  if (logger_) {
    logger_->error(trace_id, "transfer_task", "transfer_failed",
                   std::string(to_string(direction)) + " category=" +
                       to_string(err.category) + " " + err.internal_message);
  }
  if (events_) {
    events_->transfer_failed(message);
    events_->status_update(message, StatusLevel::Error);
  }
  return result;
}

} // namespace ermes::core
