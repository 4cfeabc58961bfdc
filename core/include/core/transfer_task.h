#pragma once

#include "core/cancel_token.h"
#include "core/events.h"
#include "core/job_api.h"
#include "core/transfer.h"

#include <memory>
#include <string>

namespace ermes::core {

class ILogger;

/// Standalone transfer unit: "submit this file" or "download job X now",
/// outside of a poller. Owns the lifecycle events of exactly one transfer:
/// transfer_completed or transfer_failed, then a final status_update.
class TransferTask {
public:
  TransferTask(std::shared_ptr<ITransferEngine> engine,
               std::shared_ptr<IJobApi> api,
               std::shared_ptr<IEventSink> events,
               std::shared_ptr<ILogger> logger = nullptr);

  /// Fetch the job detail (for its datatype id) then download its artifact.
  Result<TransferResult, JobError>
  download_job(const std::string &job_id,
               const std::shared_ptr<CancelToken> &cancel_token);

  /// Upload a file to the create-from-file endpoint and keep the returned
  /// image.
  Result<TransferResult, JobError>
  upload_file(const UploadRequest &request,
              const std::shared_ptr<CancelToken> &cancel_token);

private:
  std::shared_ptr<ITransferEngine> engine_;
  std::shared_ptr<IJobApi> api_;
  std::shared_ptr<IEventSink> events_;
  std::shared_ptr<ILogger> logger_;

  Result<TransferResult, JobError>
  complete(const std::string &trace_id, TransferDirection direction,
           Result<TransferResult, JobError> result);
};

} // namespace ermes::core
