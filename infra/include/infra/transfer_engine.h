#pragma once

#include "core/transfer.h"
#include "infra/api_session.h"
#include "infra/config.h"
#include "infra/http_client.h"

#include <memory>
#include <string>

namespace ermes::core {
class ILogger;
}

namespace ermes::infra {

/// `filename=` value of a Content-Disposition header with surrounding quotes,
/// semicolons and spaces stripped, reduced to its last path component.
/// Returns `fallback` when there is no usable name.
std::string filename_from_content_disposition(const std::string &header,
                                              const std::string &fallback);

/// image/tiff or image/tif, parameters and case ignored.
bool is_tiff_content_type(const std::string &content_type);

/// ITransferEngine over HTTP.
///
/// Download streams the retrieve endpoint into
/// `<tmp>/<temp_dir_prefix><job_id>_XXXXXX/<filename>`; upload posts the file
/// as multipart and keeps a TIFF response in a temporary `.tif`. Partial
/// artifacts are removed on cancellation or failure before returning.
class HttpTransferEngine final : public core::ITransferEngine {
public:
  HttpTransferEngine(ClientConfig config, std::shared_ptr<IHttpClient> http,
                     std::shared_ptr<ApiSession> session,
                     std::shared_ptr<core::ILogger> logger = nullptr);

  core::Result<core::TransferResult, core::JobError>
  download(const core::DownloadRequest &request,
           const std::shared_ptr<core::CancelToken> &cancel_token,
           const std::shared_ptr<core::IEventSink> &events) override;

  core::Result<core::TransferResult, core::JobError>
  upload(const core::UploadRequest &request,
         const std::shared_ptr<core::CancelToken> &cancel_token,
         const std::shared_ptr<core::IEventSink> &events) override;

private:
  ClientConfig config_;
  std::shared_ptr<IHttpClient> http_;
  std::shared_ptr<ApiSession> session_;
  std::shared_ptr<core::ILogger> logger_;

  void settle(core::TransferDescriptor &descriptor, core::TransferState state,
              const std::string &trace_id) const;
};

} // namespace ermes::infra
