#pragma once

#include "core/cancel_token.h"
#include "core/events.h"
#include "core/job_error.h"
#include "core/result.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ermes::core {

enum class TransferDirection { Upload, Download };

enum class TransferState {
  Pending,
  InProgress,
  Completed, // terminal
  Cancelled, // terminal
  Failed     // terminal
};

const char *to_string(TransferDirection direction);
const char *to_string(TransferState state);
bool is_terminal(TransferState state);

/// Download percentages are kept inside this band; the tails are reserved
/// for setup and teardown.
inline constexpr int kDownloadProgressFloor = 20;
inline constexpr int kDownloadProgressCeiling = 95;

/// State of one file moving across the wire. Written only by the engine call
/// that owns it.
struct TransferDescriptor {
  std::string local_path;
  std::string remote_url;
  TransferDirection direction = TransferDirection::Download;
  std::optional<std::uint64_t> total_bytes;
  std::uint64_t transferred_bytes = 0;
  TransferState state = TransferState::Pending;

  /// Legal transitions:
  ///   Pending    -> InProgress, Cancelled, Failed
  ///   InProgress -> Completed, Cancelled, Failed
  Result<void, JobError> transition_to(TransferState new_state);

  void add_bytes(std::uint64_t n) noexcept { transferred_bytes += n; }

  /// Percentage clamped to [kDownloadProgressFloor, kDownloadProgressCeiling],
  /// or nullopt when the total is unknown.
  [[nodiscard]] std::optional<int> banded_percent() const noexcept;
};

struct UploadRequest {
  std::string file_path;
  std::string datatype_id;
  std::string image_type;
  std::string trace_id;
};

struct DownloadRequest {
  std::string job_id;
  std::optional<std::string> datatype_id;
};

/// Successful transfer. The caller owns local_path from here on.
struct TransferResult {
  std::string local_path;
  std::optional<std::string> datatype_id;
  std::uint64_t bytes = 0;
};

/// Moves exactly one file in one direction. Implementations report status and
/// progress through `events` (may be null) and return the terminal outcome;
/// terminal events are emitted by the caller that owns the lifecycle.
class ITransferEngine {
public:
  virtual ~ITransferEngine() = default;

  virtual Result<TransferResult, JobError>
  download(const DownloadRequest &request,
           const std::shared_ptr<CancelToken> &cancel_token,
           const std::shared_ptr<IEventSink> &events) = 0;

  virtual Result<TransferResult, JobError>
  upload(const UploadRequest &request,
         const std::shared_ptr<CancelToken> &cancel_token,
         const std::shared_ptr<IEventSink> &events) = 0;
};

} // namespace ermes::core
