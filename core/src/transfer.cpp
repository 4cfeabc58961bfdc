#include "core/transfer.h"

#include <algorithm>

namespace ermes::core {

const char *to_string(TransferDirection direction) {
  switch (direction) {
  case TransferDirection::Upload:
    return "upload";
  case TransferDirection::Download:
    return "download";
  }
  return "unknown";
}

const char *to_string(TransferState state) {
  switch (state) {
  case TransferState::Pending:
    return "Pending";
  case TransferState::InProgress:
    return "InProgress";
  case TransferState::Completed:
    return "Completed";
  case TransferState::Cancelled:
    return "Cancelled";
  case TransferState::Failed:
    return "Failed";
  }
  return "Unknown";
}

bool is_terminal(TransferState state) {
  switch (state) {
  case TransferState::Completed:
  case TransferState::Cancelled:
  case TransferState::Failed:
    return true;
  default:
    return false;
  }
}

Result<void, JobError> TransferDescriptor::transition_to(TransferState new_state) {
  bool legal = false;

  switch (state) {
  case TransferState::Pending:
    legal = (new_state == TransferState::InProgress ||
             new_state == TransferState::Cancelled ||
             new_state == TransferState::Failed);
    break;
  case TransferState::InProgress:
    legal = (new_state == TransferState::Completed ||
             new_state == TransferState::Cancelled ||
             new_state == TransferState::Failed);
    break;
  case TransferState::Completed:
  case TransferState::Cancelled:
  case TransferState::Failed:
    legal = false;
    break;
  }

  if (!legal) {
    return Result<void, JobError>::Err(JobError::Internal(
        std::string("Illegal transfer transition: ") + to_string(state) +
        " -> " + to_string(new_state) + " (" + to_string(direction) + " " +
        remote_url + ")"));
  }

  state = new_state;
  return Result<void, JobError>::Ok();
}

std::optional<int> TransferDescriptor::banded_percent() const noexcept {
  if (!total_bytes.has_value() || *total_bytes == 0) {
    return std::nullopt;
  }
  const auto pct =
      static_cast<int>((transferred_bytes * 100) / *total_bytes);
  return std::clamp(pct, kDownloadProgressFloor, kDownloadProgressCeiling);
}

} // namespace ermes::core
