#include "infra/transfer_engine.h"

#include "core/logger.h"
#include "infra/api_json.h"

#include <stdlib.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <vector>

namespace ermes::infra {

namespace fs = std::filesystem;

namespace {

using core::ErrorCategory;
using core::JobError;
using core::Progress;
using core::StatusLevel;
using TransferOutcome = core::Result<core::TransferResult, JobError>;

constexpr std::size_t kMaxErrorBody = 1024 * 1024;
constexpr std::uint64_t kBytesPerMb = 1024ull * 1024ull;

std::string format_mb(std::uint64_t bytes) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1)
      << static_cast<double>(bytes) / static_cast<double>(kBytesPerMb);
  return oss.str();
}

// "1 GB (1024 MB)" for whole gigabytes, "<n> MB" otherwise.
std::string describe_limit(std::uint64_t bytes) {
  const std::uint64_t mb = bytes / kBytesPerMb;
  if (mb > 0 && mb % 1024 == 0) {
    return std::to_string(mb / 1024) + " GB (" + std::to_string(mb) + " MB)";
  }
  return std::to_string(mb) + " MB";
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::optional<fs::path> make_temp_dir(const std::string &prefix, std::string &error) {
  std::error_code ec;
  const fs::path base = fs::temp_directory_path(ec);
  if (ec) {
    error = ec.message();
    return std::nullopt;
  }
  const std::string pattern = (base / (prefix + "XXXXXX")).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    error = "mkdtemp " + pattern + ": " + std::strerror(errno);
    return std::nullopt;
  }
  return fs::path(buf.data());
}

std::optional<fs::path> make_temp_file(const std::string &prefix,
                                       const std::string &suffix,
                                       std::string &error) {
  std::error_code ec;
  const fs::path base = fs::temp_directory_path(ec);
  if (ec) {
    error = ec.message();
    return std::nullopt;
  }
  const std::string pattern = (base / (prefix + "XXXXXX" + suffix)).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    error = "mkstemps " + pattern + ": " + std::strerror(errno);
    return std::nullopt;
  }
  ::close(fd);
  return fs::path(buf.data());
}

std::optional<std::uint64_t> parse_content_length(const HttpResponse &head) {
  const auto value = head.header("content-length");
  if (!value || value->empty()) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const auto n = std::stoull(*value, &consumed);
    if (consumed != value->size()) {
      return std::nullopt;
    }
    return static_cast<std::uint64_t>(n);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

void append_capped(std::string &buffer, const char *data, std::size_t size) {
  if (buffer.size() < kMaxErrorBody) {
    buffer.append(data, std::min(size, kMaxErrorBody - buffer.size()));
  }
}

void emit_status(const std::shared_ptr<core::IEventSink> &events,
                 const std::string &message, StatusLevel level = StatusLevel::Info) {
  if (events) {
    events->status_update(message, level);
  }
}

void emit_progress(const std::shared_ptr<core::IEventSink> &events,
                   const Progress &progress) {
  if (events) {
    events->progress(progress);
  }
}

} // namespace

std::string filename_from_content_disposition(const std::string &header,
                                              const std::string &fallback) {
  const std::string key = "filename=";
  const auto pos = header.rfind(key);
  if (pos == std::string::npos) {
    return fallback;
  }

  std::string value = header.substr(pos + key.size());
  if (!value.empty() && value.front() == '"') {
    const auto close = value.find('"', 1);
    value = value.substr(1, close == std::string::npos ? std::string::npos : close - 1);
  } else {
    value = value.substr(0, value.find(';'));
  }

  const std::string strip = "\"; ";
  const auto begin = value.find_first_not_of(strip);
  if (begin == std::string::npos) {
    return fallback;
  }
  value = value.substr(begin, value.find_last_not_of(strip) - begin + 1);

  const std::string name = fs::path(value).filename().string();
  if (name.empty() || name == "." || name == "..") {
    return fallback;
  }
  return name;
}

bool is_tiff_content_type(const std::string &content_type) {
  const std::string lowered = to_lower(content_type);
  return lowered.find("image/tiff") != std::string::npos ||
         lowered.find("image/tif") != std::string::npos;
}

HttpTransferEngine::HttpTransferEngine(ClientConfig config,
                                       std::shared_ptr<IHttpClient> http,
                                       std::shared_ptr<ApiSession> session,
                                       std::shared_ptr<core::ILogger> logger)
    : config_(std::move(config)), http_(std::move(http)),
      session_(std::move(session)), logger_(std::move(logger)) {}

void HttpTransferEngine::settle(core::TransferDescriptor &descriptor,
                                core::TransferState state,
                                const std::string &trace_id) const {
  auto moved = descriptor.transition_to(state);
  if (moved.is_err() && logger_) {
    logger_->error(trace_id, "transfer_engine", "illegal_transition",
                   moved.error().internal_message);
  }
}

TransferOutcome
HttpTransferEngine::download(const core::DownloadRequest &request,
                             const std::shared_ptr<core::CancelToken> &cancel_token,
                             const std::shared_ptr<core::IEventSink> &events) {
  const std::string &job_id = request.job_id;

  core::TransferDescriptor descriptor;
  descriptor.direction = core::TransferDirection::Download;
  descriptor.remote_url = config_.url(config_.endpoints.retrieve, job_id);

  fs::path temp_dir;
  fs::path target;
  std::ofstream out;
  bool write_failed = false;
  std::string write_error;
  std::string error_body;
  std::optional<int> last_percent;

  auto cancelled = [&]() { return cancel_token && cancel_token->is_canceled(); };

  auto fail = [&](JobError err) -> TransferOutcome {
    if (out.is_open()) {
      out.close();
    }
    if (!temp_dir.empty()) {
      std::error_code ec;
      fs::remove_all(temp_dir, ec);
      if (ec && logger_) {
        logger_->warn(job_id, "transfer_engine", "cleanup_failed",
                      temp_dir.string() + ": " + ec.message());
      }
    }
    const bool was_cancelled = err.category == ErrorCategory::Cancelled;
    settle(descriptor,
           was_cancelled ? core::TransferState::Cancelled : core::TransferState::Failed,
           job_id);
    if (logger_) {
      logger_->warn(job_id, "transfer_engine", "download_failed",
                    std::string("category=") + core::to_string(err.category) +
                        " bytes=" + std::to_string(descriptor.transferred_bytes) +
                        " " + err.internal_message);
    }
    return TransferOutcome::Err(std::move(err));
  };

  auto open_target = [&](const HttpResponse &head) -> bool {
    const std::string filename = filename_from_content_disposition(
        head.header("content-disposition").value_or(""), job_id + ".zip");
    auto dir = make_temp_dir(config_.transfer.temp_dir_prefix + job_id + "_",
                             write_error);
    if (!dir) {
      return false;
    }
    temp_dir = *dir;
    target = temp_dir / filename;
    out.open(target, std::ios::binary | std::ios::trunc);
    if (!out) {
      write_error = "cannot open " + target.string();
      return false;
    }
    descriptor.local_path = target.string();
    descriptor.total_bytes = parse_content_length(head);
    return true;
  };

  if (!http_ || !session_) {
    return fail(JobError::Internal("HttpTransferEngine is not wired"));
  }
  if (cancelled()) {
    return fail(JobError::Cancelled("Download cancelled"));
  }

  auto headers = session_->authorize(cancel_token);
  if (headers.is_err()) {
    return fail(headers.error());
  }

  emit_status(events, "Starting download for job " + job_id + "...");

  HttpRequest http_request;
  http_request.method = HttpMethod::GET;
  http_request.url = descriptor.remote_url;
  http_request.headers = std::move(headers).value();
  http_request.trace_id = job_id;
  http_request.request_id = "download:" + job_id;
  http_request.timeout = config_.transfer.download_timeout;
  http_request.buffer_size = config_.transfer.chunk_size;
  http_request.sink = [&](const HttpResponse &head, const char *data,
                          std::size_t size) {
    if (cancelled()) {
      return false;
    }
    if (!head.ok()) {
      append_capped(error_body, data, size);
      return true;
    }
    if (!out.is_open()) {
      if (!open_target(head)) {
        write_failed = true;
        return false;
      }
      if (!descriptor.total_bytes) {
        emit_progress(events, Progress::indeterminate());
      }
    }
    out.write(data, static_cast<std::streamsize>(size));
    if (!out) {
      write_failed = true;
      write_error = "write failed: " + target.string();
      return false;
    }
    descriptor.add_bytes(size);
    const auto percent = descriptor.banded_percent();
    if (percent && percent != last_percent) {
      last_percent = percent;
      emit_progress(events, Progress::of(*percent));
    }
    return true;
  };

  settle(descriptor, core::TransferState::InProgress, job_id);
  auto response = http_->execute(http_request, cancel_token);
  if (out.is_open()) {
    out.close();
  }

  // A rejected token is replaced once, like the job status calls.
  if (!write_failed && response.is_ok() && response.value().status_code == 401 &&
      session_->can_login()) {
    if (logger_) {
      logger_->warn(job_id, "transfer_engine", "unauthorized",
                    "url=" + http_request.url + " attempt=1");
    }
    session_->invalidate();
    auto renewed = session_->authorize(cancel_token);
    if (renewed.is_err()) {
      return fail(renewed.error());
    }
    http_request.headers = std::move(renewed).value();
    error_body.clear();
    descriptor.transferred_bytes = 0;
    last_percent.reset();

    response = http_->execute(http_request, cancel_token);
    if (out.is_open()) {
      out.close();
    }
    if (!write_failed && response.is_ok() && response.value().status_code == 401) {
      return fail(JobError::AuthFailure(
          "authentication failed: token rejected by the API"));
    }
  }

  if (write_failed) {
    return fail(JobError::Internal("Could not save download: " + write_error));
  }
  if (response.is_err()) {
    if (response.error().category == ErrorCategory::Cancelled || cancelled()) {
      return fail(JobError::Cancelled("Download cancelled"));
    }
    JobError err = response.error();
    err.user_message = "Network error during download: " + err.user_message;
    return fail(std::move(err));
  }
  if (cancelled()) {
    return fail(JobError::Cancelled("Download cancelled"));
  }

  HttpResponse head = response.value();
  if (!head.ok()) {
    head.body = error_body;
    return fail(check_http_status(head).error());
  }

  // Empty body: the sink never ran.
  if (target.empty()) {
    if (!open_target(head)) {
      return fail(JobError::Internal("Could not save download: " + write_error));
    }
    out.close();
  }

  settle(descriptor, core::TransferState::Completed, job_id);
  if (descriptor.total_bytes) {
    emit_progress(events, Progress::of(100));
  }
  if (logger_) {
    logger_->info(job_id, "transfer_engine", "download_completed",
                  "path=" + descriptor.local_path +
                      " bytes=" + std::to_string(descriptor.transferred_bytes));
  }

  core::TransferResult result;
  result.local_path = descriptor.local_path;
  result.datatype_id = request.datatype_id;
  result.bytes = descriptor.transferred_bytes;
  return TransferOutcome::Ok(std::move(result));
}

TransferOutcome
HttpTransferEngine::upload(const core::UploadRequest &request,
                           const std::shared_ptr<core::CancelToken> &cancel_token,
                           const std::shared_ptr<core::IEventSink> &events) {
  const std::string trace_id =
      request.trace_id.empty() ? request.file_path : request.trace_id;
  const std::string filename = fs::path(request.file_path).filename().string();

  core::TransferDescriptor descriptor;
  descriptor.direction = core::TransferDirection::Upload;
  descriptor.local_path = request.file_path;
  descriptor.remote_url = config_.url(config_.endpoints.jobs_create_from_file);

  fs::path result_file;
  std::ofstream out;
  bool write_failed = false;
  std::string write_error;
  std::string error_body;

  auto cancelled = [&]() { return cancel_token && cancel_token->is_canceled(); };

  auto fail = [&](JobError err) -> TransferOutcome {
    if (out.is_open()) {
      out.close();
    }
    if (!result_file.empty()) {
      std::error_code ec;
      fs::remove(result_file, ec);
      if (ec && logger_) {
        logger_->warn(trace_id, "transfer_engine", "cleanup_failed",
                      result_file.string() + ": " + ec.message());
      }
    }
    const bool was_cancelled = err.category == ErrorCategory::Cancelled;
    settle(descriptor,
           was_cancelled ? core::TransferState::Cancelled : core::TransferState::Failed,
           trace_id);
    if (logger_) {
      logger_->warn(trace_id, "transfer_engine", "upload_failed",
                    std::string("category=") + core::to_string(err.category) +
                        " " + err.internal_message);
    }
    return TransferOutcome::Err(std::move(err));
  };

  if (!http_ || !session_) {
    return fail(JobError::Internal("HttpTransferEngine is not wired"));
  }

  emit_progress(events, Progress::of(5));
  emit_status(events, "Preparing to upload " + filename + "...");
  if (cancelled()) {
    return fail(JobError::Cancelled("Inference cancelled"));
  }

  // Size ceiling first: an oversized file never opens a connection.
  std::error_code size_ec;
  const std::uint64_t size = fs::file_size(request.file_path, size_ec);
  if (size_ec) {
    return fail(JobError::Internal("Cannot read " + request.file_path + ": " +
                                   size_ec.message()));
  }
  descriptor.total_bytes = size;
  emit_status(events, "File size: " + format_mb(size) + " MB");
  if (size > config_.transfer.max_upload_bytes) {
    return fail(JobError::TooLarge(
        "File too large: " + format_mb(size) + " MB. Maximum allowed size is " +
        describe_limit(config_.transfer.max_upload_bytes) + "."));
  }

  emit_progress(events, Progress::of(10));
  auto headers = session_->authorize(cancel_token, true);
  if (headers.is_err()) {
    return fail(headers.error());
  }

  emit_progress(events, Progress::of(15));
  emit_status(events, "Uploading " + filename + " to server...");
  if (cancelled()) {
    return fail(JobError::Cancelled("Inference cancelled"));
  }

  HttpRequest http_request;
  http_request.method = HttpMethod::POST;
  http_request.url = descriptor.remote_url;
  http_request.headers = headers.value();
  http_request.query = {{"datatype_id", request.datatype_id},
                        {"image_type", request.image_type}};
  http_request.file = MultipartFile{"file", request.file_path, filename, "image/tiff"};
  http_request.trace_id = trace_id;
  http_request.request_id = "upload:" + trace_id;
  http_request.timeout = config_.transfer.upload_timeout;
  http_request.buffer_size = config_.transfer.chunk_size;
  http_request.sink = [&](const HttpResponse &head, const char *data,
                          std::size_t n) {
    if (cancelled()) {
      return false;
    }
    if (!head.ok() || !is_tiff_content_type(head.header("content-type").value_or(""))) {
      append_capped(error_body, data, n);
      return true;
    }
    if (!out.is_open()) {
      auto path = make_temp_file(config_.transfer.temp_dir_prefix, ".tif", write_error);
      if (!path) {
        write_failed = true;
        return false;
      }
      result_file = *path;
      out.open(result_file, std::ios::binary | std::ios::trunc);
      if (!out) {
        write_failed = true;
        write_error = "cannot open " + result_file.string();
        return false;
      }
    }
    out.write(data, static_cast<std::streamsize>(n));
    if (!out) {
      write_failed = true;
      write_error = "write failed: " + result_file.string();
      return false;
    }
    return true;
  };

  emit_progress(events, Progress::of(20));
  emit_status(events,
              "Upload and inference in progress (this may take several minutes)...");
  settle(descriptor, core::TransferState::InProgress, trace_id);

  auto response = http_->execute(http_request, cancel_token);
  if (out.is_open()) {
    out.close();
  }

  if (write_failed) {
    return fail(JobError::Internal("Could not save inference result: " + write_error));
  }
  if (response.is_err()) {
    const JobError &err = response.error();
    if (err.category == ErrorCategory::Cancelled || cancelled()) {
      return fail(JobError::Cancelled("Inference cancelled"));
    }
    if (err.category == ErrorCategory::Timeout) {
      JobError timeout = JobError::Timeout(
          "Upload timeout - the file may be too large or server is slow");
      timeout.internal_message = err.internal_message;
      return fail(std::move(timeout));
    }
    JobError network = err;
    network.user_message = "Network error during inference: " + err.user_message;
    return fail(std::move(network));
  }
  descriptor.add_bytes(size);

  emit_progress(events, Progress::of(70));
  emit_status(events, "Inference completed, processing response...");
  if (cancelled()) {
    return fail(JobError::Cancelled("Inference cancelled"));
  }

  const HttpResponse &head = response.value();
  if (head.status_code == 401) {
    return fail(JobError::TokenExpired());
  }
  if (!head.ok() || !is_tiff_content_type(head.header("content-type").value_or(""))) {
    std::string message = error_body.empty()
                              ? "HTTP " + std::to_string(head.status_code)
                              : error_body;
    if (auto detail = api_json::extract_error_detail(error_body)) {
      message = *detail;
    }
    return fail(JobError(ErrorCategory::FatalServer, head.status_code,
                         head.status_code >= 500, "API returned error: " + message,
                         "status=" + std::to_string(head.status_code) + " " + message));
  }

  emit_progress(events, Progress::of(85));
  emit_status(events, "Saving result TIFF file...");
  if (result_file.empty()) {
    auto path = make_temp_file(config_.transfer.temp_dir_prefix, ".tif", write_error);
    if (!path) {
      return fail(JobError::Internal("Could not save inference result: " + write_error));
    }
    result_file = *path;
  }

  settle(descriptor, core::TransferState::Completed, trace_id);
  emit_progress(events, Progress::of(100));
  if (logger_) {
    logger_->info(trace_id, "transfer_engine", "upload_completed",
                  "result=" + result_file.string() + " bytes=" + std::to_string(size));
  }

  core::TransferResult result;
  result.local_path = result_file.string();
  if (!request.datatype_id.empty()) {
    result.datatype_id = request.datatype_id;
  }
  result.bytes = size;
  return TransferOutcome::Ok(std::move(result));
}

} // namespace ermes::infra
