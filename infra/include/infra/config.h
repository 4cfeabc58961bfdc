#pragma once

#include "core/job_error.h"
#include "core/result.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace ermes::core {
class ILogger;
}

namespace ermes::infra {

/// Endpoint path templates, relative to ClientConfig::base_url.
/// `{job_id}` is substituted by expand().
struct ApiEndpoints {
  std::string login = "/auth/login";
  std::string jobs_list = "/jobs/";
  std::string jobs_detail = "/jobs/{job_id}";
  std::string retrieve = "/retrieve/{job_id}";
  std::string jobs_create_from_file = "/jobs/create_from_file";

  static std::string expand(const std::string &path_template,
                            const std::string &job_id);
};

struct TokenSettings {
  std::chrono::minutes lifetime{6000};
  std::chrono::minutes expiration_buffer{5};
  std::chrono::seconds validation_timeout{10};
  std::chrono::milliseconds validation_interval{60000};
};

struct PollingSettings {
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds error_sleep{5000};
  std::chrono::milliseconds request_timeout{30000}; // status and login calls
};

struct TransferSettings {
  std::size_t chunk_size = 8192;
  std::string temp_dir_prefix = "qgis_ermes_";
  std::chrono::seconds upload_timeout{6000};
  std::chrono::milliseconds download_timeout{0}; // 0 = no overall deadline
  std::uint64_t max_upload_bytes = 1024ull * 1024ull * 1024ull;
};

struct RegistrySettings {
  std::chrono::milliseconds interval{30000};
};

/// Immutable client configuration, passed by construction to every component
/// that needs it.
struct ClientConfig {
  std::string base_url;
  ApiEndpoints endpoints;
  TokenSettings token;
  PollingSettings polling;
  TransferSettings transfer;
  RegistrySettings registry;
  std::string log_level = "info";

  /// base_url + expanded endpoint template.
  std::string url(const std::string &path_template,
                  const std::string &job_id = "") const;
};

/// Parse a YAML configuration file over the defaults. Missing keys keep their
/// default; a missing file or malformed YAML is an error.
core::Result<ClientConfig, core::JobError>
load_config_file(const std::string &path,
                 const std::shared_ptr<core::ILogger> &logger = nullptr);

/// Apply ERMES_* environment overrides. Invalid values are ignored with a
/// warning.
void apply_env_overrides(ClientConfig &config,
                         const std::shared_ptr<core::ILogger> &logger = nullptr);

/// Reject settings the components cannot work with (empty base URL,
/// buffer >= lifetime, zero chunk size or intervals).
core::Result<void, core::JobError> validate_config(const ClientConfig &config);

} // namespace ermes::infra
