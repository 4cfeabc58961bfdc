#include "infra/config.h"

#include "core/logger.h"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <stdexcept>

namespace ermes::infra {

namespace {

using core::JobError;

constexpr const char *kJobIdPlaceholder = "{job_id}";

std::chrono::milliseconds seconds_to_ms(double seconds) {
  return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

// Reads `section.key` into `out` when present. Conversion errors name the
// offending key.
template <typename T>
void read_key(const YAML::Node &section, const char *section_name,
              const char *key, const std::function<void(const T &)> &apply) {
  if (!section || !section[key]) {
    return;
  }
  try {
    apply(section[key].as<T>());
  } catch (const YAML::Exception &e) {
    throw std::invalid_argument(std::string(section_name) + "." + key + ": " +
                                e.what());
  }
}

const char *env(const char *name) {
  const char *value = std::getenv(name);
  return value != nullptr && value[0] != '\0' ? value : nullptr;
}

void warn(const std::shared_ptr<core::ILogger> &logger, const std::string &msg) {
  if (logger) {
    logger->warn("config", "config", "invalid_override", msg);
  }
}

// Positive number from an environment variable, or nothing (with a warning).
bool env_number(const char *name, double &out,
                const std::shared_ptr<core::ILogger> &logger) {
  const char *value = env(name);
  if (!value) {
    return false;
  }
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(value, &consumed);
    if (consumed != std::string(value).size() || parsed <= 0.0) {
      throw std::invalid_argument("not a positive number");
    }
    out = parsed;
    return true;
  } catch (const std::exception &) {
    warn(logger, std::string(name) + "=" + value +
                     " is not a positive number, keeping the configured value");
    return false;
  }
}

} // namespace

std::string ApiEndpoints::expand(const std::string &path_template,
                                 const std::string &job_id) {
  std::string out = path_template;
  const std::string placeholder(kJobIdPlaceholder);
  std::size_t pos = 0;
  while ((pos = out.find(placeholder, pos)) != std::string::npos) {
    out.replace(pos, placeholder.size(), job_id);
    pos += job_id.size();
  }
  return out;
}

std::string ClientConfig::url(const std::string &path_template,
                              const std::string &job_id) const {
  return base_url + ApiEndpoints::expand(path_template, job_id);
}

core::Result<ClientConfig, JobError>
load_config_file(const std::string &path,
                 const std::shared_ptr<core::ILogger> &logger) {
  using R = core::Result<ClientConfig, JobError>;

  if (!std::filesystem::exists(path)) {
    return R::Err(JobError::Internal("Config file not found: " + path));
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    return R::Err(JobError::Internal("Error loading YAML file: " + path + ": " +
                                     e.what()));
  }

  ClientConfig config;
  try {
    const YAML::Node api = root["api"];
    read_key<std::string>(api, "api", "base_url",
                          [&](const std::string &v) { config.base_url = v; });
    if (api && api["endpoints"]) {
      const YAML::Node ep = api["endpoints"];
      auto &e = config.endpoints;
      read_key<std::string>(ep, "api.endpoints", "login",
                            [&](const std::string &v) { e.login = v; });
      read_key<std::string>(ep, "api.endpoints", "jobs_list",
                            [&](const std::string &v) { e.jobs_list = v; });
      read_key<std::string>(ep, "api.endpoints", "jobs_detail",
                            [&](const std::string &v) { e.jobs_detail = v; });
      read_key<std::string>(ep, "api.endpoints", "retrieve",
                            [&](const std::string &v) { e.retrieve = v; });
      read_key<std::string>(ep, "api.endpoints", "jobs_create_from_file",
                            [&](const std::string &v) { e.jobs_create_from_file = v; });
    }

    const YAML::Node token = root["token"];
    auto &t = config.token;
    read_key<int>(token, "token", "lifetime_minutes",
                  [&](const int &v) { t.lifetime = std::chrono::minutes(v); });
    read_key<int>(token, "token", "expiration_buffer_minutes", [&](const int &v) {
      t.expiration_buffer = std::chrono::minutes(v);
    });
    read_key<int>(token, "token", "api_validation_timeout", [&](const int &v) {
      t.validation_timeout = std::chrono::seconds(v);
    });
    read_key<long long>(token, "token", "validation_interval_ms",
                        [&](const long long &v) {
                          t.validation_interval = std::chrono::milliseconds(v);
                        });

    const YAML::Node polling = root["polling"];
    auto &p = config.polling;
    read_key<double>(polling, "polling", "interval_seconds",
                     [&](const double &v) { p.interval = seconds_to_ms(v); });
    read_key<double>(polling, "polling", "error_sleep_seconds",
                     [&](const double &v) { p.error_sleep = seconds_to_ms(v); });
    read_key<double>(polling, "polling", "request_timeout_seconds",
                     [&](const double &v) { p.request_timeout = seconds_to_ms(v); });

    const YAML::Node processing = root["processing"];
    auto &x = config.transfer;
    read_key<std::size_t>(processing, "processing", "chunk_size",
                          [&](const std::size_t &v) { x.chunk_size = v; });
    read_key<std::string>(processing, "processing", "temp_dir_prefix",
                          [&](const std::string &v) { x.temp_dir_prefix = v; });
    read_key<long long>(processing, "processing", "upload_timeout_seconds",
                        [&](const long long &v) {
                          x.upload_timeout = std::chrono::seconds(v);
                        });
    read_key<double>(processing, "processing", "download_timeout_seconds",
                     [&](const double &v) { x.download_timeout = seconds_to_ms(v); });
    read_key<std::uint64_t>(processing, "processing", "max_upload_mb",
                            [&](const std::uint64_t &v) {
                              x.max_upload_bytes = v * 1024ull * 1024ull;
                            });

    read_key<double>(root["registry"], "registry", "interval_seconds",
                     [&](const double &v) { config.registry.interval = seconds_to_ms(v); });
    read_key<std::string>(root["logging"], "logging", "level",
                          [&](const std::string &v) { config.log_level = v; });
  } catch (const std::invalid_argument &e) {
    return R::Err(JobError::Internal("Invalid value in " + path + ": " + e.what()));
  }

  if (logger) {
    logger->info("config", "config", "loaded", "path=" + path);
  }
  return R::Ok(std::move(config));
}

void apply_env_overrides(ClientConfig &config,
                         const std::shared_ptr<core::ILogger> &logger) {
  if (const char *v = env("ERMES_API_BASE_URL")) {
    config.base_url = v;
  }
  if (const char *v = env("ERMES_TEMP_DIR_PREFIX")) {
    config.transfer.temp_dir_prefix = v;
  }
  if (const char *v = env("ERMES_LOG_LEVEL")) {
    config.log_level = v;
  }

  double number = 0.0;
  if (env_number("ERMES_TOKEN_LIFETIME_MINUTES", number, logger)) {
    config.token.lifetime = std::chrono::minutes(static_cast<long long>(number));
  }
  if (env_number("ERMES_TOKEN_BUFFER_MINUTES", number, logger)) {
    config.token.expiration_buffer =
        std::chrono::minutes(static_cast<long long>(number));
  }
  if (env_number("ERMES_POLL_INTERVAL_SECONDS", number, logger)) {
    config.polling.interval = seconds_to_ms(number);
  }
  if (env_number("ERMES_ERROR_SLEEP_SECONDS", number, logger)) {
    config.polling.error_sleep = seconds_to_ms(number);
  }
  if (env_number("ERMES_CHUNK_SIZE", number, logger)) {
    config.transfer.chunk_size = static_cast<std::size_t>(number);
  }
}

core::Result<void, JobError> validate_config(const ClientConfig &config) {
  auto invalid = [](const std::string &msg) {
    return core::Result<void, JobError>::Err(
        JobError::Internal("Invalid configuration: " + msg));
  };

  if (config.base_url.empty()) {
    return invalid("api.base_url is empty");
  }
  if (config.token.expiration_buffer >= config.token.lifetime) {
    return invalid("token expiration buffer must be shorter than the lifetime");
  }
  if (config.polling.interval.count() <= 0 ||
      config.polling.error_sleep.count() <= 0) {
    return invalid("polling intervals must be positive");
  }
  if (config.transfer.chunk_size == 0) {
    return invalid("processing.chunk_size must be positive");
  }
  if (config.registry.interval.count() <= 0) {
    return invalid("registry.interval_seconds must be positive");
  }
  return core::Result<void, JobError>::Ok();
}

} // namespace ermes::infra
