#include "app/client_services.h"
#include "app/log_event_sink.h"
#include "core/job_poller.h"
#include "core/job_registry.h"
#include "core/logger.h"
#include "core/task_group.h"
#include "core/transfer_task.h"
#include "infra/config.h"
#include "infra/curl_http_client.h"
#include "infra/logger.h"
#include "infra/path_service.h"
#include "infra/token_storage.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace ermes;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) { g_interrupted = 1; }

void print_usage() {
  std::cerr << "usage: ermes_client [--config FILE] <command>\n"
               "\n"
               "commands:\n"
               "  monitor JOB_ID                  poll a job and download its result\n"
               "  download JOB_ID                 download the result of a finished job\n"
               "  upload FILE DATATYPE IMAGE_TYPE submit a file for inference\n"
               "  jobs [--watch]                  list jobs (every 30 s with --watch)\n"
               "\n"
               "credentials: ERMES_USERNAME / ERMES_PASSWORD\n";
}

struct CliArgs {
  std::optional<std::string> config_file;
  std::string command;
  std::vector<std::string> args;
};

std::optional<CliArgs> parse_args(int argc, char *argv[]) {
  CliArgs cli;
  int i = 1;
  while (i < argc) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        return std::nullopt;
      }
      cli.config_file = argv[i + 1];
      i += 2;
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      return std::nullopt;
    }
    break;
  }
  if (i >= argc) {
    return std::nullopt;
  }
  cli.command = argv[i++];
  for (; i < argc; ++i) {
    cli.args.emplace_back(argv[i]);
  }

  const std::size_t n = cli.args.size();
  const bool valid = (cli.command == "monitor" && n == 1) ||
                     (cli.command == "download" && n == 1) ||
                     (cli.command == "upload" && n == 3) ||
                     (cli.command == "jobs" &&
                      (n == 0 || (n == 1 && cli.args[0] == "--watch")));
  if (!valid) {
    return std::nullopt;
  }
  return cli;
}

std::optional<infra::ClientConfig>
load_configuration(const CliArgs &cli, const infra::PathService &paths,
                   const std::shared_ptr<core::ILogger> &logger) {
  infra::ClientConfig config;

  std::optional<std::string> file = cli.config_file;
  if (!file && std::filesystem::exists(paths.default_config_file())) {
    file = paths.default_config_file();
  }
  if (file) {
    auto loaded = infra::load_config_file(*file, logger);
    if (loaded.is_err()) {
      logger->error("startup", "app", "config_invalid", loaded.error().user_message);
      return std::nullopt;
    }
    config = loaded.value();
  }

  infra::apply_env_overrides(config, logger);
  auto valid = infra::validate_config(config);
  if (valid.is_err()) {
    logger->error("startup", "app", "config_invalid", valid.error().user_message);
    return std::nullopt;
  }
  return config;
}

std::optional<infra::LoginCredentials> login_from_environment() {
  const char *user = std::getenv("ERMES_USERNAME");
  const char *password = std::getenv("ERMES_PASSWORD");
  if (!user || user[0] == '\0' || !password) {
    return std::nullopt;
  }
  return infra::LoginCredentials{user, password};
}

void print_jobs(const std::vector<core::JobSummary> &jobs) {
  for (const auto &job : jobs) {
    std::cout << job.id << '\t' << job.status << '\t'
              << job.datatype_id.value_or("-") << '\t' << job.result_message
              << '\n';
  }
  std::cout.flush();
}

} // namespace

int main(int argc, char *argv[]) {
  const auto cli = parse_args(argc, argv);
  if (!cli) {
    print_usage();
    return kExitUsage;
  }

  auto logger = infra::create_console_logger();
  auto paths = infra::PathService::create();

  const auto config = load_configuration(*cli, *paths, logger);
  if (!config) {
    return kExitUsage;
  }
  logger = infra::create_console_logger(config->log_level);

  auto storage = std::make_shared<infra::TokenStorage>(*paths);
  auto http = std::make_shared<infra::CurlHttpClient>(logger);
  auto services = app::build_services(*config, http, logger,
                                      login_from_environment(), storage);

  if (!services.session->can_login() && !services.tokens->has_token()) {
    logger->error("startup", "app", "no_credentials",
                  "set ERMES_USERNAME and ERMES_PASSWORD");
    return kExitUsage;
  }

  services.tokens->on_expired([logger, storage]() {
    storage->clear();
    logger->warn("session", "app", "token_expired",
                 "Authentication token has expired. Please login again.");
  });

  std::signal(SIGINT, on_sigint);

  core::TaskGroup tasks(logger);
  std::atomic<bool> work_done{false};
  std::atomic<int> exit_code{kExitFailed};

  const std::string trace_id = cli->args.empty() ? cli->command : cli->args[0];
  auto events = std::make_shared<app::LogEventSink>(trace_id, logger);

  auto work = [&](const std::shared_ptr<core::CancelToken> &token) {
    if (cli->command == "monitor") {
      core::PollingPolicy policy;
      policy.interval = services.config.polling.interval;
      policy.error_sleep = services.config.polling.error_sleep;
      core::JobPoller poller(policy, services.session, services.api,
                             services.engine, events, logger);
      const auto outcome = poller.run(cli->args[0], token);
      if (outcome.artifact) {
        std::cout << outcome.artifact->local_path << std::endl;
      }
      exit_code = outcome.state == core::PollerState::Done ? kExitOk : kExitFailed;
    } else if (cli->command == "download" || cli->command == "upload") {
      core::TransferTask transfer(services.engine, services.api, events, logger);
      auto result =
          cli->command == "download"
              ? transfer.download_job(cli->args[0], token)
              : transfer.upload_file(
                    core::UploadRequest{cli->args[0], cli->args[1], cli->args[2],
                                        std::filesystem::path(cli->args[0])
                                            .filename()
                                            .string()},
                    token);
      if (result.is_ok()) {
        std::cout << result.value().local_path << std::endl;
      }
      exit_code = result.is_ok() ? kExitOk : kExitFailed;
    } else {
      core::JobRegistry registry(services.session, services.registry_api,
                                 services.config.registry.interval, logger);
      if (cli->args.empty()) {
        auto jobs = registry.refresh(token);
        if (jobs.is_ok()) {
          print_jobs(jobs.value());
        } else {
          logger->error("registry", "app", "list_failed", jobs.error().user_message);
        }
        exit_code = jobs.is_ok() ? kExitOk : kExitFailed;
      } else {
        registry.on_jobs_updated(print_jobs);
        registry.on_error([logger](const std::string &message) {
          logger->warn("registry", "app", "list_failed", message);
        });
        registry.run(token);
        exit_code = kExitOk;
      }
    }
    work_done = true;
  };

  const auto validation_interval = services.config.token.validation_interval;
  auto tokens = services.tokens;
  tasks.spawn("token_watchdog",
              [tokens, validation_interval](const std::shared_ptr<core::CancelToken> &token) {
                while (!token->wait_for(validation_interval)) {
                  if (tokens->has_token()) {
                    tokens->check_and_handle_expiration();
                  }
                }
              });
  tasks.spawn(cli->command, work);

  while (!work_done.load()) {
    if (g_interrupted) {
      logger->warn("startup", "app", "interrupted", "cancelling running tasks");
      tasks.cancel_all();
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  tasks.cancel_all();
  tasks.join_all();
  return g_interrupted ? kExitInterrupted : exit_code.load();
}
