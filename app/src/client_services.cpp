#include "app/client_services.h"

namespace ermes::app {

ClientServices build_services(infra::ClientConfig config,
                              std::shared_ptr<infra::IHttpClient> http,
                              std::shared_ptr<core::ILogger> logger,
                              std::optional<infra::LoginCredentials> login,
                              std::shared_ptr<infra::TokenStorage> storage) {
  ClientServices services;
  services.config = std::move(config);
  services.logger = logger;
  services.http = http;

  services.tokens = std::make_shared<infra::TokenLifecycle>(
      services.config.token, services.config.url(services.config.endpoints.jobs_list),
      http, logger);

  services.session = std::make_shared<infra::ApiSession>(
      services.config, http, services.tokens, logger);
  if (login) {
    services.session->set_login(std::move(*login));
  }

  if (storage) {
    if (auto stored = storage->load()) {
      services.tokens->set(stored->token, stored->issued_at);
      if (services.tokens->is_expired_locally()) {
        services.tokens->clear();
        storage->clear();
      } else if (logger) {
        logger->info("session", "app", "token_restored",
                     "expires_in_s=" +
                         std::to_string(services.tokens->time_until_expiry().count()));
      }
    }
    services.session->on_token_issued(
        [storage, logger](const std::string &token,
                          std::chrono::system_clock::time_point issued_at) {
          if (!storage->save(token, issued_at) && logger) {
            logger->warn("session", "app", "token_not_saved",
                         storage->token_file_path());
          }
        });
  }

  services.api = std::make_shared<infra::HttpJobApi>(services.config, http,
                                                     services.session, logger);

  infra::RetryPolicy retry_policy;
  retry_policy.max_retries = 2;
  retry_policy.initial_backoff = std::chrono::milliseconds(500);
  retry_policy.max_backoff = std::chrono::milliseconds(5000);
  auto retrying = std::make_shared<infra::RetryableHttpClient>(http, retry_policy, logger);
  services.registry_api = std::make_shared<infra::HttpJobApi>(
      services.config, retrying, services.session, logger);

  services.engine = std::make_shared<infra::HttpTransferEngine>(
      services.config, http, services.session, logger);
  return services;
}

} // namespace ermes::app
