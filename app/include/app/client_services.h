#pragma once

#include "core/logger.h"
#include "infra/api_client.h"
#include "infra/api_session.h"
#include "infra/config.h"
#include "infra/http_client.h"
#include "infra/token_lifecycle.h"
#include "infra/token_storage.h"
#include "infra/transfer_engine.h"

#include <memory>
#include <optional>

namespace ermes::app {

/// Everything one CLI session needs, wired around a single credential.
struct ClientServices {
  infra::ClientConfig config;
  std::shared_ptr<core::ILogger> logger;
  std::shared_ptr<infra::IHttpClient> http;
  std::shared_ptr<infra::TokenLifecycle> tokens;
  std::shared_ptr<infra::ApiSession> session;
  std::shared_ptr<infra::HttpJobApi> api;          // status and detail calls
  std::shared_ptr<infra::HttpJobApi> registry_api; // job list, with retries
  std::shared_ptr<infra::HttpTransferEngine> engine;
};

/// Builds the service graph on top of `http`. A still-valid token from
/// `storage` is restored, and every newly issued token is saved back.
ClientServices build_services(infra::ClientConfig config,
                              std::shared_ptr<infra::IHttpClient> http,
                              std::shared_ptr<core::ILogger> logger,
                              std::optional<infra::LoginCredentials> login,
                              std::shared_ptr<infra::TokenStorage> storage);

} // namespace ermes::app
