#pragma once

#include "infra/config.h"
#include "infra/http_client.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ermes::core {
class ILogger;
}

namespace ermes::infra {

/// Immutable credential snapshot. A new one is built on every set().
struct Credential {
  std::string token;
  std::chrono::system_clock::time_point issued_at;
  std::chrono::minutes lifetime{0};
};

/// Tracks the bearer credential of one session: local age-based expiry plus
/// an optional remote validation ping.
///
/// Writers (set/clear) swap the snapshot pointer under a mutex; readers take
/// a copy of the pointer and never observe a half-updated credential.
class TokenLifecycle {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;
  using ExpiredCallback = std::function<void()>;

  TokenLifecycle(TokenSettings settings, std::string validation_url,
                 std::shared_ptr<IHttpClient> http,
                 std::shared_ptr<core::ILogger> logger = nullptr,
                 Clock clock = nullptr);

  /// Replace the credential. `issued_at` defaults to now, `lifetime` to the
  /// configured lifetime.
  void set(const std::string &token,
           std::optional<std::chrono::system_clock::time_point> issued_at = std::nullopt,
           std::optional<std::chrono::minutes> lifetime = std::nullopt);

  void clear();

  [[nodiscard]] bool has_token() const;

  /// Current credential, or null when cleared.
  [[nodiscard]] std::shared_ptr<const Credential> snapshot() const;

  /// True without a credential, or once age >= lifetime - buffer.
  [[nodiscard]] bool is_expired_locally() const;

  /// max(0, lifetime - age); zero without a credential.
  [[nodiscard]] std::chrono::seconds time_until_expiry() const;

  /// GET the jobs list with the bearer header. False only on 401 (or without
  /// a credential). Other statuses and transport failures count as valid.
  bool validate_remotely(std::optional<std::chrono::seconds> timeout = std::nullopt);

  /// Local check, then remote. Fires the expiry callbacks and returns false
  /// when either check fails.
  bool check_and_handle_expiration();

  void on_expired(ExpiredCallback cb);

  /// "Bearer <token>", or nothing without a credential.
  [[nodiscard]] std::optional<std::string> bearer_header() const;

  [[nodiscard]] const TokenSettings &settings() const { return settings_; }

private:
  TokenSettings settings_;
  std::string validation_url_;
  std::shared_ptr<IHttpClient> http_;
  std::shared_ptr<core::ILogger> logger_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::shared_ptr<const Credential> credential_;
  std::vector<ExpiredCallback> expired_callbacks_;

  std::chrono::system_clock::time_point now() const;
  bool expired(const Credential &credential) const;
  void notify_expired(const std::string &reason);
};

} // namespace ermes::infra
