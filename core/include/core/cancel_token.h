#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace ermes::core {

/// Thread-safe cooperative cancellation token.
///
/// One token per job poller or transfer. Whoever owns the unit of work calls
/// request_cancel(); the worker checks is_canceled() at iteration boundaries
/// and around network calls, and sleeps through wait_for() so that a pending
/// cancellation interrupts the inter-poll delay.
class CancelToken {
public:
  CancelToken() = default;

  CancelToken(const CancelToken &) = delete;
  CancelToken &operator=(const CancelToken &) = delete;

  /// Request cancellation. Thread-safe, idempotent.
  void request_cancel() noexcept;

  [[nodiscard]] bool is_canceled() const noexcept;

  /// Block for at most `timeout`. Returns true if cancellation was requested
  /// before or during the wait.
  bool wait_for(std::chrono::milliseconds timeout) const;

  static std::shared_ptr<CancelToken> create();

private:
  std::atomic<bool> canceled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

} // namespace ermes::core
