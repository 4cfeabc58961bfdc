#include "core/cancel_token.h"

namespace ermes::core {

void CancelToken::request_cancel() noexcept {
  bool expected = false;
  if (!canceled_.compare_exchange_strong(expected, true,
                                         std::memory_order_release,
                                         std::memory_order_relaxed)) {
    return;
  }
  // Take the lock so a waiter between its predicate check and its wait
  // cannot miss the notification.
  std::lock_guard<std::mutex> lock(mutex_);
  cv_.notify_all();
}

bool CancelToken::is_canceled() const noexcept {
  return canceled_.load(std::memory_order_acquire);
}

bool CancelToken::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return is_canceled(); });
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

} // namespace ermes::core
