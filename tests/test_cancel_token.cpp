#include <gtest/gtest.h>

#include "core/cancel_token.h"

#include <chrono>
#include <thread>

using namespace ermes::core;
using namespace std::chrono_literals;

TEST(CancelToken, StartsUncancelled) {
  auto token = CancelToken::create();
  ASSERT_FALSE(token->is_canceled());
}

TEST(CancelToken, RequestIsIdempotent) {
  auto token = CancelToken::create();
  token->request_cancel();
  token->request_cancel();
  ASSERT_TRUE(token->is_canceled());
}

TEST(CancelToken, WaitTimesOutWithoutCancel) {
  auto token = CancelToken::create();
  const auto start = std::chrono::steady_clock::now();
  ASSERT_FALSE(token->wait_for(50ms));
  ASSERT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST(CancelToken, WaitReturnsImmediatelyWhenAlreadyCancelled) {
  auto token = CancelToken::create();
  token->request_cancel();
  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(token->wait_for(5s));
  ASSERT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(CancelToken, CancelInterruptsWait) {
  auto token = CancelToken::create();
  std::thread canceler([token]() {
    std::this_thread::sleep_for(50ms);
    token->request_cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  const bool interrupted = token->wait_for(10s);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  canceler.join();

  ASSERT_TRUE(interrupted);
  ASSERT_LT(elapsed, 2s);
}
