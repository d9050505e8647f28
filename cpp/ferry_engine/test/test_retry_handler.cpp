/**
 * Unit tests for RetryHandler
 */

#include <gtest/gtest.h>

#include <chrono>
#include <set>

#include "retry_handler.hpp"

using namespace ferry::engine;

class RetryHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    RetryConfig config;
    config.max_retries = 3;
    config.initial_delay = std::chrono::milliseconds(200);
    config.max_delay = std::chrono::milliseconds(20000);
    config.exponential_base = 2.0;
    config.jitter = false;  // Disable jitter for deterministic tests
    handler_ = std::make_unique<RetryHandler>(config);
  }

  std::unique_ptr<RetryHandler> handler_;
};

TEST_F(RetryHandlerTest, DefaultsMatchDocumentedPolicy) {
  RetryConfig config;
  EXPECT_EQ(config.max_retries, 3);
  EXPECT_EQ(config.initial_delay.count(), 200);
  EXPECT_EQ(config.max_delay.count(), 20000);
  EXPECT_DOUBLE_EQ(config.exponential_base, 2.0);
  EXPECT_TRUE(config.jitter);
  EXPECT_DOUBLE_EQ(config.jitter_factor, 0.5);
  EXPECT_EQ(config.retryable_statuses, (std::set<int>{500, 502, 503, 504}));
}

TEST_F(RetryHandlerTest, ExponentialBackoff) {
  // Expected: 200, 400, 800, 1600 ms
  EXPECT_EQ(handler_->getDelay(0).count(), 200);
  EXPECT_EQ(handler_->getDelay(1).count(), 400);
  EXPECT_EQ(handler_->getDelay(2).count(), 800);
  EXPECT_EQ(handler_->getDelay(3).count(), 1600);
}

TEST_F(RetryHandlerTest, MaxDelayCap) {
  // 2^10 * 200 = 204,800 ms, capped at 20,000
  EXPECT_EQ(handler_->getDelay(10).count(), 20000);
}

TEST_F(RetryHandlerTest, ShouldRetry) {
  // Three retries means four attempts in total
  EXPECT_TRUE(handler_->shouldRetry(0));
  EXPECT_TRUE(handler_->shouldRetry(2));
  EXPECT_FALSE(handler_->shouldRetry(3));
  EXPECT_FALSE(handler_->shouldRetry(10));
}

TEST_F(RetryHandlerTest, JitterStaysInRange) {
  RetryConfig config;
  config.initial_delay = std::chrono::milliseconds(1000);
  config.jitter = true;
  config.jitter_factor = 0.5;
  RetryHandler jitter_handler(config);

  std::set<int64_t> delays;
  for (int i = 0; i < 100; ++i) {
    delays.insert(jitter_handler.getDelay(0).count());
  }

  EXPECT_GT(delays.size(), 1u);
  for (auto d : delays) {
    EXPECT_GE(d, 500);
    EXPECT_LE(d, 1500);
  }
}

TEST_F(RetryHandlerTest, NextRetryTime) {
  auto now = std::chrono::steady_clock::now();
  auto next = handler_->nextRetryTime(0);

  auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
  EXPECT_GE(diff.count(), 190);
  EXPECT_LE(diff.count(), 300);
}

TEST_F(RetryHandlerTest, RetryableStatuses) {
  EXPECT_TRUE(handler_->isRetryableStatus(500));
  EXPECT_TRUE(handler_->isRetryableStatus(503));
  EXPECT_FALSE(handler_->isRetryableStatus(403));
  EXPECT_FALSE(handler_->isRetryableStatus(404));
  EXPECT_FALSE(handler_->isRetryableStatus(501));
}

TEST_F(RetryHandlerTest, CustomRetryableStatuses) {
  RetryConfig config;
  config.retryable_statuses = {429};
  RetryHandler handler(config);

  EXPECT_TRUE(handler.isRetryableStatus(429));
  EXPECT_FALSE(handler.isRetryableStatus(500));
}

TEST_F(RetryHandlerTest, IsRetryableError) {
  EXPECT_TRUE(RetryHandler::isRetryableError("RequestTimeout"));
  EXPECT_TRUE(RetryHandler::isRetryableError("ServiceUnavailable"));
  EXPECT_TRUE(RetryHandler::isRetryableError("InternalError"));
  EXPECT_TRUE(RetryHandler::isRetryableError("SlowDown"));
  EXPECT_TRUE(RetryHandler::isRetryableError("Throttling"));
  EXPECT_TRUE(RetryHandler::isRetryableError("NetworkingError"));

  EXPECT_FALSE(RetryHandler::isRetryableError("AccessDenied"));
  EXPECT_FALSE(RetryHandler::isRetryableError("NoSuchBucket"));
  EXPECT_FALSE(RetryHandler::isRetryableError("NoSuchUpload"));
  EXPECT_FALSE(RetryHandler::isRetryableError("InvalidPart"));
  EXPECT_FALSE(RetryHandler::isRetryableError(""));
}

TEST_F(RetryHandlerTest, ZeroRetryCount) {
  RetryConfig config;
  config.max_retries = 0;
  RetryHandler no_retry_handler(config);

  EXPECT_FALSE(no_retry_handler.shouldRetry(0));
}
