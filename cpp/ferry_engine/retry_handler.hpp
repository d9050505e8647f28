#ifndef FERRY_ENGINE_RETRY_HANDLER_HPP
#define FERRY_ENGINE_RETRY_HANDLER_HPP

#include <chrono>
#include <mutex>
#include <random>
#include <set>
#include <string>

namespace ferry {
namespace engine {

/**
 * Backoff policy for one part request.
 *
 * delay(n) = min(initial_delay * exponential_base^n, max_delay), optionally
 * scaled by a random factor in [1 - jitter_factor, 1 + jitter_factor].
 */
struct RetryConfig {
  int max_retries = 3;  // retries after the first attempt
  std::chrono::milliseconds initial_delay{200};
  std::chrono::milliseconds max_delay{20000};
  double exponential_base = 2.0;
  bool jitter = true;
  double jitter_factor = 0.5;

  // HTTP statuses treated as transient even without a retryable error code
  std::set<int> retryable_statuses = {500, 502, 503, 504};
};

class RetryHandler {
public:
  explicit RetryHandler(const RetryConfig& config = RetryConfig());

  /**
   * Delay before retry number `retry_count` (0-based)
   */
  std::chrono::milliseconds getDelay(int retry_count);

  /**
   * True while `retry_count` retries have been made and budget remains
   */
  bool shouldRetry(int retry_count) const;

  int maxRetries() const { return config_.max_retries; }

  std::chrono::steady_clock::time_point nextRetryTime(int retry_count);

  bool isRetryableStatus(int http_status) const;

  /**
   * Transient S3 / transport error codes
   */
  static bool isRetryableError(const std::string& error_code);

  const RetryConfig& config() const { return config_; }

private:
  RetryConfig config_;
  std::mutex rng_mutex_;
  std::mt19937 rng_;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_RETRY_HANDLER_HPP
