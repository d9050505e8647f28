#include "retry_handler.hpp"

#include <algorithm>
#include <cmath>

namespace ferry {
namespace engine {

RetryHandler::RetryHandler(const RetryConfig& config)
    : config_(config)
    , rng_(std::random_device{}()) {}

std::chrono::milliseconds RetryHandler::getDelay(int retry_count) {
  double base = static_cast<double>(config_.initial_delay.count());
  double cap = static_cast<double>(config_.max_delay.count());
  double exponent = static_cast<double>(std::max(0, retry_count));

  double delay = std::min(base * std::pow(config_.exponential_base, exponent), cap);

  if (config_.jitter && config_.jitter_factor > 0.0) {
    double factor = std::min(config_.jitter_factor, 1.0);
    std::uniform_real_distribution<double> dist(1.0 - factor, 1.0 + factor);
    std::lock_guard<std::mutex> lock(rng_mutex_);
    delay *= dist(rng_);
  }

  return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}

bool RetryHandler::shouldRetry(int retry_count) const {
  return retry_count < config_.max_retries;
}

std::chrono::steady_clock::time_point RetryHandler::nextRetryTime(int retry_count) {
  return std::chrono::steady_clock::now() + getDelay(retry_count);
}

bool RetryHandler::isRetryableStatus(int http_status) const {
  return config_.retryable_statuses.count(http_status) > 0;
}

bool RetryHandler::isRetryableError(const std::string& error_code) {
  static const std::set<std::string> kRetryable = {
    "RequestTimeout",
    "ServiceUnavailable",
    "InternalError",
    "SlowDown",
    "Throttling",
    "ThrottlingException",
    "RequestTimeTooSkewed",
    "ConnectionTimeout",
    "NetworkingError",
  };
  return kRetryable.count(error_code) > 0;
}

}  // namespace engine
}  // namespace ferry
