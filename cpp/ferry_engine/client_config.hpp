#ifndef FERRY_ENGINE_CLIENT_CONFIG_HPP
#define FERRY_ENGINE_CLIENT_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "http_message.hpp"
#include "retry_handler.hpp"

namespace ferry {
namespace engine {

constexpr uint64_t kMiB = 1024ULL * 1024ULL;
constexpr uint64_t kGiB = 1024ULL * kMiB;

// S3 multipart limits
constexpr uint64_t kMinUploadPartSize = 5 * kMiB;
constexpr uint64_t kMaxUploadPartSize = 5 * kGiB;
constexpr uint32_t kMaxUploadParts = 10000;

// Window growth when the pool hands out multiplexed connections
constexpr size_t kHttp2StreamMultiplier = 4;

/**
 * Engine settings shared by every meta-request of one S3Client
 */
struct ClientConfig {
  Endpoint endpoint;

  uint64_t part_size = 8 * kMiB;
  uint64_t multipart_threshold = 0;  // 0: same as part_size
  uint64_t min_final_part_size = 1 * kMiB;
  uint32_t max_parts = kMaxUploadParts;

  size_t max_concurrency = 0;  // 0: derived from the connection pool
  std::chrono::milliseconds part_timeout{0};  // 0: no per-part timeout

  // Discover GET sizes with a HEAD instead of the first ranged GET
  bool discover_size_with_head = false;

  RetryConfig retry;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_CLIENT_CONFIG_HPP
