#ifndef FERRY_ENGINE_CHECKSUM_HPP
#define FERRY_ENGINE_CHECKSUM_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "aws_api_guard.hpp"
#include "engine_types.hpp"

namespace Aws {
namespace Utils {
namespace Crypto {
class Hash;
}  // namespace Crypto
}  // namespace Utils
}  // namespace Aws

namespace ferry {
namespace engine {

/**
 * Incremental checksum over a byte stream, backed by the SDK hash classes.
 * finalize() yields the base64 digest S3 expects in x-amz-checksum-* fields.
 */
class ChecksumStream {
public:
  /**
   * @throws std::invalid_argument for ChecksumAlgorithm::NONE
   */
  explicit ChecksumStream(ChecksumAlgorithm algorithm);
  ~ChecksumStream();

  ChecksumStream(const ChecksumStream&) = delete;
  ChecksumStream& operator=(const ChecksumStream&) = delete;

  void update(const char* data, size_t size);
  void update(const std::string& data) { update(data.data(), data.size()); }

  /**
   * Digest of everything fed so far. Further updates are rejected.
   */
  std::string finalize();

  ChecksumAlgorithm algorithm() const { return algorithm_; }
  uint64_t bytesHashed() const { return bytes_; }

private:
  AwsApiGuard sdk_;
  ChecksumAlgorithm algorithm_;
  std::shared_ptr<Aws::Utils::Crypto::Hash> hash_;
  std::optional<std::string> digest_;
  uint64_t bytes_ = 0;
};

/**
 * Start a checksum stream, or nullptr for NONE
 */
std::unique_ptr<ChecksumStream> startChecksum(ChecksumAlgorithm algorithm);

std::string computeChecksum(ChecksumAlgorithm algorithm, const std::string& data);

/**
 * Exact comparison of two encoded checksums; empty values never match
 */
bool verifyChecksum(const std::string& expected, const std::string& actual);

/**
 * "x-amz-checksum-crc32" etc.; empty for NONE
 */
std::string checksumHeaderName(ChecksumAlgorithm algorithm);

/**
 * Multipart objects report "<digest>-<parts>", which cannot be recomputed
 * from the object bytes.
 */
bool isCompositeChecksum(const std::string& value);

/**
 * Encode a payload as a single aws-chunked chunk followed by the checksum
 * trailer: "<hex size>\r\n<data>\r\n0\r\n<header>:<value>\r\n\r\n".
 */
std::string encodeAwsChunked(
  const std::string& payload, ChecksumAlgorithm algorithm, const std::string& checksum
);

struct AwsChunkedBody {
  std::string payload;
  std::string trailer_name;
  std::string trailer_value;
};

/**
 * Inverse of encodeAwsChunked, accepting any number of data chunks.
 * Returns nullopt when the framing is malformed.
 */
std::optional<AwsChunkedBody> decodeAwsChunked(const std::string& encoded);

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_CHECKSUM_HPP
