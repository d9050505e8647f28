#ifndef FERRY_ENGINE_TYPES_HPP
#define FERRY_ENGINE_TYPES_HPP

#include <string>

namespace ferry {
namespace engine {

/**
 * Logical S3 operation. Values are the wire integers of the binding API.
 */
enum class MetaRequestType {
  DEFAULT = 0,
  GET_OBJECT = 1,
  PUT_OBJECT = 2,
  COPY_OBJECT = 3
};

enum class ChecksumAlgorithm {
  NONE = 0,
  CRC32C = 1,
  CRC32 = 2,
  SHA1 = 3,
  SHA256 = 4
};

enum class ChecksumLocation {
  NONE = 0,
  HEADER = 1,
  TRAILER = 2
};

enum class HttpProtocolVersion {
  HTTP_1_0 = 1,
  HTTP_1_1 = 2,
  HTTP_2 = 3
};

/**
 * Checksum settings for one meta-request.
 * With algorithm NONE nothing is computed and validate_response is ignored.
 */
struct ChecksumConfig {
  ChecksumAlgorithm algorithm = ChecksumAlgorithm::NONE;
  ChecksumLocation location = ChecksumLocation::HEADER;
  bool validate_response = false;

  bool enabled() const { return algorithm != ChecksumAlgorithm::NONE; }

  bool attachToUpload() const { return enabled() && location != ChecksumLocation::NONE; }

  bool validatesResponse() const { return enabled() && validate_response; }
};

// Reverse lookups throw UnknownVariantError for unmapped integers
MetaRequestType metaRequestTypeFromInt(int value);
ChecksumAlgorithm checksumAlgorithmFromInt(int value);
ChecksumLocation checksumLocationFromInt(int value);
HttpProtocolVersion httpProtocolVersionFromInt(int value);

const char* toString(MetaRequestType type);
const char* toString(ChecksumAlgorithm algorithm);
const char* toString(ChecksumLocation location);
const char* toString(HttpProtocolVersion version);

/**
 * Parse "crc32", "CRC32C", "sha256"... (case-insensitive)
 * @throws std::invalid_argument for unknown names
 */
ChecksumAlgorithm checksumAlgorithmFromName(const std::string& name);

/**
 * Parse "none", "header", "trailer" (case-insensitive)
 * @throws std::invalid_argument for unknown names
 */
ChecksumLocation checksumLocationFromName(const std::string& name);

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_TYPES_HPP
