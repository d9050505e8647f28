#ifndef FERRY_ENGINE_PART_HPP
#define FERRY_ENGINE_PART_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "checksum.hpp"
#include "engine_types.hpp"

namespace ferry {
namespace engine {

enum class PartStatus {
  PENDING,
  IN_FLIGHT,
  SUCCEEDED,
  FAILED
};

const char* toString(PartStatus status);

/**
 * Half-open byte range [offset, offset + length)
 */
struct ByteRange {
  uint64_t offset = 0;
  uint64_t length = 0;

  uint64_t end() const { return offset + length; }

  /**
   * Inclusive HTTP form: "bytes=first-last"
   */
  std::string toHeader() const;

  bool operator==(const ByteRange& other) const {
    return offset == other.offset && length == other.length;
  }
};

/**
 * One physical request of a meta-request.
 *
 * Parts carrying a payload (PUT) own their bytes; ranged parts (GET, COPY)
 * only describe the range.
 */
struct Part {
  uint32_t part_number = 0;  // 1-based
  ByteRange range;
  std::shared_ptr<const std::string> payload;
  PartStatus status = PartStatus::PENDING;
  int attempts = 0;
  std::string etag;

  /**
   * Checksum over the payload, computed on first use and cached.
   * Returns an empty string for NONE.
   */
  const std::string& checksum(ChecksumAlgorithm algorithm);

  bool hasChecksum() const { return checksum_.has_value(); }

private:
  std::optional<std::string> checksum_;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_PART_HPP
