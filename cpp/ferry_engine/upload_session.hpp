#ifndef FERRY_ENGINE_UPLOAD_SESSION_HPP
#define FERRY_ENGINE_UPLOAD_SESSION_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "engine_types.hpp"

namespace ferry {
namespace engine {

/**
 * A part the remote side has acknowledged
 */
struct CompletedPart {
  uint32_t part_number = 0;
  std::string etag;
  uint64_t size = 0;
  std::string checksum;  // base64, empty when no checksum was sent

  bool operator==(const CompletedPart& other) const {
    return part_number == other.part_number && etag == other.etag && size == other.size &&
           checksum == other.checksum;
  }
};

/**
 * Server-side multipart upload state for one PUT_OBJECT or COPY_OBJECT.
 *
 * Only the result aggregator adds completed parts; schedulers read
 * isCompleted() to avoid re-dispatching.
 */
class UploadSession {
public:
  UploadSession() = default;
  UploadSession(
    MetaRequestType type, std::string endpoint, std::string object_path, std::string upload_id,
    uint64_t part_size
  );

  MetaRequestType type() const { return type_; }
  const std::string& endpoint() const { return endpoint_; }
  const std::string& objectPath() const { return object_path_; }
  const std::string& uploadId() const { return upload_id_; }
  uint64_t partSize() const { return part_size_; }

  std::optional<uint64_t> objectSize() const { return object_size_; }
  void setObjectSize(uint64_t size) { object_size_ = size; }

  /**
   * Expected part count, 0 while a streamed body is still being read
   */
  uint32_t totalParts() const { return total_parts_; }
  void setTotalParts(uint32_t total) { total_parts_ = total; }

  ChecksumAlgorithm checksumAlgorithm() const { return checksum_algorithm_; }
  void setChecksumAlgorithm(ChecksumAlgorithm algorithm) { checksum_algorithm_ = algorithm; }

  bool isOpen() const { return !upload_id_.empty(); }

  /**
   * @throws std::logic_error if the part was already recorded
   */
  void addCompletedPart(const CompletedPart& part);

  bool isCompleted(uint32_t part_number) const;

  const std::map<uint32_t, CompletedPart>& completedParts() const { return completed_; }

  /**
   * Completed parts in ascending part-number order
   */
  std::vector<CompletedPart> orderedParts() const;

  size_t completedCount() const { return completed_.size(); }

  uint64_t completedBytes() const;

  /**
   * max(completed part number) + 1, or 1 when nothing completed
   */
  uint32_t nextPartNumber() const;

  bool operator==(const UploadSession& other) const;

private:
  MetaRequestType type_ = MetaRequestType::PUT_OBJECT;
  std::string endpoint_;
  std::string object_path_;
  std::string upload_id_;
  uint64_t part_size_ = 0;
  std::optional<uint64_t> object_size_;
  uint32_t total_parts_ = 0;
  ChecksumAlgorithm checksum_algorithm_ = ChecksumAlgorithm::NONE;
  std::map<uint32_t, CompletedPart> completed_;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_UPLOAD_SESSION_HPP
