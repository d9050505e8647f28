#include "upload_session.hpp"

#include <stdexcept>

namespace ferry {
namespace engine {

UploadSession::UploadSession(
  MetaRequestType type, std::string endpoint, std::string object_path, std::string upload_id,
  uint64_t part_size
)
    : type_(type)
    , endpoint_(std::move(endpoint))
    , object_path_(std::move(object_path))
    , upload_id_(std::move(upload_id))
    , part_size_(part_size) {}

void UploadSession::addCompletedPart(const CompletedPart& part) {
  if (part.part_number == 0) {
    throw std::logic_error("Part numbers start at 1");
  }
  auto inserted = completed_.emplace(part.part_number, part);
  if (!inserted.second) {
    throw std::logic_error("Part " + std::to_string(part.part_number) + " already completed");
  }
}

bool UploadSession::isCompleted(uint32_t part_number) const {
  return completed_.count(part_number) > 0;
}

std::vector<CompletedPart> UploadSession::orderedParts() const {
  std::vector<CompletedPart> parts;
  parts.reserve(completed_.size());
  for (const auto& entry : completed_) {
    parts.push_back(entry.second);
  }
  return parts;
}

uint64_t UploadSession::completedBytes() const {
  uint64_t total = 0;
  for (const auto& entry : completed_) {
    total += entry.second.size;
  }
  return total;
}

uint32_t UploadSession::nextPartNumber() const {
  return completed_.empty() ? 1 : completed_.rbegin()->first + 1;
}

bool UploadSession::operator==(const UploadSession& other) const {
  return type_ == other.type_ && endpoint_ == other.endpoint_ &&
         object_path_ == other.object_path_ && upload_id_ == other.upload_id_ &&
         part_size_ == other.part_size_ && object_size_ == other.object_size_ &&
         total_parts_ == other.total_parts_ && checksum_algorithm_ == other.checksum_algorithm_ &&
         completed_ == other.completed_;
}

}  // namespace engine
}  // namespace ferry
