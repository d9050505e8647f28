#include "part.hpp"

namespace ferry {
namespace engine {

const char* toString(PartStatus status) {
  switch (status) {
    case PartStatus::PENDING:
      return "PENDING";
    case PartStatus::IN_FLIGHT:
      return "IN_FLIGHT";
    case PartStatus::SUCCEEDED:
      return "SUCCEEDED";
    case PartStatus::FAILED:
      return "FAILED";
  }
  return "UNKNOWN";
}

std::string ByteRange::toHeader() const {
  if (length == 0) {
    return "bytes=" + std::to_string(offset) + "-";
  }
  return "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1);
}

const std::string& Part::checksum(ChecksumAlgorithm algorithm) {
  if (!checksum_) {
    if (algorithm == ChecksumAlgorithm::NONE) {
      checksum_ = std::string();
    } else {
      checksum_ = computeChecksum(algorithm, payload ? *payload : std::string());
    }
  }
  return *checksum_;
}

}  // namespace engine
}  // namespace ferry
