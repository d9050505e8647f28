#ifndef FERRY_ENGINE_RESUME_TOKEN_HPP
#define FERRY_ENGINE_RESUME_TOKEN_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engine_errors.hpp"
#include "engine_types.hpp"
#include "upload_session.hpp"

namespace ferry {
namespace engine {

/**
 * Serializable snapshot of an interrupted multipart upload.
 *
 * The JSON form is versioned; tokens from an unknown version are rejected
 * rather than guessed at.
 */
struct ResumeToken {
  static constexpr int kVersion = 1;

  MetaRequestType type = MetaRequestType::PUT_OBJECT;
  std::string endpoint;
  std::string object_path;
  std::string upload_id;
  uint64_t part_size = 0;
  std::optional<uint64_t> object_size;
  uint32_t total_num_parts = 0;
  uint32_t next_part_number = 1;
  ChecksumAlgorithm checksum_algorithm = ChecksumAlgorithm::NONE;
  std::vector<CompletedPart> completed_parts;  // ascending part number

  std::string toJson() const;

  /**
   * @throws ResumeStateError for malformed or unsupported tokens
   */
  static ResumeToken fromJson(const std::string& json);

  bool operator==(const ResumeToken& other) const;
};

/**
 * A part as reported by ListParts
 */
struct ListedPart {
  uint32_t part_number = 0;
  std::string etag;
  uint64_t size = 0;
};

/**
 * Converts between live upload state and resume tokens, and checks tokens
 * against requests and the remote listing.
 */
class ResumeController {
public:
  static ResumeToken snapshot(const UploadSession& session);

  /**
   * @throws ResumeStateError if the token is internally inconsistent
   */
  static UploadSession restore(const ResumeToken& token);

  /**
   * Verify a token fits the request it is resubmitted with.
   *
   * @param body_size Size of the new body (or copy source); nullopt if unknown
   * @param planned_parts Part count the planner derives for body_size at token.part_size
   * @throws ResumeStateError on any mismatch
   */
  static void checkCompatible(
    const ResumeToken& token, MetaRequestType type, const std::string& object_path,
    std::optional<uint64_t> body_size, uint32_t planned_parts
  );

  /**
   * Compare token parts with a ListParts result. Every completed part in the
   * token must be listed with the same ETag.
   */
  static std::optional<ErrorInfo> validateListing(
    const ResumeToken& token, const std::vector<ListedPart>& listed
  );
};

/**
 * Strip surrounding quotes from an ETag
 */
std::string normalizeEtag(const std::string& etag);

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_RESUME_TOKEN_HPP
