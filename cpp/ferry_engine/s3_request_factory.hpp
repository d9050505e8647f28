#ifndef FERRY_ENGINE_S3_REQUEST_FACTORY_HPP
#define FERRY_ENGINE_S3_REQUEST_FACTORY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engine_types.hpp"
#include "http_message.hpp"
#include "part.hpp"
#include "resume_token.hpp"
#include "upload_session.hpp"

namespace ferry {
namespace engine {

/**
 * Builds the physical S3 requests a meta-request fans out into.
 * Object paths are path-style ("/bucket/key") and already URI-encoded.
 */
class S3RequestFactory {
public:
  static HttpRequest headObject(const HttpRequest& original);

  /**
   * HEAD on the object named by the x-amz-copy-source header
   */
  static HttpRequest headCopySource(const HttpRequest& copy_request);

  /**
   * Ranged GET; `if_match` pins the object version seen by the first part
   */
  static HttpRequest rangedGet(
    const HttpRequest& original, const ByteRange& range, const std::string& if_match
  );

  /**
   * The original GET with any Range header removed
   */
  static HttpRequest plainGet(const HttpRequest& original);

  static HttpRequest createMultipartUpload(
    const HttpRequest& original, ChecksumAlgorithm algorithm
  );

  static HttpRequest uploadPart(
    const HttpRequest& original, uint32_t part_number, const std::string& upload_id
  );

  static HttpRequest uploadPartCopy(
    const HttpRequest& original, uint32_t part_number, const std::string& upload_id,
    const ByteRange& source_range
  );

  /**
   * @param body Receives the CompleteMultipartUpload XML document
   */
  static HttpRequest completeMultipartUpload(
    const HttpRequest& original, const std::string& upload_id,
    const std::vector<CompletedPart>& parts, ChecksumAlgorithm algorithm, std::string& body
  );

  static HttpRequest abortMultipartUpload(
    const std::string& object_path, const std::string& upload_id
  );

  static HttpRequest listParts(
    const std::string& object_path, const std::string& upload_id, uint32_t part_number_marker
  );

  /**
   * Attach a part checksum either as a header or as an aws-chunked trailer.
   * In trailer mode `body` is replaced by its aws-chunked encoding.
   */
  static void attachChecksum(
    HttpRequest& request, std::string& body, const ChecksumConfig& config,
    const std::string& checksum, uint64_t decoded_length
  );
};

/**
 * Error document returned by S3
 */
struct S3ErrorDetail {
  std::string code;
  std::string message;
};

/**
 * "Content-Range: bytes <first>-<last>/<total>"
 */
struct ContentRange {
  uint64_t first = 0;
  uint64_t last = 0;
  uint64_t total = 0;
};

struct ListPartsPage {
  std::vector<ListedPart> parts;
  bool is_truncated = false;
  uint32_t next_part_number_marker = 0;
};

/**
 * Parsers for S3 XML bodies and response headers.
 * All return nullopt when the input is not the expected document.
 */
class S3ResponseParser {
public:
  static std::optional<std::string> uploadId(const std::string& xml);

  static std::optional<S3ErrorDetail> error(const std::string& xml);

  static std::optional<ContentRange> contentRange(const std::string& header);

  /**
   * ETag from CopyPartResult / CopyObjectResult / CompleteMultipartUploadResult
   */
  static std::optional<std::string> resultEtag(const std::string& xml);

  static std::optional<ListPartsPage> listParts(const std::string& xml);

  /**
   * A 200 response whose body is an <Error> document (CompleteMultipartUpload
   * and CopyObject can fail this way)
   */
  static std::optional<S3ErrorDetail> embeddedError(const std::string& xml);
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_S3_REQUEST_FACTORY_HPP
