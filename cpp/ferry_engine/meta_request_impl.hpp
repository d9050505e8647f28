#ifndef FERRY_ENGINE_META_REQUEST_IMPL_HPP
#define FERRY_ENGINE_META_REQUEST_IMPL_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "meta_request.hpp"
#include "part_source.hpp"

namespace ferry {
namespace engine {

/**
 * Build the meta-request matching ctx.options.type
 */
std::shared_ptr<MetaRequest> createMetaRequest(MetaRequestContext ctx);

/**
 * Content-Length of a response, nullopt if absent or malformed
 */
std::optional<uint64_t> contentLength(const HttpHeaders& headers);

/**
 * DEFAULT: the original request, sent once
 */
class DefaultMetaRequest : public MetaRequest {
public:
  explicit DefaultMetaRequest(MetaRequestContext ctx)
      : MetaRequest(std::move(ctx)) {}

protected:
  void begin() override;
};

/**
 * GET_OBJECT split into ranged GETs.
 *
 * The object size comes from the first ranged GET (or a HEAD). Later ranges
 * carry If-Match with the first ETag so every part reads the same object
 * version. Body bytes reach the caller in offset order.
 */
class AutoRangedGetMetaRequest : public MetaRequest {
public:
  explicit AutoRangedGetMetaRequest(MetaRequestContext ctx)
      : MetaRequest(std::move(ctx)) {}

protected:
  void begin() override;

private:
  void passThrough();
  void discoverWithHead();
  void fetchFirstPart();
  void onFirstPart(RequestOutcome& outcome);
  void fetchWhole();
  void replanWithSize(uint64_t object_size);
  void fetchRanges(std::vector<ByteRange> ranges, uint32_t first_part_number);
  void onObjectHeaders(const HttpHeaders& headers, uint64_t object_size);
  void finishDownload();
  HttpRequest withChecksumMode(HttpRequest request) const;

  uint64_t object_size_ = 0;
  uint64_t first_span_ = 0;
  std::string etag_;
  HttpHeaders object_headers_;
};

/**
 * Upload session handling shared by PUT_OBJECT and COPY_OBJECT
 */
class MultipartUploadMetaRequest : public MetaRequest {
protected:
  explicit MultipartUploadMetaRequest(MetaRequestContext ctx)
      : MetaRequest(std::move(ctx)) {}

  /**
   * CreateMultipartUpload, then `then` with the session open
   */
  void createSession(
    ChecksumAlgorithm algorithm, std::optional<uint64_t> object_size, uint32_t total_parts,
    uint64_t part_size, std::function<void()> then
  );

  /**
   * Check the resume token against ListParts; the restored session is only
   * opened once the remote side confirmed it
   */
  void resumeSession(std::function<void()> then);

  void uploadParts(std::unique_ptr<IPartSource> source);

  CompletedPredicate completedPredicate();

  virtual OutgoingRequest buildPart(Part& part) = 0;
  virtual std::optional<ErrorInfo> acceptPart(Part& part, RequestOutcome& outcome) = 0;
  virtual void beforeComplete() {}

private:
  void listParts(
    uint32_t marker, std::vector<ListedPart> listed, std::function<void()> then
  );
  void completeSession();

  std::optional<UploadSession> restored_;
};

/**
 * PUT_OBJECT: single PUT, or an upload session with parts read from the body
 */
class AutoRangedPutMetaRequest : public MultipartUploadMetaRequest {
public:
  explicit AutoRangedPutMetaRequest(MetaRequestContext ctx)
      : MultipartUploadMetaRequest(std::move(ctx)) {}

protected:
  void begin() override;
  OutgoingRequest buildPart(Part& part) override;
  std::optional<ErrorInfo> acceptPart(Part& part, RequestOutcome& outcome) override;
  void beforeComplete() override;

private:
  void putSingle(std::string payload);
  std::optional<ErrorInfo> checkEcho(
    const HttpHeaders& headers, const std::string& sent, uint32_t part_number
  );

  ChecksumAlgorithm algorithm_ = ChecksumAlgorithm::NONE;
  StreamedPartSource* streamed_ = nullptr;
  std::unique_ptr<IPartSource> pending_source_;
};

/**
 * COPY_OBJECT: single CopyObject, or UploadPartCopy ranges of the source
 */
class CopyObjectMetaRequest : public MultipartUploadMetaRequest {
public:
  explicit CopyObjectMetaRequest(MetaRequestContext ctx)
      : MultipartUploadMetaRequest(std::move(ctx)) {}

protected:
  void begin() override;
  OutgoingRequest buildPart(Part& part) override;
  std::optional<ErrorInfo> acceptPart(Part& part, RequestOutcome& outcome) override;

private:
  void onSourceSize(uint64_t source_size);
  void copySingle();

  uint64_t source_size_ = 0;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_META_REQUEST_IMPL_HPP
