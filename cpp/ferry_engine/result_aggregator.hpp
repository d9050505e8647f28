#ifndef FERRY_ENGINE_RESULT_AGGREGATOR_HPP
#define FERRY_ENGINE_RESULT_AGGREGATOR_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "checksum.hpp"
#include "engine_errors.hpp"
#include "http_message.hpp"
#include "request_executor.hpp"
#include "resume_token.hpp"
#include "upload_session.hpp"

namespace ferry {
namespace engine {

enum class ChecksumValidation {
  NOT_VALIDATED,
  PASSED,
  FAILED
};

const char* toString(ChecksumValidation validation);

/**
 * Terminal outcome of a meta-request
 */
struct MetaRequestResult {
  bool success = false;
  int status = 0;
  HttpHeaders headers;
  ErrorInfo error;
  std::vector<ErrorInfo> part_errors;
  ChecksumValidation checksum_validation = ChecksumValidation::NOT_VALIDATED;
  std::optional<ResumeToken> resume_token;
  std::optional<ErrorInfo> abort_error;  // cleanup failure, never overrides the outcome
  std::string etag;
  uint64_t bytes_transferred = 0;

  static MetaRequestResult Success(int status, const HttpHeaders& headers) {
    MetaRequestResult result;
    result.success = true;
    result.status = status;
    result.headers = headers;
    return result;
  }

  static MetaRequestResult Failure(const ErrorInfo& error) {
    MetaRequestResult result;
    result.error = error;
    result.status = error.http_status;
    return result;
  }
};

/**
 * Caller callbacks. All run on the engine strand; none is required.
 */
struct ResponseHandler {
  std::function<void(int status, const HttpHeaders& headers)> on_headers;
  // Body bytes in strictly increasing offset order
  std::function<void(uint64_t offset, const char* data, size_t size)> on_body;
  std::function<void(uint64_t bytes_transferred, uint64_t total_bytes)> on_progress;
  std::function<void(const MetaRequestResult& result)> on_finished;
};

/**
 * Folds part outcomes into one logical result.
 *
 * Single writer of the upload session's completed-part list. Delivers the
 * headers notification once, body chunks in byte order, and exactly one
 * terminal callback.
 */
class ResultAggregator {
public:
  using Callback = std::function<void(RequestOutcome)>;

  ResultAggregator(ResponseHandler handler, std::shared_ptr<RequestExecutor> executor);

  /**
   * Forward the response headers; later calls are ignored
   */
  void deliverHeaders(int status, const HttpHeaders& headers);
  bool headersDelivered() const { return headers_delivered_; }

  /**
   * Validate the delivered body against a whole-object checksum
   */
  void expectObjectChecksum(ChecksumAlgorithm algorithm, const std::string& expected);
  bool validatingObject() const { return object_checksum_ != nullptr; }

  /**
   * Accept body bytes at `offset`. Contiguous bytes are delivered at once,
   * the rest are held until the gap before them is filled.
   */
  void acceptBody(uint64_t offset, std::string data);

  size_t bufferedParts() const { return pending_body_.size(); }
  uint64_t deliveredBytes() const { return next_offset_; }

  void setTotalBytes(uint64_t total) { total_bytes_ = total; }
  void addProgress(uint64_t bytes);
  uint64_t bytesTransferred() const { return bytes_transferred_; }

  void openSession(UploadSession session);
  bool hasSession() const { return session_.has_value(); }
  const UploadSession& session() const { return *session_; }
  UploadSession& mutableSession() { return *session_; }
  bool isPartCompleted(uint32_t part_number) const;

  /**
   * Record an acknowledged part. Returns false if it was already recorded.
   */
  bool recordCompletedPart(const CompletedPart& part);

  void recordPartError(const ErrorInfo& error) { part_errors_.push_back(error); }
  const std::vector<ErrorInfo>& partErrors() const { return part_errors_; }

  /**
   * CompleteMultipartUpload listing every completed part in ascending order
   */
  void completeUpload(const HttpRequest& original, Callback done);

  /**
   * AbortMultipartUpload for the open session
   */
  void abortUpload(Callback done);

  /**
   * Compare the accumulated whole-object checksum with the expected value
   */
  ChecksumValidation finalizeObjectChecksum();

  /**
   * Fill in part errors and byte counts, then deliver the terminal result.
   * Only the first call has any effect; later calls return false.
   */
  bool finish(MetaRequestResult& result);
  bool finished() const { return finished_; }

private:
  void deliver(uint64_t offset, const std::string& data);

  ResponseHandler handler_;
  std::shared_ptr<RequestExecutor> executor_;

  bool headers_delivered_ = false;
  bool finished_ = false;

  std::map<uint64_t, std::string> pending_body_;
  uint64_t next_offset_ = 0;

  std::unique_ptr<ChecksumStream> object_checksum_;
  std::string expected_object_checksum_;

  uint64_t bytes_transferred_ = 0;
  uint64_t total_bytes_ = 0;

  std::optional<UploadSession> session_;
  std::vector<ErrorInfo> part_errors_;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_RESULT_AGGREGATOR_HPP
