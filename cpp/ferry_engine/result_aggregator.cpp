#include "result_aggregator.hpp"

#define FERRY_LOG_COMPONENT "result_aggregator"
#include <ferry_log_macros.hpp>

#include "s3_request_factory.hpp"

namespace ferry {
namespace engine {

using logging::kv;

const char* toString(ChecksumValidation validation) {
  switch (validation) {
    case ChecksumValidation::NOT_VALIDATED:
      return "NOT_VALIDATED";
    case ChecksumValidation::PASSED:
      return "PASSED";
    case ChecksumValidation::FAILED:
      return "FAILED";
  }
  return "UNKNOWN";
}

ResultAggregator::ResultAggregator(
  ResponseHandler handler, std::shared_ptr<RequestExecutor> executor
)
    : handler_(std::move(handler))
    , executor_(std::move(executor)) {}

void ResultAggregator::deliverHeaders(int status, const HttpHeaders& headers) {
  if (headers_delivered_ || finished_) {
    return;
  }
  headers_delivered_ = true;
  if (handler_.on_headers) {
    handler_.on_headers(status, headers);
  }
}

void ResultAggregator::expectObjectChecksum(
  ChecksumAlgorithm algorithm, const std::string& expected
) {
  if (algorithm == ChecksumAlgorithm::NONE || expected.empty()) {
    return;
  }
  if (isCompositeChecksum(expected)) {
    FERRY_LOG_DEBUG("Skipping validation of composite checksum" << kv("value", expected));
    return;
  }
  if (next_offset_ > 0) {
    FERRY_LOG_WARN("Object checksum announced after body delivery started; not validating");
    return;
  }
  object_checksum_ = startChecksum(algorithm);
  expected_object_checksum_ = expected;
}

void ResultAggregator::acceptBody(uint64_t offset, std::string data) {
  if (finished_) {
    return;
  }
  if (offset != next_offset_) {
    pending_body_.emplace(offset, std::move(data));
    return;
  }

  deliver(offset, data);
  auto it = pending_body_.begin();
  while (it != pending_body_.end() && it->first == next_offset_) {
    deliver(it->first, it->second);
    it = pending_body_.erase(it);
  }
}

void ResultAggregator::deliver(uint64_t offset, const std::string& data) {
  if (object_checksum_) {
    object_checksum_->update(data);
  }
  next_offset_ = offset + data.size();
  if (handler_.on_body && !data.empty()) {
    handler_.on_body(offset, data.data(), data.size());
  }
}

void ResultAggregator::addProgress(uint64_t bytes) {
  bytes_transferred_ += bytes;
  if (handler_.on_progress) {
    handler_.on_progress(bytes_transferred_, total_bytes_);
  }
}

void ResultAggregator::openSession(UploadSession session) {
  session_ = std::move(session);
}

bool ResultAggregator::isPartCompleted(uint32_t part_number) const {
  return session_ && session_->isCompleted(part_number);
}

bool ResultAggregator::recordCompletedPart(const CompletedPart& part) {
  if (!session_ || session_->isCompleted(part.part_number)) {
    return false;
  }
  session_->addCompletedPart(part);
  return true;
}

void ResultAggregator::completeUpload(const HttpRequest& original, Callback done) {
  OutgoingRequest outgoing;
  outgoing.operation = "CompleteMultipartUpload";
  std::string body;
  outgoing.request = S3RequestFactory::completeMultipartUpload(
    original, session_->uploadId(), session_->orderedParts(), session_->checksumAlgorithm(), body
  );
  outgoing.body = std::make_shared<const std::string>(std::move(body));
  outgoing.check_embedded_error = true;

  FERRY_LOG_INFO(
    "Completing multipart upload" << kv("upload_id", session_->uploadId())
                                  << kv("parts", session_->completedCount())
  );
  executor_->execute(std::move(outgoing), std::move(done));
}

void ResultAggregator::abortUpload(Callback done) {
  OutgoingRequest outgoing;
  outgoing.operation = "AbortMultipartUpload";
  outgoing.request =
    S3RequestFactory::abortMultipartUpload(session_->objectPath(), session_->uploadId());

  FERRY_LOG_INFO("Aborting multipart upload" << kv("upload_id", session_->uploadId()));
  executor_->execute(std::move(outgoing), std::move(done));
}

ChecksumValidation ResultAggregator::finalizeObjectChecksum() {
  if (!object_checksum_) {
    return ChecksumValidation::NOT_VALIDATED;
  }
  std::string actual = object_checksum_->finalize();
  if (verifyChecksum(expected_object_checksum_, actual)) {
    return ChecksumValidation::PASSED;
  }
  FERRY_LOG_ERROR(
    "Object checksum mismatch" << kv("expected", expected_object_checksum_)
                               << kv("actual", actual)
  );
  return ChecksumValidation::FAILED;
}

bool ResultAggregator::finish(MetaRequestResult& result) {
  if (finished_) {
    return false;
  }
  finished_ = true;
  pending_body_.clear();
  if (result.part_errors.empty()) {
    result.part_errors = part_errors_;
  }
  if (result.bytes_transferred == 0) {
    result.bytes_transferred = bytes_transferred_;
  }
  if (handler_.on_finished) {
    handler_.on_finished(result);
  }
  return true;
}

}  // namespace engine
}  // namespace ferry
