#include "meta_request_impl.hpp"

#define FERRY_LOG_COMPONENT "auto_ranged_put"
#include <ferry_log_macros.hpp>

#include "s3_request_factory.hpp"

namespace ferry {
namespace engine {

using logging::kv;

void AutoRangedPutMetaRequest::begin() {
  algorithm_ =
    options_.checksum.attachToUpload() ? options_.checksum.algorithm : ChecksumAlgorithm::NONE;
  aggregator_.setTotalBytes(body_->size().value_or(0));

  if (options_.resume_token) {
    resumeSession([this]() {
      uploadParts(std::make_unique<UploadPartSource>(*body_, plan_.parts, completedPredicate()));
    });
    return;
  }

  switch (plan_.kind) {
    case PlanKind::SINGLE_PART:
      putSingle(readAll(*body_));
      return;

    case PlanKind::MULTIPART:
      createSession(
        algorithm_, plan_.object_size, static_cast<uint32_t>(plan_.parts.size()), plan_.part_size,
        [this]() {
          uploadParts(
            std::make_unique<UploadPartSource>(*body_, plan_.parts, completedPredicate())
          );
        }
      );
      return;

    case PlanKind::STREAMED: {
      auto streamed = std::make_unique<StreamedPartSource>(
        *body_, plan_.part_size, config_.min_final_part_size
      );
      if (streamed->singlePart()) {
        auto part = streamed->nextPart();
        putSingle(part ? *part->payload : std::string());
        return;
      }
      streamed_ = streamed.get();
      pending_source_ = std::move(streamed);
      createSession(algorithm_, std::nullopt, 0, plan_.part_size, [this]() {
        uploadParts(std::move(pending_source_));
      });
      return;
    }

    case PlanKind::PASS_THROUGH:
    case PlanKind::DISCOVER_SIZE:
      break;
  }
  throw PlanningError(std::string("Unexpected upload plan: ") + toString(plan_.kind));
}

void AutoRangedPutMetaRequest::putSingle(std::string payload) {
  uint64_t size = payload.size();
  aggregator_.setTotalBytes(size);

  OutgoingRequest outgoing;
  outgoing.operation = "PutObject";
  outgoing.request = options_.request;
  std::string checksum;
  if (algorithm_ != ChecksumAlgorithm::NONE) {
    checksum = computeChecksum(algorithm_, payload);
    S3RequestFactory::attachChecksum(outgoing.request, payload, options_.checksum, checksum, size);
  }
  outgoing.body = std::make_shared<const std::string>(std::move(payload));

  send(std::move(outgoing), [this, checksum, size](RequestOutcome& outcome) {
    aggregator_.deliverHeaders(outcome.status, outcome.headers);
    if (auto error = checkEcho(outcome.headers, checksum, 0)) {
      fail(*error);
      return;
    }
    aggregator_.addProgress(size);
    MetaRequestResult result = MetaRequestResult::Success(outcome.status, outcome.headers);
    result.etag = outcome.headers.get("ETag").value_or("");
    succeed(std::move(result));
  });
}

OutgoingRequest AutoRangedPutMetaRequest::buildPart(Part& part) {
  OutgoingRequest outgoing;
  outgoing.operation = "UploadPart";
  outgoing.part_number = part.part_number;
  outgoing.request = S3RequestFactory::uploadPart(
    options_.request, part.part_number, aggregator_.session().uploadId()
  );

  if (algorithm_ == ChecksumAlgorithm::NONE) {
    outgoing.body = part.payload;
    return outgoing;
  }

  const std::string& checksum = part.checksum(algorithm_);
  if (options_.checksum.location == ChecksumLocation::TRAILER) {
    std::string body = *part.payload;
    S3RequestFactory::attachChecksum(
      outgoing.request, body, options_.checksum, checksum, part.payload->size()
    );
    outgoing.body = std::make_shared<const std::string>(std::move(body));
  } else {
    std::string unused;
    S3RequestFactory::attachChecksum(
      outgoing.request, unused, options_.checksum, checksum, part.payload->size()
    );
    outgoing.body = part.payload;
  }
  return outgoing;
}

std::optional<ErrorInfo> AutoRangedPutMetaRequest::acceptPart(
  Part& part, RequestOutcome& outcome
) {
  auto etag = outcome.headers.get("ETag");
  if (!etag || etag->empty()) {
    return ErrorInfo::make(
      ErrorKind::REMOTE_SERVICE, "UploadPart response has no ETag", "", outcome.status,
      part.part_number
    );
  }

  std::string checksum =
    algorithm_ != ChecksumAlgorithm::NONE ? part.checksum(algorithm_) : std::string();
  if (auto error = checkEcho(outcome.headers, checksum, part.part_number)) {
    return error;
  }

  aggregator_.recordCompletedPart({part.part_number, *etag, part.range.length, checksum});
  aggregator_.addProgress(part.range.length);
  part.payload.reset();
  return std::nullopt;
}

std::optional<ErrorInfo> AutoRangedPutMetaRequest::checkEcho(
  const HttpHeaders& headers, const std::string& sent, uint32_t part_number
) {
  if (!options_.checksum.validatesResponse() || sent.empty()) {
    return std::nullopt;
  }
  auto echoed = headers.get(checksumHeaderName(options_.checksum.algorithm));
  if (!echoed) {
    return std::nullopt;
  }
  if (!verifyChecksum(sent, *echoed)) {
    checksum_validation_ = ChecksumValidation::FAILED;
    FERRY_LOG_ERROR(
      "Checksum echoed by the service does not match" << kv("part", part_number)
                                                      << kv("sent", sent)
                                                      << kv("echoed", *echoed)
    );
    return ErrorInfo::make(
      ErrorKind::CHECKSUM_MISMATCH, "Service checksum does not match the uploaded bytes", "", 0,
      part_number
    );
  }
  if (checksum_validation_ == ChecksumValidation::NOT_VALIDATED) {
    checksum_validation_ = ChecksumValidation::PASSED;
  }
  return std::nullopt;
}

void AutoRangedPutMetaRequest::beforeComplete() {
  if (!streamed_) {
    return;
  }
  UploadSession& session = aggregator_.mutableSession();
  session.setTotalParts(streamed_->partsProduced());
  session.setObjectSize(streamed_->bytesProduced());
  FERRY_LOG_DEBUG(
    "Streamed body fully read" << kv("parts", streamed_->partsProduced())
                               << kv("bytes", streamed_->bytesProduced())
  );
}

}  // namespace engine
}  // namespace ferry
