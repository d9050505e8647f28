#include "meta_request_impl.hpp"

#define FERRY_LOG_COMPONENT "copy_object"
#include <ferry_log_macros.hpp>

#include "s3_request_factory.hpp"

namespace ferry {
namespace engine {

using logging::kv;

void CopyObjectMetaRequest::begin() {
  OutgoingRequest outgoing;
  outgoing.operation = "HeadObject";
  outgoing.request = S3RequestFactory::headCopySource(options_.request);

  send(std::move(outgoing), [this](RequestOutcome& outcome) {
    auto size = contentLength(outcome.headers);
    if (!size) {
      fail(ErrorInfo::make(
        ErrorKind::REMOTE_SERVICE, "Copy source HEAD response has no Content-Length", "",
        outcome.status
      ));
      return;
    }
    onSourceSize(*size);
  });
}

void CopyObjectMetaRequest::onSourceSize(uint64_t source_size) {
  source_size_ = source_size;
  aggregator_.setTotalBytes(source_size);

  uint64_t part_size =
    options_.resume_token ? options_.resume_token->part_size : options_.part_size;
  plan_ = planner_->plan(
    MetaRequestType::COPY_OBJECT, options_.request, false, source_size, part_size
  );
  FERRY_LOG_DEBUG(
    "Planned copy" << kv("source_size", source_size) << kv("kind", toString(plan_.kind))
                   << kv("parts", plan_.parts.size())
  );

  auto copy_parts = [this]() {
    uploadParts(std::make_unique<RangePartSource>(plan_.parts, 1, completedPredicate()));
  };

  if (options_.resume_token) {
    try {
      ResumeController::checkCompatible(
        *options_.resume_token, MetaRequestType::COPY_OBJECT, options_.request.objectPath(),
        source_size, static_cast<uint32_t>(plan_.parts.size())
      );
    } catch (const ResumeStateError& e) {
      finalize(MetaRequestResult::Failure(ErrorInfo::make(ErrorKind::RESUME_STATE, e.what())));
      return;
    }
    resumeSession(copy_parts);
    return;
  }

  if (plan_.kind == PlanKind::SINGLE_PART) {
    copySingle();
    return;
  }
  createSession(
    ChecksumAlgorithm::NONE, source_size, static_cast<uint32_t>(plan_.parts.size()),
    plan_.part_size, copy_parts
  );
}

void CopyObjectMetaRequest::copySingle() {
  OutgoingRequest outgoing;
  outgoing.operation = "CopyObject";
  outgoing.request = options_.request;
  outgoing.check_embedded_error = true;

  send(std::move(outgoing), [this](RequestOutcome& outcome) {
    aggregator_.deliverHeaders(outcome.status, outcome.headers);
    aggregator_.addProgress(source_size_);
    MetaRequestResult result = MetaRequestResult::Success(outcome.status, outcome.headers);
    result.etag = S3ResponseParser::resultEtag(outcome.body).value_or("");
    succeed(std::move(result));
  });
}

OutgoingRequest CopyObjectMetaRequest::buildPart(Part& part) {
  OutgoingRequest outgoing;
  outgoing.operation = "UploadPartCopy";
  outgoing.part_number = part.part_number;
  outgoing.request = S3RequestFactory::uploadPartCopy(
    options_.request, part.part_number, aggregator_.session().uploadId(), part.range
  );
  outgoing.check_embedded_error = true;
  return outgoing;
}

std::optional<ErrorInfo> CopyObjectMetaRequest::acceptPart(Part& part, RequestOutcome& outcome) {
  auto etag = S3ResponseParser::resultEtag(outcome.body);
  if (!etag || etag->empty()) {
    return ErrorInfo::make(
      ErrorKind::REMOTE_SERVICE, "UploadPartCopy response has no ETag", "", outcome.status,
      part.part_number
    );
  }
  aggregator_.recordCompletedPart({part.part_number, *etag, part.range.length, ""});
  aggregator_.addProgress(part.range.length);
  return std::nullopt;
}

}  // namespace engine
}  // namespace ferry
