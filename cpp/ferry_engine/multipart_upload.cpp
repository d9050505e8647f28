#include "meta_request_impl.hpp"

#define FERRY_LOG_COMPONENT "multipart_upload"
#include <ferry_log_macros.hpp>

#include "s3_request_factory.hpp"

namespace ferry {
namespace engine {

using logging::kv;

CompletedPredicate MultipartUploadMetaRequest::completedPredicate() {
  return [this](uint32_t part_number) {
    return aggregator_.isPartCompleted(part_number);
  };
}

void MultipartUploadMetaRequest::createSession(
  ChecksumAlgorithm algorithm, std::optional<uint64_t> object_size, uint32_t total_parts,
  uint64_t part_size, std::function<void()> then
) {
  OutgoingRequest outgoing;
  outgoing.operation = "CreateMultipartUpload";
  outgoing.request = S3RequestFactory::createMultipartUpload(options_.request, algorithm);
  // An UploadId minted after a cancel still has to be aborted
  outgoing.complete_when_cancelled = true;

  send(
    std::move(outgoing),
    [this, algorithm, object_size, total_parts, part_size, then](RequestOutcome& outcome) {
      auto upload_id = S3ResponseParser::uploadId(outcome.body);
      if (!upload_id) {
        fail(ErrorInfo::make(
          ErrorKind::REMOTE_SERVICE, "CreateMultipartUpload response has no UploadId", "",
          outcome.status
        ));
        return;
      }

      UploadSession session(
        options_.type, endpoint_.toString(), options_.request.objectPath(), *upload_id, part_size
      );
      if (object_size) {
        session.setObjectSize(*object_size);
      }
      session.setTotalParts(total_parts);
      session.setChecksumAlgorithm(algorithm);
      aggregator_.openSession(std::move(session));

      FERRY_LOG_INFO(
        "Opened multipart upload" << kv("upload_id", *upload_id)
                                  << kv("path", options_.request.objectPath())
                                  << kv("parts", total_parts) << kv("part_size", part_size)
      );
      if (cancelled()) {
        fail(cancelledError());
        return;
      }
      aggregator_.deliverHeaders(outcome.status, outcome.headers);
      then();
    }
  );
}

void MultipartUploadMetaRequest::resumeSession(std::function<void()> then) {
  restored_ = ResumeController::restore(*options_.resume_token);
  FERRY_LOG_INFO(
    "Resuming multipart upload" << kv("upload_id", restored_->uploadId())
                                << kv("completed_parts", restored_->completedCount())
                                << kv("next_part", restored_->nextPartNumber())
  );
  listParts(0, {}, std::move(then));
}

void MultipartUploadMetaRequest::listParts(
  uint32_t marker, std::vector<ListedPart> listed, std::function<void()> then
) {
  OutgoingRequest outgoing;
  outgoing.operation = "ListParts";
  outgoing.request =
    S3RequestFactory::listParts(restored_->objectPath(), restored_->uploadId(), marker);

  send(
    std::move(outgoing),
    [this, marker, listed, then](RequestOutcome& outcome) mutable {
      const ResumeToken& token = *options_.resume_token;

      if (!outcome.success) {
        ErrorInfo error = outcome.error;
        bool gone = outcome.status == 404 || error.error_code == "NoSuchUpload";
        MetaRequestResult result;
        if (gone) {
          error.kind = ErrorKind::RESUME_STATE;
          error.message = "Upload " + token.upload_id + " no longer exists: " + error.message;
          result = MetaRequestResult::Failure(error);
        } else {
          // The upload may still be valid; hand the token back for another attempt
          result = MetaRequestResult::Failure(error);
          result.resume_token = token;
        }
        FERRY_LOG_ERROR("Resume validation failed" << kv("error", error.describe()));
        finalize(std::move(result));
        return;
      }

      auto page = S3ResponseParser::listParts(outcome.body);
      if (!page) {
        MetaRequestResult result = MetaRequestResult::Failure(ErrorInfo::make(
          ErrorKind::REMOTE_SERVICE, "Malformed ListParts response", "", outcome.status
        ));
        result.resume_token = token;
        finalize(std::move(result));
        return;
      }
      listed.insert(listed.end(), page->parts.begin(), page->parts.end());

      if (page->is_truncated && page->next_part_number_marker > marker) {
        listParts(page->next_part_number_marker, std::move(listed), std::move(then));
        return;
      }

      if (auto error = ResumeController::validateListing(token, listed)) {
        FERRY_LOG_ERROR("Resume token does not match the upload" << kv("error", error->describe()));
        finalize(MetaRequestResult::Failure(*error));
        return;
      }

      uint64_t resumed_bytes = restored_->completedBytes();
      aggregator_.openSession(std::move(*restored_));
      restored_.reset();
      aggregator_.deliverHeaders(200, HttpHeaders());
      if (resumed_bytes > 0) {
        aggregator_.addProgress(resumed_bytes);
      }
      then();
    },
    true
  );
}

void MultipartUploadMetaRequest::uploadParts(std::unique_ptr<IPartSource> source) {
  runParts(
    std::move(source),
    [this](Part& part) {
      return buildPart(part);
    },
    [this](Part& part, RequestOutcome& outcome) {
      return acceptPart(part, outcome);
    },
    [this]() {
      beforeComplete();
      completeSession();
    }
  );
}

void MultipartUploadMetaRequest::completeSession() {
  auto self = shared_from_this();
  aggregator_.completeUpload(options_.request, [self, this](RequestOutcome outcome) {
    if (aggregator_.finished() || failing()) {
      return;
    }
    if (!outcome.success) {
      fail(outcome.error);
      return;
    }
    MetaRequestResult result = MetaRequestResult::Success(outcome.status, outcome.headers);
    result.etag = S3ResponseParser::resultEtag(outcome.body).value_or("");
    FERRY_LOG_INFO(
      "Completed multipart upload" << kv("upload_id", aggregator_.session().uploadId())
                                   << kv("etag", result.etag)
    );
    succeed(std::move(result));
  });
}

}  // namespace engine
}  // namespace ferry
