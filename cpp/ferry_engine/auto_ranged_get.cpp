#include "meta_request_impl.hpp"

#include <algorithm>

#define FERRY_LOG_COMPONENT "auto_ranged_get"
#include <ferry_log_macros.hpp>

#include "s3_request_factory.hpp"

namespace ferry {
namespace engine {

using logging::kv;

void AutoRangedGetMetaRequest::begin() {
  if (plan_.kind == PlanKind::PASS_THROUGH) {
    passThrough();
  } else if (config_.discover_size_with_head) {
    discoverWithHead();
  } else {
    fetchFirstPart();
  }
}

HttpRequest AutoRangedGetMetaRequest::withChecksumMode(HttpRequest request) const {
  if (options_.checksum.validatesResponse()) {
    request.headers.set("x-amz-checksum-mode", "ENABLED");
  }
  return request;
}

void AutoRangedGetMetaRequest::passThrough() {
  OutgoingRequest outgoing;
  outgoing.operation = "GetObject";
  outgoing.request = options_.request;

  send(
    std::move(outgoing),
    [this](RequestOutcome& outcome) {
      if (outcome.status != 0) {
        aggregator_.deliverHeaders(outcome.status, outcome.headers);
      }
      if (!outcome.success) {
        fail(outcome.error);
        return;
      }
      uint64_t size = outcome.body.size();
      aggregator_.setTotalBytes(size);
      aggregator_.acceptBody(0, std::move(outcome.body));
      aggregator_.addProgress(size);
      MetaRequestResult result = MetaRequestResult::Success(outcome.status, outcome.headers);
      result.etag = outcome.headers.get("ETag").value_or("");
      succeed(std::move(result));
    },
    true
  );
}

void AutoRangedGetMetaRequest::discoverWithHead() {
  OutgoingRequest outgoing;
  outgoing.operation = "HeadObject";
  outgoing.request = withChecksumMode(S3RequestFactory::headObject(options_.request));

  send(std::move(outgoing), [this](RequestOutcome& outcome) {
    auto size = contentLength(outcome.headers);
    if (!size) {
      fail(ErrorInfo::make(
        ErrorKind::REMOTE_SERVICE, "HeadObject response has no Content-Length", "",
        outcome.status
      ));
      return;
    }
    etag_ = outcome.headers.get("ETag").value_or("");
    onObjectHeaders(outcome.headers, *size);
    if (*size == 0) {
      finishDownload();
      return;
    }
    replanWithSize(*size);
    fetchRanges(plan_.parts, 1);
  });
}

void AutoRangedGetMetaRequest::fetchFirstPart() {
  // Large enough that an object under the multipart threshold arrives whole
  first_span_ = std::max(plan_.part_size, planner_->multipartThreshold(plan_.part_size));
  ByteRange first{0, first_span_};

  OutgoingRequest outgoing;
  outgoing.operation = "GetObject";
  outgoing.request = withChecksumMode(S3RequestFactory::rangedGet(options_.request, first, ""));
  outgoing.part_number = 1;
  // An empty object cannot satisfy any range
  outgoing.extra_success_statuses.insert(416);

  send(std::move(outgoing), [this](RequestOutcome& outcome) {
    onFirstPart(outcome);
  });
}

void AutoRangedGetMetaRequest::onFirstPart(RequestOutcome& outcome) {
  // 416 only comes back for an empty object; S3 refuses "bytes=0-N" on zero bytes
  if (outcome.status == 416) {
    FERRY_LOG_DEBUG("First range not satisfiable, fetching object without range");
    fetchWhole();
    return;
  }

  etag_ = outcome.headers.get("ETag").value_or("");

  if (outcome.status != 206) {
    // Range ignored: the whole object arrived in one response
    uint64_t size = outcome.body.size();
    onObjectHeaders(outcome.headers, size);
    replanWithSize(size);
    aggregator_.acceptBody(0, std::move(outcome.body));
    aggregator_.addProgress(size);
    finishDownload();
    return;
  }

  auto range = S3ResponseParser::contentRange(outcome.headers.get("Content-Range").value_or(""));
  if (!range) {
    fail(ErrorInfo::make(
      ErrorKind::REMOTE_SERVICE, "Ranged GET response has no valid Content-Range", "", 206, 1
    ));
    return;
  }

  onObjectHeaders(outcome.headers, range->total);
  replanWithSize(range->total);

  uint64_t expected = std::min(first_span_, range->total);
  if (outcome.body.size() != expected) {
    fail(ErrorInfo::make(
      ErrorKind::REMOTE_SERVICE,
      "Ranged GET returned " + std::to_string(outcome.body.size()) + " bytes, expected " +
        std::to_string(expected),
      "", 206, 1
    ));
    return;
  }
  aggregator_.acceptBody(0, std::move(outcome.body));
  aggregator_.addProgress(expected);

  if (expected >= object_size_) {
    finishDownload();
    return;
  }

  // Skip what the first response already covered; a planned range that
  // straddles its end keeps its part number and loses its head
  std::vector<ByteRange> remaining;
  uint32_t first_part_number = 0;
  for (size_t i = 0; i < plan_.parts.size(); ++i) {
    const ByteRange& planned = plan_.parts[i];
    if (planned.end() <= expected) {
      continue;
    }
    if (first_part_number == 0) {
      first_part_number = static_cast<uint32_t>(i + 1);
    }
    if (planned.offset < expected) {
      remaining.push_back({expected, planned.end() - expected});
    } else {
      remaining.push_back(planned);
    }
  }
  fetchRanges(std::move(remaining), first_part_number);
}

void AutoRangedGetMetaRequest::replanWithSize(uint64_t object_size) {
  plan_ = planner_->plan(
    MetaRequestType::GET_OBJECT, options_.request, false, object_size, options_.part_size
  );
  FERRY_LOG_DEBUG(
    "Object size known" << kv("object_size", object_size) << kv("plan", toString(plan_.kind))
                        << kv("part_size", plan_.part_size) << kv("parts", plan_.parts.size())
  );
}

void AutoRangedGetMetaRequest::fetchWhole() {
  OutgoingRequest outgoing;
  outgoing.operation = "GetObject";
  outgoing.request = withChecksumMode(S3RequestFactory::plainGet(options_.request));

  send(std::move(outgoing), [this](RequestOutcome& outcome) {
    etag_ = outcome.headers.get("ETag").value_or("");
    uint64_t size = outcome.body.size();
    onObjectHeaders(outcome.headers, size);
    aggregator_.acceptBody(0, std::move(outcome.body));
    aggregator_.addProgress(size);
    finishDownload();
  });
}

void AutoRangedGetMetaRequest::onObjectHeaders(const HttpHeaders& headers, uint64_t object_size) {
  object_size_ = object_size;
  object_headers_ = headers;
  object_headers_.remove("Content-Range");
  object_headers_.set("Content-Length", std::to_string(object_size));
  aggregator_.setTotalBytes(object_size);

  if (options_.checksum.validatesResponse()) {
    auto value = headers.get(checksumHeaderName(options_.checksum.algorithm));
    if (value) {
      aggregator_.expectObjectChecksum(options_.checksum.algorithm, *value);
    } else {
      FERRY_LOG_DEBUG(
        "Object has no stored checksum to validate"
        << kv("algorithm", toString(options_.checksum.algorithm))
      );
    }
  }

  aggregator_.deliverHeaders(200, object_headers_);
}

void AutoRangedGetMetaRequest::fetchRanges(
  std::vector<ByteRange> ranges, uint32_t first_part_number
) {
  FERRY_LOG_DEBUG(
    "Splitting download" << kv("object_size", object_size_) << kv("part_size", plan_.part_size)
                         << kv("ranges", ranges.size()) << kv("window", window_)
  );

  runParts(
    std::make_unique<RangePartSource>(std::move(ranges), first_part_number),
    [this](Part& part) {
      OutgoingRequest outgoing;
      outgoing.operation = "GetObject";
      // If-Match pins every later range to the first response's ETag so an
      // overwrite mid-download fails with 412 instead of mixing versions
      outgoing.request =
        withChecksumMode(S3RequestFactory::rangedGet(options_.request, part.range, etag_));
      outgoing.part_number = part.part_number;
      return outgoing;
    },
    [this](Part& part, RequestOutcome& outcome) -> std::optional<ErrorInfo> {
      if (outcome.body.size() != part.range.length) {
        return ErrorInfo::make(
          ErrorKind::REMOTE_SERVICE,
          "Ranged GET returned " + std::to_string(outcome.body.size()) + " bytes, expected " +
            std::to_string(part.range.length),
          "", outcome.status, part.part_number
        );
      }
      aggregator_.acceptBody(part.range.offset, std::move(outcome.body));
      aggregator_.addProgress(part.range.length);
      return std::nullopt;
    },
    [this]() {
      finishDownload();
    },
    [this]() {
      return aggregator_.bufferedParts() < 2 * window_;
    }
  );
}

void AutoRangedGetMetaRequest::finishDownload() {
  checksum_validation_ = aggregator_.finalizeObjectChecksum();
  if (checksum_validation_ == ChecksumValidation::FAILED) {
    fail(ErrorInfo::make(
      ErrorKind::CHECKSUM_MISMATCH, "Object checksum does not match the received body"
    ));
    return;
  }

  MetaRequestResult result = MetaRequestResult::Success(200, object_headers_);
  result.etag = etag_;
  succeed(std::move(result));
}

}  // namespace engine
}  // namespace ferry
