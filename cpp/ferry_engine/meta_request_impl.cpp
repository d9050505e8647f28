#include "meta_request_impl.hpp"

#include <cerrno>
#include <cstdlib>

#define FERRY_LOG_COMPONENT "meta_request"
#include <ferry_log_macros.hpp>

#include "s3_request_factory.hpp"

namespace ferry {
namespace engine {

using logging::kv;

std::shared_ptr<MetaRequest> createMetaRequest(MetaRequestContext ctx) {
  switch (ctx.options.type) {
    case MetaRequestType::DEFAULT:
      return std::make_shared<DefaultMetaRequest>(std::move(ctx));
    case MetaRequestType::GET_OBJECT:
      return std::make_shared<AutoRangedGetMetaRequest>(std::move(ctx));
    case MetaRequestType::PUT_OBJECT:
      return std::make_shared<AutoRangedPutMetaRequest>(std::move(ctx));
    case MetaRequestType::COPY_OBJECT:
      return std::make_shared<CopyObjectMetaRequest>(std::move(ctx));
  }
  throw UnknownVariantError("MetaRequestType", static_cast<int>(ctx.options.type));
}

std::optional<uint64_t> contentLength(const HttpHeaders& headers) {
  auto value = headers.get("Content-Length");
  if (!value || value->empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long parsed = std::strtoull(value->c_str(), &end, 10);
  if (errno != 0 || end == value->c_str() || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<uint64_t>(parsed);
}

void DefaultMetaRequest::begin() {
  OutgoingRequest outgoing;
  outgoing.operation = options_.request.method;
  outgoing.request = options_.request;

  if (body_) {
    std::string payload = readAll(*body_);
    uint64_t size = payload.size();
    aggregator_.setTotalBytes(size);
    if (options_.checksum.attachToUpload()) {
      std::string checksum = computeChecksum(options_.checksum.algorithm, payload);
      S3RequestFactory::attachChecksum(outgoing.request, payload, options_.checksum, checksum, size);
    }
    outgoing.body = std::make_shared<const std::string>(std::move(payload));
  }

  send(
    std::move(outgoing),
    [this](RequestOutcome& outcome) {
      if (outcome.status != 0) {
        aggregator_.deliverHeaders(outcome.status, outcome.headers);
        aggregator_.acceptBody(0, std::move(outcome.body));
      }
      if (!outcome.success) {
        fail(outcome.error);
        return;
      }
      aggregator_.addProgress(aggregator_.deliveredBytes());
      MetaRequestResult result = MetaRequestResult::Success(outcome.status, outcome.headers);
      result.etag = outcome.headers.get("ETag").value_or("");
      succeed(std::move(result));
    },
    true
  );
}

}  // namespace engine
}  // namespace ferry
