#include "s3_client.hpp"

#include <boost/asio/strand.hpp>

#include <algorithm>
#include <stdexcept>

#define FERRY_LOG_COMPONENT "s3_client"
#include <ferry_log_macros.hpp>

#include "file_interfaces_impl.hpp"
#include "meta_request_impl.hpp"

namespace ferry {
namespace engine {

using logging::kv;

S3Client::S3Client(
  const ClientConfig& config, std::shared_ptr<IConnectionProvider> provider,
  std::shared_ptr<ISigner> signer
)
    : S3Client(
        config, std::move(provider), std::move(signer), std::make_shared<FileSystemImpl>(),
        std::make_shared<FileStreamFactoryImpl>()
      ) {}

S3Client::S3Client(
  const ClientConfig& config, std::shared_ptr<IConnectionProvider> provider,
  std::shared_ptr<ISigner> signer, std::shared_ptr<IFileSystem> filesystem,
  std::shared_ptr<IFileStreamFactory> stream_factory
)
    : config_(config)
    , planner_(std::make_shared<MetaRequestPlanner>(config))
    , provider_(std::move(provider))
    , signer_(signer ? std::move(signer) : std::make_shared<NoopSigner>())
    , filesystem_(std::move(filesystem))
    , stream_factory_(std::move(stream_factory)) {
  if (!provider_) {
    throw std::invalid_argument("S3Client requires a connection provider");
  }
  FERRY_LOG_INFO(
    "S3 client created" << kv("endpoint", config_.endpoint.toString())
                        << kv("part_size", config_.part_size)
                        << kv("window", defaultConcurrency())
  );
}

S3Client::~S3Client() = default;

size_t S3Client::defaultConcurrency() const {
  if (config_.max_concurrency > 0) {
    return config_.max_concurrency;
  }
  return std::max<size_t>(1, provider_->maxConnections());
}

std::shared_ptr<MetaRequest> S3Client::makeMetaRequest(MetaRequestOptions options) {
  MetaRequestContext ctx;
  ctx.config = config_;
  ctx.planner = planner_;
  ctx.endpoint = options.endpoint ? *options.endpoint : config_.endpoint;
  if (ctx.endpoint.host.empty()) {
    throw PlanningError("Meta request has no endpoint");
  }

  if (options.resume_token) {
    if (options.type != MetaRequestType::PUT_OBJECT &&
        options.type != MetaRequestType::COPY_OBJECT) {
      throw ResumeStateError(
        std::string("Resume tokens apply to uploads only, not ") + toString(options.type)
      );
    }
    // Parts must line up with the ones already uploaded
    options.part_size = options.resume_token->part_size;
  }

  ctx.body = makeBodySource(
    options.body_file_path, options.body_stream, *filesystem_, *stream_factory_
  );
  std::optional<uint64_t> body_size = ctx.body ? ctx.body->size() : std::nullopt;

  // Copy sizes are learned from the source object once the request runs
  ctx.plan = planner_->plan(
    options.type, options.request, ctx.body != nullptr,
    options.type == MetaRequestType::GET_OBJECT ? std::nullopt : body_size, options.part_size
  );
  checkResumeToken(options, ctx.endpoint, ctx.plan);

  ctx.window = defaultConcurrency();
  ctx.window_derived = config_.max_concurrency == 0;

  auto strand = boost::asio::make_strand(provider_->executor());
  ctx.executor = std::make_shared<RequestExecutor>(
    strand, provider_, options.signer ? options.signer : signer_, ctx.endpoint, config_.retry,
    config_.part_timeout
  );
  ctx.options = std::move(options);

  std::shared_ptr<MetaRequest> request = createMetaRequest(std::move(ctx));
  request->start();
  return request;
}

void S3Client::checkResumeToken(
  const MetaRequestOptions& options, const Endpoint& endpoint, const PlanResult& plan
) const {
  if (!options.resume_token) {
    return;
  }
  const ResumeToken& token = *options.resume_token;
  if (!token.endpoint.empty() && token.endpoint != endpoint.toString()) {
    throw ResumeStateError(
      "Resume token endpoint " + token.endpoint + " does not match " + endpoint.toString()
    );
  }
  if (options.type == MetaRequestType::COPY_OBJECT) {
    // Checked against the source size once it is known
    if (token.type != MetaRequestType::COPY_OBJECT ||
        token.object_path != options.request.objectPath()) {
      throw ResumeStateError("Resume token belongs to a different request");
    }
    return;
  }
  ResumeController::checkCompatible(
    token, options.type, options.request.objectPath(), plan.object_size,
    static_cast<uint32_t>(plan.parts.size())
  );
  if (plan.kind != PlanKind::MULTIPART) {
    throw ResumeStateError("Body is too small to continue a multipart upload");
  }
}

}  // namespace engine
}  // namespace ferry
