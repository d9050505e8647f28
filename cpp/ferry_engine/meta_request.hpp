#ifndef FERRY_ENGINE_META_REQUEST_HPP
#define FERRY_ENGINE_META_REQUEST_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "aws_api_guard.hpp"
#include "body_source.hpp"
#include "client_config.hpp"
#include "connection.hpp"
#include "engine_types.hpp"
#include "http_message.hpp"
#include "part_scheduler.hpp"
#include "planner.hpp"
#include "request_executor.hpp"
#include "result_aggregator.hpp"
#include "resume_token.hpp"

namespace ferry {
namespace engine {

enum class CancelMode {
  RESUMABLE,  // keep the upload and produce a ResumeToken if any part succeeded
  ABORT       // abort the upload
};

/**
 * Descriptor of one logical S3 operation. Read-only once submitted.
 */
struct MetaRequestOptions {
  MetaRequestType type = MetaRequestType::DEFAULT;
  HttpRequest request;

  // Body sources; the file path wins when both are set
  std::shared_ptr<std::istream> body_stream;
  std::string body_file_path;

  ChecksumConfig checksum;

  std::optional<Endpoint> endpoint;  // overrides the client endpoint
  std::shared_ptr<ISigner> signer;   // overrides the client signer

  std::optional<ResumeToken> resume_token;
  uint64_t part_size = 0;  // 0: client default
  bool resumable = false;  // keep upload state instead of aborting on failure

  ResponseHandler handler;
};

/**
 * Everything a meta-request needs, assembled by S3Client
 */
struct MetaRequestContext {
  ClientConfig config;
  MetaRequestOptions options;
  std::shared_ptr<const MetaRequestPlanner> planner;
  PlanResult plan;
  std::unique_ptr<IBodySource> body;
  Endpoint endpoint;
  std::shared_ptr<RequestExecutor> executor;
  size_t window = 1;
  bool window_derived = false;
};

/**
 * Handle to a submitted meta-request: cancellable and awaitable.
 *
 * All engine work runs on a strand of the connection provider's executor.
 * The handle may be used from any thread.
 */
class MetaRequest : public std::enable_shared_from_this<MetaRequest> {
public:
  virtual ~MetaRequest() = default;

  MetaRequest(const MetaRequest&) = delete;
  MetaRequest& operator=(const MetaRequest&) = delete;

  /**
   * Stop admitting parts and abort in-flight requests. Has no effect once
   * the request finished.
   */
  void cancel(CancelMode mode = CancelMode::RESUMABLE);

  std::shared_future<MetaRequestResult> future() const { return future_; }

  /**
   * Block until the terminal result is available. Must not be called from
   * the thread running the provider's executor.
   */
  MetaRequestResult wait() const { return future_.get(); }

  bool isFinished() const { return finished_.load(); }

  MetaRequestType type() const { return options_.type; }
  const PlanResult& plan() const { return plan_; }
  size_t window() const { return window_; }

  /**
   * Peak number of parts in flight at once
   */
  size_t peakInFlight() const { return peak_in_flight_.load(); }

protected:
  using PartBuilder = std::function<OutgoingRequest(Part& part)>;
  // Returns an error to fail the part after a successful exchange
  using PartAcceptor = std::function<std::optional<ErrorInfo>(Part& part, RequestOutcome& outcome)>;

  explicit MetaRequest(MetaRequestContext ctx);

  virtual void begin() = 0;

  /**
   * Execute parts through the scheduler; `on_success` runs once every part
   * succeeded
   */
  void runParts(
    std::unique_ptr<IPartSource> source, PartBuilder build, PartAcceptor accept,
    std::function<void()> on_success, PartScheduler::AdmissionGate gate = nullptr
  );

  /**
   * Run one request and continue with its outcome on the strand. Failures
   * go to fail() unless `see_failures` hands them to `then` as well.
   */
  void send(
    OutgoingRequest outgoing, std::function<void(RequestOutcome&)> then, bool see_failures = false
  );

  /**
   * Terminal failure: preserves a ResumeToken or aborts an open upload
   * session, then finishes
   */
  void fail(const ErrorInfo& error);

  /**
   * Finish without touching the upload session
   */
  void finalize(MetaRequestResult result);

  void succeed(MetaRequestResult result);

  bool cancelled() const { return cancelled_; }
  bool failing() const { return failing_; }
  ErrorInfo cancelledError() const;

  AwsApiGuard sdk_;  // XML parsing and checksums for the whole request lifetime
  ClientConfig config_;
  MetaRequestOptions options_;
  std::shared_ptr<const MetaRequestPlanner> planner_;
  PlanResult plan_;
  std::unique_ptr<IBodySource> body_;
  Endpoint endpoint_;
  std::shared_ptr<RequestExecutor> executor_;
  ResultAggregator aggregator_;
  std::unique_ptr<IPartSource> source_;
  std::unique_ptr<PartScheduler> scheduler_;
  ChecksumValidation checksum_validation_ = ChecksumValidation::NOT_VALIDATED;
  size_t window_;

private:
  friend class S3Client;

  void start();
  void onConnectionVersion(HttpProtocolVersion version);
  void cancelOnStrand(CancelMode mode);

  Strand strand_;
  bool window_derived_;
  bool window_grown_ = false;
  bool cancelled_ = false;
  bool failing_ = false;
  CancelMode cancel_mode_ = CancelMode::RESUMABLE;

  std::promise<MetaRequestResult> promise_;
  std::shared_future<MetaRequestResult> future_;
  std::atomic<bool> finished_{false};
  std::atomic<size_t> peak_in_flight_{0};
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_META_REQUEST_HPP
