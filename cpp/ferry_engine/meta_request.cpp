#include "meta_request.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>

#define FERRY_LOG_COMPONENT "meta_request"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace engine {

using logging::kv;

MetaRequest::MetaRequest(MetaRequestContext ctx)
    : config_(std::move(ctx.config))
    , options_(std::move(ctx.options))
    , planner_(std::move(ctx.planner))
    , plan_(std::move(ctx.plan))
    , body_(std::move(ctx.body))
    , endpoint_(std::move(ctx.endpoint))
    , executor_(std::move(ctx.executor))
    , aggregator_(options_.handler, executor_)
    , window_(std::max<size_t>(1, ctx.window))
    , strand_(executor_->strand())
    , window_derived_(ctx.window_derived)
    , future_(promise_.get_future().share()) {}

void MetaRequest::start() {
  executor_->setVersionObserver([this](HttpProtocolVersion version) {
    onConnectionVersion(version);
  });

  FERRY_LOG_INFO(
    "Starting meta request" << kv("type", toString(options_.type))
                            << kv("path", options_.request.objectPath())
                            << kv("plan", toString(plan_.kind)) << kv("window", window_)
  );

  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    if (self->cancelled_) {
      self->fail(self->cancelledError());
      return;
    }
    try {
      self->begin();
    } catch (const FerryError& e) {
      self->fail(ErrorInfo::make(e.kind(), e.what()));
    } catch (const std::exception& e) {
      self->fail(ErrorInfo::make(ErrorKind::PLANNING, e.what()));
    }
  });
}

void MetaRequest::cancel(CancelMode mode) {
  auto self = shared_from_this();
  boost::asio::dispatch(strand_, [self, mode]() {
    self->cancelOnStrand(mode);
  });
}

void MetaRequest::cancelOnStrand(CancelMode mode) {
  // Cleanup already running must not be cancelled
  if (aggregator_.finished() || cancelled_ || failing_) {
    return;
  }
  cancelled_ = true;
  cancel_mode_ = mode;
  FERRY_LOG_INFO(
    "Cancelling meta request" << kv("path", options_.request.objectPath())
                              << kv("mode", mode == CancelMode::ABORT ? "abort" : "resumable")
  );

  executor_->cancelAll();
  if (scheduler_ && !scheduler_->drained()) {
    scheduler_->stop(cancelledError());
  }
}

ErrorInfo MetaRequest::cancelledError() const {
  return ErrorInfo::make(ErrorKind::CANCELLED, "Meta request cancelled");
}

void MetaRequest::onConnectionVersion(HttpProtocolVersion version) {
  if (version != HttpProtocolVersion::HTTP_2 || !window_derived_ || window_grown_) {
    return;
  }
  window_grown_ = true;
  window_ *= kHttp2StreamMultiplier;
  FERRY_LOG_DEBUG("Multiplexed connection, widening window" << kv("window", window_));
  if (scheduler_) {
    scheduler_->setMaxConcurrency(window_);
  }
}

void MetaRequest::send(
  OutgoingRequest outgoing, std::function<void(RequestOutcome&)> then, bool see_failures
) {
  auto self = shared_from_this();
  const bool complete_when_cancelled = outgoing.complete_when_cancelled;
  executor_->execute(
    std::move(outgoing),
    [self, then = std::move(then), see_failures, complete_when_cancelled](RequestOutcome outcome) {
      if (self->aggregator_.finished() || self->failing_) {
        return;
      }
      if (self->cancelled_ && !(complete_when_cancelled && outcome.success)) {
        self->fail(self->cancelledError());
        return;
      }
      if (!outcome.success && !see_failures) {
        self->fail(outcome.error);
        return;
      }
      try {
        then(outcome);
      } catch (const FerryError& e) {
        self->fail(ErrorInfo::make(e.kind(), e.what()));
      } catch (const std::exception& e) {
        self->fail(ErrorInfo::make(ErrorKind::PLANNING, e.what()));
      }
    }
  );
}

void MetaRequest::runParts(
  std::unique_ptr<IPartSource> source, PartBuilder build, PartAcceptor accept,
  std::function<void()> on_success, PartScheduler::AdmissionGate gate
) {
  source_ = std::move(source);

  auto dispatch = [this, build = std::move(build)](
                    Part& part, std::function<void(RequestOutcome)> done
                  ) {
    OutgoingRequest outgoing = build(part);
    auto self = shared_from_this();
    executor_->execute(std::move(outgoing), [self, done = std::move(done)](RequestOutcome outcome) {
      done(std::move(outcome));
    });
  };

  auto on_part = [this, accept = std::move(accept)](PartResult& result) -> bool {
    peak_in_flight_ = std::max(peak_in_flight_.load(), scheduler_->peakInFlight());
    if (!result.outcome.success) {
      if (result.outcome.error.kind != ErrorKind::CANCELLED) {
        aggregator_.recordPartError(result.outcome.error);
      }
      return false;
    }
    if (auto error = accept(result.part, result.outcome)) {
      error->part_number = result.part.part_number;
      result.outcome.success = false;
      result.outcome.error = *error;
      aggregator_.recordPartError(*error);
      return false;
    }
    return true;
  };

  auto on_drained = [this, on_success = std::move(on_success)](std::optional<ErrorInfo> error) {
    peak_in_flight_ = std::max(peak_in_flight_.load(), scheduler_->peakInFlight());
    if (error) {
      fail(*error);
      return;
    }
    if (cancelled_) {
      fail(cancelledError());
      return;
    }
    try {
      on_success();
    } catch (const FerryError& e) {
      fail(ErrorInfo::make(e.kind(), e.what()));
    } catch (const std::exception& e) {
      fail(ErrorInfo::make(ErrorKind::PLANNING, e.what()));
    }
  };

  scheduler_ = std::make_unique<PartScheduler>(
    window_, *source_, std::move(dispatch), std::move(on_part), std::move(on_drained)
  );
  if (gate) {
    scheduler_->setAdmissionGate(std::move(gate));
  }
  scheduler_->start();
}

void MetaRequest::fail(const ErrorInfo& error) {
  if (failing_ || aggregator_.finished()) {
    return;
  }
  failing_ = true;

  if (error.kind == ErrorKind::CANCELLED) {
    FERRY_LOG_INFO("Meta request cancelled" << kv("path", options_.request.objectPath()));
  } else {
    FERRY_LOG_ERROR(
      "Meta request failed" << kv("path", options_.request.objectPath())
                            << kv("error", error.describe())
    );
  }

  MetaRequestResult result = MetaRequestResult::Failure(error);
  if (!aggregator_.hasSession()) {
    finalize(std::move(result));
    return;
  }

  const UploadSession& session = aggregator_.session();
  bool abort_requested = cancelled_ && cancel_mode_ == CancelMode::ABORT;
  bool keep_requested = options_.resumable || cancelled_;
  if (session.completedCount() > 0 && keep_requested && !abort_requested) {
    result.resume_token = ResumeController::snapshot(session);
    FERRY_LOG_INFO(
      "Keeping multipart upload for resume" << kv("upload_id", session.uploadId())
                                            << kv("completed_parts", session.completedCount())
    );
    finalize(std::move(result));
    return;
  }

  auto self = shared_from_this();
  aggregator_.abortUpload([self, result](RequestOutcome outcome) mutable {
    if (!outcome.success) {
      ErrorInfo abort_error = outcome.error;
      abort_error.kind = ErrorKind::ABORT_FAILURE;
      FERRY_LOG_ERROR(
        "Failed to abort multipart upload" << kv("upload_id", self->aggregator_.session().uploadId())
                                           << kv("error", abort_error.describe())
      );
      result.abort_error = abort_error;
    }
    self->finalize(std::move(result));
  });
}

void MetaRequest::succeed(MetaRequestResult result) {
  result.success = true;
  finalize(std::move(result));
}

void MetaRequest::finalize(MetaRequestResult result) {
  if (result.checksum_validation == ChecksumValidation::NOT_VALIDATED) {
    result.checksum_validation = checksum_validation_;
  }
  if (!aggregator_.finish(result)) {
    return;
  }

  FERRY_LOG_INFO(
    "Meta request finished" << kv("type", toString(options_.type))
                            << kv("path", options_.request.objectPath())
                            << kv("success", result.success) << kv("status", result.status)
                            << kv("bytes", result.bytes_transferred)
  );
  finished_ = true;
  promise_.set_value(std::move(result));
}

}  // namespace engine
}  // namespace ferry
