#include "request_executor.hpp"

#include <boost/asio/post.hpp>

#define FERRY_LOG_COMPONENT "request_executor"
#include <ferry_log_macros.hpp>

#include "s3_request_factory.hpp"

namespace ferry {
namespace engine {

using logging::kv;

struct RequestExecutor::Execution {
  Execution(const Strand& strand, OutgoingRequest s, Completion d)
      : outgoing(std::move(s))
      , done(std::move(d))
      , timeout_timer(strand)
      , backoff_timer(strand) {}

  OutgoingRequest outgoing;
  Completion done;
  int attempt = 0;
  bool timed_out = false;
  bool cancelled = false;
  bool finished = false;

  std::shared_ptr<IHttpConnection> connection;
  std::shared_ptr<IHttpStream> stream;
  boost::asio::steady_timer timeout_timer;
  boost::asio::steady_timer backoff_timer;

  // Written by the connection's callbacks, read on the strand after completion
  int status = 0;
  HttpHeaders headers;
  std::string body;
};

RequestExecutor::RequestExecutor(
  Strand strand, std::shared_ptr<IConnectionProvider> provider, std::shared_ptr<ISigner> signer,
  Endpoint endpoint, const RetryConfig& retry, std::chrono::milliseconds part_timeout
)
    : strand_(std::move(strand))
    , provider_(std::move(provider))
    , signer_(std::move(signer))
    , endpoint_(std::move(endpoint))
    , retry_(retry)
    , part_timeout_(part_timeout) {}

void RequestExecutor::execute(OutgoingRequest outgoing, Completion done) {
  auto exec = std::make_shared<Execution>(strand_, std::move(outgoing), std::move(done));
  active_.insert(exec);
  startAttempt(exec);
}

void RequestExecutor::cancelAll() {
  // Completions erase from active_, so iterate over a copy
  auto snapshot = active_;
  for (const auto& exec : snapshot) {
    exec->cancelled = true;
    exec->backoff_timer.cancel();
    if (exec->stream && !exec->outgoing.complete_when_cancelled) {
      exec->stream->cancel();
    }
  }
}

void RequestExecutor::startAttempt(const std::shared_ptr<Execution>& exec) {
  if (exec->cancelled) {
    complete(exec, cancelledOutcome(exec));
    return;
  }

  ++exec->attempt;
  exec->timed_out = false;
  exec->status = 0;
  exec->headers = HttpHeaders();
  exec->body.clear();

  auto self = shared_from_this();
  provider_->acquireConnection(
    endpoint_,
    [self, exec](const boost::system::error_code& ec, std::shared_ptr<IHttpConnection> connection) {
      boost::asio::post(self->strand_, [self, exec, ec, connection]() {
        self->onConnection(exec, ec, connection);
      });
    }
  );
}

void RequestExecutor::onConnection(
  const std::shared_ptr<Execution>& exec, const boost::system::error_code& ec,
  std::shared_ptr<IHttpConnection> connection
) {
  if (exec->cancelled) {
    if (connection) {
      connection->release();
    }
    complete(exec, cancelledOutcome(exec));
    return;
  }

  if (ec || !connection) {
    handleFailure(
      exec,
      ErrorInfo::make(
        ErrorKind::TRANSPORT, "Connection acquisition failed: " + ec.message(), "NetworkingError",
        0, exec->outgoing.part_number
      ),
      true
    );
    return;
  }

  if (version_observer_) {
    version_observer_(connection->version());
  }

  HttpRequest request = exec->outgoing.request;
  if (!request.headers.has("Host")) {
    request.headers.set("Host", endpoint_.hostHeader());
  }
  if (!signer_->sign(request, exec->outgoing.body.get())) {
    connection->release();
    complete(
      exec,
      RequestOutcome{
        false, 0, HttpHeaders(), std::string(),
        ErrorInfo::make(
          ErrorKind::SIGNING, "Failed to sign " + exec->outgoing.operation + " request", "", 0,
          exec->outgoing.part_number
        ),
        exec->attempt
      }
    );
    return;
  }

  exec->connection = connection;

  HttpStreamCallbacks callbacks;
  callbacks.on_headers = [exec](int status, const HttpHeaders& headers) {
    exec->status = status;
    exec->headers = headers;
  };
  callbacks.on_body = [exec](const char* data, size_t size) {
    exec->body.append(data, size);
  };
  auto self = shared_from_this();
  callbacks.on_complete = [self, exec](const boost::system::error_code& complete_ec) {
    boost::asio::post(self->strand_, [self, exec, complete_ec]() {
      self->onExchangeComplete(exec, complete_ec);
    });
  };

  if (part_timeout_.count() > 0) {
    int attempt = exec->attempt;
    exec->timeout_timer.expires_after(part_timeout_);
    exec->timeout_timer.async_wait([exec, attempt](const boost::system::error_code& timer_ec) {
      if (timer_ec || exec->attempt != attempt || !exec->stream) {
        return;
      }
      exec->timed_out = true;
      exec->stream->cancel();
    });
  }

  exec->stream = connection->makeRequest(request, exec->outgoing.body, std::move(callbacks));
}

void RequestExecutor::onExchangeComplete(
  const std::shared_ptr<Execution>& exec, const boost::system::error_code& ec
) {
  exec->timeout_timer.cancel();
  exec->stream.reset();
  if (exec->connection) {
    exec->connection->release();
    exec->connection.reset();
  }

  // Remote state created by a request that finished after the cancel must
  // reach the caller so it can be cleaned up
  bool finished_after_cancel =
    exec->outgoing.complete_when_cancelled && !ec && isSuccessStatus(exec->status);
  if (exec->cancelled && !finished_after_cancel) {
    complete(exec, cancelledOutcome(exec));
    return;
  }

  const uint32_t part = exec->outgoing.part_number;

  if (ec || exec->status == 0) {
    if (exec->timed_out) {
      handleFailure(
        exec,
        ErrorInfo::make(
          ErrorKind::TRANSPORT, exec->outgoing.operation + " timed out", "RequestTimeout", 0, part
        ),
        true
      );
    } else {
      std::string reason = ec ? ec.message() : std::string("connection closed without response");
      handleFailure(
        exec,
        ErrorInfo::make(
          ErrorKind::TRANSPORT, exec->outgoing.operation + " failed: " + reason, "NetworkingError", 0,
          part
        ),
        true
      );
    }
    return;
  }

  const int status = exec->status;
  if (isSuccessStatus(status) || exec->outgoing.extra_success_statuses.count(status) > 0) {
    if (exec->outgoing.check_embedded_error && isSuccessStatus(status)) {
      if (auto embedded = S3ResponseParser::embeddedError(exec->body)) {
        handleFailure(
          exec,
          ErrorInfo::make(
            ErrorKind::REMOTE_SERVICE, embedded->message, embedded->code, status, part
          ),
          RetryHandler::isRetryableError(embedded->code)
        );
        return;
      }
    }

    RequestOutcome outcome;
    outcome.success = true;
    outcome.status = status;
    outcome.headers = std::move(exec->headers);
    outcome.body = std::move(exec->body);
    complete(exec, std::move(outcome));
    return;
  }

  auto detail = S3ResponseParser::error(exec->body);
  std::string code = detail ? detail->code : std::string();
  std::string message = detail && !detail->message.empty()
                          ? detail->message
                          : exec->outgoing.operation + " returned HTTP " + std::to_string(status);
  bool retryable = retry_.isRetryableStatus(status) || RetryHandler::isRetryableError(code);
  handleFailure(
    exec, ErrorInfo::make(ErrorKind::REMOTE_SERVICE, message, code, status, part), retryable
  );
}

void RequestExecutor::handleFailure(
  const std::shared_ptr<Execution>& exec, ErrorInfo error, bool retryable
) {
  int retries_done = exec->attempt - 1;
  if (retryable && !exec->cancelled && retry_.shouldRetry(retries_done)) {
    auto delay = retry_.getDelay(retries_done);
    FERRY_LOG_WARN(
      "Retrying request" << kv("operation", exec->outgoing.operation) << kv("part", error.part_number)
                         << kv("attempt", exec->attempt) << kv("delay_ms", delay.count())
                         << kv("error", error.describe())
    );

    auto self = shared_from_this();
    exec->backoff_timer.expires_after(delay);
    exec->backoff_timer.async_wait([self, exec](const boost::system::error_code&) {
      self->startAttempt(exec);
    });
    return;
  }

  RequestOutcome outcome;
  outcome.success = false;
  outcome.status = exec->status;
  outcome.headers = std::move(exec->headers);
  outcome.body = std::move(exec->body);
  outcome.error = std::move(error);
  complete(exec, std::move(outcome));
}

void RequestExecutor::complete(const std::shared_ptr<Execution>& exec, RequestOutcome outcome) {
  if (exec->finished) {
    return;
  }
  exec->finished = true;
  exec->timeout_timer.cancel();
  exec->backoff_timer.cancel();
  active_.erase(exec);

  outcome.attempts = exec->attempt;
  auto done = std::move(exec->done);
  if (done) {
    done(std::move(outcome));
  }
}

RequestOutcome RequestExecutor::cancelledOutcome(const std::shared_ptr<Execution>& exec) const {
  RequestOutcome outcome;
  outcome.error = ErrorInfo::make(
    ErrorKind::CANCELLED, exec->outgoing.operation + " cancelled", "", 0, exec->outgoing.part_number
  );
  return outcome;
}

}  // namespace engine
}  // namespace ferry
