#ifndef FERRY_ENGINE_REQUEST_EXECUTOR_HPP
#define FERRY_ENGINE_REQUEST_EXECUTOR_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>

#include "connection.hpp"
#include "engine_errors.hpp"
#include "http_message.hpp"
#include "retry_handler.hpp"

namespace ferry {
namespace engine {

using Strand = boost::asio::strand<boost::asio::any_io_executor>;

/**
 * One physical request to run with retries
 */
struct OutgoingRequest {
  std::string operation;  // for logs, e.g. "UploadPart"
  HttpRequest request;
  std::shared_ptr<const std::string> body;
  uint32_t part_number = 0;

  // Non-2xx statuses the caller handles itself (e.g. 416 on an empty object)
  std::set<int> extra_success_statuses;

  // Treat a 2xx response whose body is an <Error> document as a failure
  bool check_embedded_error = false;

  // Cancellation does not abort an attempt already on the wire; a 2xx that
  // still arrives is reported as success (no retries once cancelled)
  bool complete_when_cancelled = false;
};

struct RequestOutcome {
  bool success = false;
  int status = 0;
  HttpHeaders headers;
  std::string body;
  ErrorInfo error;
  int attempts = 0;
};

/**
 * Runs requests over pooled connections: acquire, sign, send, classify,
 * and retry transient failures with backoff. A connection is held for
 * exactly one exchange.
 *
 * execute() and every completion run on the owning strand.
 */
class RequestExecutor : public std::enable_shared_from_this<RequestExecutor> {
public:
  using Completion = std::function<void(RequestOutcome)>;
  using VersionObserver = std::function<void(HttpProtocolVersion)>;

  RequestExecutor(
    Strand strand, std::shared_ptr<IConnectionProvider> provider, std::shared_ptr<ISigner> signer,
    Endpoint endpoint, const RetryConfig& retry, std::chrono::milliseconds part_timeout
  );

  void execute(OutgoingRequest outgoing, Completion done);

  /**
   * Abort every request executing now. They complete with
   * ErrorKind::CANCELLED; requests submitted afterwards run normally.
   */
  void cancelAll();

  size_t activeCount() const { return active_.size(); }

  /**
   * Called with the protocol version of every acquired connection
   */
  void setVersionObserver(VersionObserver observer) { version_observer_ = std::move(observer); }

  const Endpoint& endpoint() const { return endpoint_; }
  const Strand& strand() const { return strand_; }

private:
  struct Execution;

  void startAttempt(const std::shared_ptr<Execution>& exec);
  void onConnection(
    const std::shared_ptr<Execution>& exec, const boost::system::error_code& ec,
    std::shared_ptr<IHttpConnection> connection
  );
  void onExchangeComplete(
    const std::shared_ptr<Execution>& exec, const boost::system::error_code& ec
  );
  void handleFailure(const std::shared_ptr<Execution>& exec, ErrorInfo error, bool retryable);
  void complete(const std::shared_ptr<Execution>& exec, RequestOutcome outcome);
  RequestOutcome cancelledOutcome(const std::shared_ptr<Execution>& exec) const;

  Strand strand_;
  std::shared_ptr<IConnectionProvider> provider_;
  std::shared_ptr<ISigner> signer_;
  Endpoint endpoint_;
  RetryHandler retry_;
  std::chrono::milliseconds part_timeout_;
  VersionObserver version_observer_;
  std::set<std::shared_ptr<Execution>> active_;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_REQUEST_EXECUTOR_HPP
