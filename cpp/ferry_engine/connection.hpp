#ifndef FERRY_ENGINE_CONNECTION_HPP
#define FERRY_ENGINE_CONNECTION_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "engine_types.hpp"
#include "http_message.hpp"

namespace ferry {
namespace engine {

/**
 * Callbacks for one request/response exchange.
 *
 * on_headers and on_body run in order on the provider's I/O context and are
 * followed by exactly one on_complete. A cancelled stream completes with
 * boost::asio::error::operation_aborted.
 */
struct HttpStreamCallbacks {
  std::function<void(int status, const HttpHeaders& headers)> on_headers;
  std::function<void(const char* data, size_t size)> on_body;
  std::function<void(const boost::system::error_code& ec)> on_complete;
};

/**
 * Handle for an in-flight exchange
 */
class IHttpStream {
public:
  virtual ~IHttpStream() = default;

  /**
   * Abort the exchange. Safe to call from any thread and more than once.
   */
  virtual void cancel() = 0;
};

/**
 * One pooled connection, held for a single exchange at a time
 */
class IHttpConnection {
public:
  virtual ~IHttpConnection() = default;

  virtual HttpProtocolVersion version() const = 0;

  /**
   * Send a request. The body, if any, is sent with a Content-Length header.
   */
  virtual std::shared_ptr<IHttpStream> makeRequest(
    const HttpRequest& request, std::shared_ptr<const std::string> body,
    HttpStreamCallbacks callbacks
  ) = 0;

  /**
   * Return the connection to its pool. Broken connections are discarded.
   */
  virtual void release() = 0;
};

using AcquireCallback = std::function<void(
  const boost::system::error_code& ec, std::shared_ptr<IHttpConnection> connection
)>;

/**
 * Source of ready connections shared by all meta-requests of a client
 */
class IConnectionProvider {
public:
  virtual ~IConnectionProvider() = default;

  /**
   * Deliver a connection to `endpoint`, possibly after waiting for a free slot
   */
  virtual void acquireConnection(const Endpoint& endpoint, AcquireCallback callback) = 0;

  /**
   * Pool capacity per endpoint
   */
  virtual size_t maxConnections() const = 0;

  /**
   * Executor driving I/O and every engine callback
   */
  virtual boost::asio::any_io_executor executor() = 0;
};

/**
 * Request signing capability
 */
class ISigner {
public:
  virtual ~ISigner() = default;

  /**
   * Add authentication headers to `request`.
   * @param payload Body about to be sent, or nullptr
   * @return false if signing failed; the request must not be sent
   */
  virtual bool sign(HttpRequest& request, const std::string* payload) = 0;
};

/**
 * Signer for anonymous access
 */
class NoopSigner : public ISigner {
public:
  bool sign(HttpRequest&, const std::string*) override { return true; }
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_CONNECTION_HPP
