#ifndef FERRY_TRANSPORT_BEAST_CONNECTION_PROVIDER_HPP
#define FERRY_TRANSPORT_BEAST_CONNECTION_PROVIDER_HPP

#include <boost/asio/any_io_executor.hpp>

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <connection.hpp>
#include <ferry_config.hpp>

namespace ferry {
namespace transport {

class BeastConnection;

/**
 * HTTP/1.1 keep-alive connection pool built on Boost.Beast.
 *
 * One pool per endpoint, capped at ConnectionConfig::max_connections.
 * Requests beyond the cap wait in FIFO order for a released connection.
 * Only plain TCP ("http://") endpoints are served; https endpoints fail
 * acquisition with operation_not_supported.
 *
 * Must be owned by a std::shared_ptr. Callbacks are posted to the executor
 * passed at construction, never invoked inline.
 */
class BeastConnectionProvider : public engine::IConnectionProvider,
                                public std::enable_shared_from_this<BeastConnectionProvider> {
public:
  BeastConnectionProvider(boost::asio::any_io_executor executor, engine::ConnectionConfig config);
  ~BeastConnectionProvider() override;

  BeastConnectionProvider(const BeastConnectionProvider&) = delete;
  BeastConnectionProvider& operator=(const BeastConnectionProvider&) = delete;

  void acquireConnection(const engine::Endpoint& endpoint, engine::AcquireCallback callback)
    override;

  size_t maxConnections() const override { return config_.max_connections; }

  boost::asio::any_io_executor executor() override { return executor_; }

  /**
   * Connections currently open to `endpoint` (idle and in use)
   */
  size_t openConnections(const engine::Endpoint& endpoint) const;

  size_t idleConnections(const engine::Endpoint& endpoint) const;

  size_t waitingRequests(const engine::Endpoint& endpoint) const;

  /**
   * Close idle connections and fail every waiter with operation_aborted
   */
  void shutdown();

private:
  friend class BeastConnection;

  struct Pool {
    std::vector<std::shared_ptr<BeastConnection>> idle;
    std::deque<engine::AcquireCallback> waiters;
    size_t open = 0;
  };

  void openConnection(const engine::Endpoint& endpoint, engine::AcquireCallback callback);
  void onConnectFailed(const engine::Endpoint& endpoint);
  void onReleased(const std::shared_ptr<BeastConnection>& connection, bool reusable);
  void deliver(
    engine::AcquireCallback callback, const boost::system::error_code& ec,
    std::shared_ptr<engine::IHttpConnection> connection
  );

  boost::asio::any_io_executor executor_;
  engine::ConnectionConfig config_;

  mutable std::mutex mutex_;
  std::map<std::string, Pool> pools_;
  bool shut_down_ = false;
};

}  // namespace transport
}  // namespace ferry

#endif  // FERRY_TRANSPORT_BEAST_CONNECTION_PROVIDER_HPP
