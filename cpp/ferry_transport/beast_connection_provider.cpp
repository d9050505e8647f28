#include "beast_connection_provider.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/optional.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <utility>

#define FERRY_LOG_COMPONENT "beast_transport"
#include <ferry_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace ferry {
namespace transport {

using logging::kv;

namespace {

std::string poolKey(const engine::Endpoint& endpoint) {
  return endpoint.toString();
}

}  // namespace

/**
 * One TCP connection. Every socket operation runs on the connection's strand.
 */
class BeastConnection : public engine::IHttpConnection,
                        public std::enable_shared_from_this<BeastConnection> {
public:
  BeastConnection(
    net::any_io_executor executor, engine::Endpoint endpoint, const engine::ConnectionConfig& config,
    std::weak_ptr<BeastConnectionProvider> provider
  )
      : strand_(net::make_strand(executor))
      , stream_(strand_)
      , resolver_(strand_)
      , endpoint_(std::move(endpoint))
      , config_(config)
      , provider_(std::move(provider)) {}

  void connect(std::function<void(const beast::error_code&)> done) {
    auto self = shared_from_this();
    net::post(strand_, [self, done]() {
      self->resolver_.async_resolve(
        self->endpoint_.host, std::to_string(self->endpoint_.port),
        [self, done](beast::error_code ec, tcp::resolver::results_type results) {
          if (ec) {
            done(ec);
            return;
          }
          self->stream_.expires_after(self->config_.connect_timeout);
          self->stream_.async_connect(
            results, [self, done](beast::error_code connect_ec, const tcp::endpoint&) {
              self->stream_.expires_never();
              self->open_ = !connect_ec;
              done(connect_ec);
            }
          );
        }
      );
    });
  }

  engine::HttpProtocolVersion version() const override {
    return engine::HttpProtocolVersion::HTTP_1_1;
  }

  std::shared_ptr<engine::IHttpStream> makeRequest(
    const engine::HttpRequest& request, std::shared_ptr<const std::string> body,
    engine::HttpStreamCallbacks callbacks
  ) override;

  void release() override {
    auto provider = provider_.lock();
    if (!provider) {
      close();
      return;
    }
    provider->onReleased(shared_from_this(), reusable_ && open_);
  }

  const engine::Endpoint& endpoint() const { return endpoint_; }

  bool isOpen() const { return open_; }

  void cancelExchange(uint64_t id) {
    auto self = shared_from_this();
    net::post(strand_, [self, id]() {
      if (self->active_exchange_ != id) {
        return;
      }
      self->reusable_ = false;
      self->stream_.cancel();
    });
  }

  void close() {
    open_ = false;
    auto self = shared_from_this();
    net::post(strand_, [self]() {
      beast::error_code ec;
      self->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
      if (ec && ec != beast::errc::not_connected) {
        FERRY_LOG_DEBUG(
          "Socket shutdown warning" << kv("endpoint", self->endpoint_.toString())
                                    << kv("error", ec.message())
        );
      }
      self->stream_.close();
    });
  }

private:
  struct Exchange {
    uint64_t id = 0;
    http::request<http::string_body> request;
    http::response_parser<http::string_body> parser;
    engine::HttpStreamCallbacks callbacks;
  };

  void write(const std::shared_ptr<Exchange>& exchange) {
    active_exchange_ = exchange->id;
    stream_.expires_after(config_.request_timeout);

    auto self = shared_from_this();
    http::async_write(
      stream_, exchange->request, [self, exchange](beast::error_code ec, std::size_t) {
        if (ec) {
          self->finish(exchange, ec);
          return;
        }
        self->read(exchange);
      }
    );
  }

  void read(const std::shared_ptr<Exchange>& exchange) {
    auto self = shared_from_this();
    http::async_read(
      stream_, buffer_, exchange->parser, [self, exchange](beast::error_code ec, std::size_t) {
        self->onRead(exchange, ec);
      }
    );
  }

  void onRead(const std::shared_ptr<Exchange>& exchange, beast::error_code ec) {
    stream_.expires_never();
    if (ec) {
      finish(exchange, ec);
      return;
    }

    auto& response = exchange->parser.get();
    engine::HttpHeaders headers;
    for (const auto& field : response) {
      headers.add(std::string(field.name_string()), std::string(field.value()));
    }

    reusable_ = config_.keep_alive && response.keep_alive();

    if (exchange->callbacks.on_headers) {
      exchange->callbacks.on_headers(response.result_int(), headers);
    }
    const std::string& payload = response.body();
    if (!payload.empty() && exchange->callbacks.on_body) {
      exchange->callbacks.on_body(payload.data(), payload.size());
    }
    finish(exchange, {});
  }

  void finish(const std::shared_ptr<Exchange>& exchange, beast::error_code ec) {
    active_exchange_ = 0;
    if (ec) {
      reusable_ = false;
      open_ = false;
      buffer_.consume(buffer_.size());
    }
    if (exchange->callbacks.on_complete) {
      exchange->callbacks.on_complete(ec);
    }
  }

  net::strand<net::any_io_executor> strand_;
  beast::tcp_stream stream_;
  tcp::resolver resolver_;
  beast::flat_buffer buffer_;

  engine::Endpoint endpoint_;
  engine::ConnectionConfig config_;
  std::weak_ptr<BeastConnectionProvider> provider_;

  uint64_t next_exchange_ = 0;
  uint64_t active_exchange_ = 0;
  std::atomic<bool> reusable_{true};
  std::atomic<bool> open_{false};
};

/**
 * Cancellation handle for one exchange on a BeastConnection
 */
class BeastStream : public engine::IHttpStream {
public:
  BeastStream(std::weak_ptr<BeastConnection> connection, uint64_t id)
      : connection_(std::move(connection))
      , id_(id) {}

  void cancel() override {
    if (auto connection = connection_.lock()) {
      connection->cancelExchange(id_);
    }
  }

private:
  std::weak_ptr<BeastConnection> connection_;
  uint64_t id_;
};

std::shared_ptr<engine::IHttpStream> BeastConnection::makeRequest(
  const engine::HttpRequest& request, std::shared_ptr<const std::string> body,
  engine::HttpStreamCallbacks callbacks
) {
  auto exchange = std::make_shared<Exchange>();
  exchange->id = ++next_exchange_;
  exchange->callbacks = std::move(callbacks);

  auto stream = std::make_shared<BeastStream>(weak_from_this(), exchange->id);
  auto self = shared_from_this();

  http::verb verb = http::string_to_verb(request.method);
  if (verb == http::verb::unknown) {
    FERRY_LOG_ERROR("Unsupported HTTP method" << kv("method", request.method));
    net::post(strand_, [self, exchange]() {
      self->finish(exchange, net::error::make_error_code(net::error::invalid_argument));
    });
    return stream;
  }

  auto& req = exchange->request;
  req.method(verb);
  req.target(request.path);
  req.version(11);
  for (const auto& header : request.headers) {
    req.insert(header.first, header.second);
  }
  if (!request.headers.has("User-Agent")) {
    req.set(http::field::user_agent, std::string("ferry/1.0 ") + BOOST_BEAST_VERSION_STRING);
  }
  if (!config_.keep_alive) {
    req.keep_alive(false);
  }
  if (body) {
    req.body() = *body;
  }
  req.prepare_payload();

  if (verb == http::verb::head) {
    exchange->parser.skip(true);
  }
  exchange->parser.body_limit(boost::none);

  net::post(strand_, [self, exchange]() { self->write(exchange); });
  return stream;
}

BeastConnectionProvider::BeastConnectionProvider(
  boost::asio::any_io_executor executor, engine::ConnectionConfig config
)
    : executor_(std::move(executor))
    , config_(std::move(config)) {
  config_.max_connections = std::max<size_t>(1, config_.max_connections);
}

BeastConnectionProvider::~BeastConnectionProvider() {
  for (auto& entry : pools_) {
    for (auto& connection : entry.second.idle) {
      connection->close();
    }
  }
}

void BeastConnectionProvider::acquireConnection(
  const engine::Endpoint& endpoint, engine::AcquireCallback callback
) {
  if (endpoint.scheme != "http") {
    FERRY_LOG_ERROR(
      "Only plain HTTP endpoints are supported" << kv("endpoint", endpoint.toString())
    );
    deliver(
      std::move(callback), net::error::make_error_code(net::error::operation_not_supported),
      nullptr
    );
    return;
  }

  std::shared_ptr<BeastConnection> reuse;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!shut_down_) {
      Pool& pool = pools_[poolKey(endpoint)];
      while (!pool.idle.empty()) {
        auto candidate = pool.idle.back();
        pool.idle.pop_back();
        if (candidate->isOpen()) {
          reuse = std::move(candidate);
          break;
        }
        --pool.open;
      }

      if (!reuse) {
        if (pool.open >= config_.max_connections) {
          pool.waiters.push_back(std::move(callback));
          return;
        }
        ++pool.open;
      }
    }
  }

  if (reuse) {
    deliver(std::move(callback), {}, std::move(reuse));
    return;
  }
  if (!callback) {
    return;
  }

  bool stopped = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped = shut_down_;
  }
  if (stopped) {
    deliver(std::move(callback), net::error::make_error_code(net::error::operation_aborted), nullptr);
    return;
  }
  openConnection(endpoint, std::move(callback));
}

void BeastConnectionProvider::openConnection(
  const engine::Endpoint& endpoint, engine::AcquireCallback callback
) {
  FERRY_LOG_DEBUG("Opening connection" << kv("endpoint", endpoint.toString()));

  auto connection =
    std::make_shared<BeastConnection>(executor_, endpoint, config_, weak_from_this());
  auto self = shared_from_this();
  connection->connect([self, endpoint, connection, callback](const beast::error_code& ec) {
    if (ec) {
      FERRY_LOG_WARN(
        "Connection failed" << kv("endpoint", endpoint.toString()) << kv("error", ec.message())
      );
      self->onConnectFailed(endpoint);
      self->deliver(callback, ec, nullptr);
      return;
    }
    self->deliver(callback, {}, connection);
  });
}

void BeastConnectionProvider::onConnectFailed(const engine::Endpoint& endpoint) {
  engine::AcquireCallback next;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Pool& pool = pools_[poolKey(endpoint)];
    if (pool.open > 0) {
      --pool.open;
    }
    if (shut_down_ || pool.waiters.empty()) {
      return;
    }
    next = std::move(pool.waiters.front());
    pool.waiters.pop_front();
    ++pool.open;
  }
  openConnection(endpoint, std::move(next));
}

void BeastConnectionProvider::onReleased(
  const std::shared_ptr<BeastConnection>& connection, bool reusable
) {
  engine::AcquireCallback waiter;
  bool hand_over = false;
  bool open_new = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Pool& pool = pools_[poolKey(connection->endpoint())];
    if (!reusable || shut_down_) {
      if (pool.open > 0) {
        --pool.open;
      }
      if (!shut_down_ && !pool.waiters.empty()) {
        waiter = std::move(pool.waiters.front());
        pool.waiters.pop_front();
        ++pool.open;
        open_new = true;
      }
    } else if (!pool.waiters.empty()) {
      waiter = std::move(pool.waiters.front());
      pool.waiters.pop_front();
      hand_over = true;
    } else {
      pool.idle.push_back(connection);
    }
  }

  if (!reusable) {
    connection->close();
  }
  if (hand_over) {
    deliver(std::move(waiter), {}, connection);
  } else if (open_new) {
    openConnection(connection->endpoint(), std::move(waiter));
  }
}

void BeastConnectionProvider::deliver(
  engine::AcquireCallback callback, const boost::system::error_code& ec,
  std::shared_ptr<engine::IHttpConnection> connection
) {
  if (!callback) {
    return;
  }
  net::post(executor_, [callback = std::move(callback), ec, connection]() {
    callback(ec, connection);
  });
}

size_t BeastConnectionProvider::openConnections(const engine::Endpoint& endpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pools_.find(poolKey(endpoint));
  return it == pools_.end() ? 0 : it->second.open;
}

size_t BeastConnectionProvider::idleConnections(const engine::Endpoint& endpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pools_.find(poolKey(endpoint));
  return it == pools_.end() ? 0 : it->second.idle.size();
}

size_t BeastConnectionProvider::waitingRequests(const engine::Endpoint& endpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pools_.find(poolKey(endpoint));
  return it == pools_.end() ? 0 : it->second.waiters.size();
}

void BeastConnectionProvider::shutdown() {
  std::vector<std::shared_ptr<BeastConnection>> idle;
  std::vector<engine::AcquireCallback> waiters;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shut_down_ = true;
    for (auto& entry : pools_) {
      Pool& pool = entry.second;
      pool.open -= std::min(pool.open, pool.idle.size());
      for (auto& connection : pool.idle) {
        idle.push_back(std::move(connection));
      }
      pool.idle.clear();
      for (auto& waiter : pool.waiters) {
        waiters.push_back(std::move(waiter));
      }
      pool.waiters.clear();
    }
  }

  FERRY_LOG_INFO(
    "Connection pool shut down" << kv("closed_idle", idle.size()) << kv("failed_waiters", waiters.size())
  );
  for (auto& connection : idle) {
    connection->close();
  }
  for (auto& waiter : waiters) {
    deliver(std::move(waiter), net::error::make_error_code(net::error::operation_aborted), nullptr);
  }
}

}  // namespace transport
}  // namespace ferry
