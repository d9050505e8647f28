/**
 * Unit tests for BeastConnectionProvider against a local HTTP server
 */

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "beast_connection_provider.hpp"
#include "fake_s3_service.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using namespace ferry::engine;
using ferry::engine::test::IoThread;
using ferry::transport::BeastConnectionProvider;

namespace {

constexpr auto kWait = std::chrono::seconds(5);

/**
 * Minimal HTTP/1.1 server. "/close" answers without keep-alive, "/hang"
 * never answers, anything else echoes method, target and body size.
 */
class TestHttpServer {
public:
  TestHttpServer()
      : acceptor_(io_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    accept();
    thread_ = std::thread([this]() { io_.run(); });
  }

  ~TestHttpServer() {
    io_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  Endpoint endpoint() const {
    return Endpoint::parse("http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()));
  }

  int accepted() const { return accepted_; }

private:
  struct Session {
    explicit Session(tcp::socket s)
        : socket(std::move(s)) {}

    tcp::socket socket;
    beast::flat_buffer buffer;
    http::request<http::string_body> request;
    http::response<http::string_body> response;
  };

  void accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
      if (ec) {
        return;
      }
      ++accepted_;
      auto session = std::make_shared<Session>(std::move(socket));
      sessions_.push_back(session);
      read(session);
      accept();
    });
  }

  void read(const std::shared_ptr<Session>& session) {
    session->request = {};
    http::async_read(
      session->socket, session->buffer, session->request,
      [this, session](beast::error_code ec, std::size_t) {
        if (ec) {
          return;
        }
        respond(session);
      }
    );
  }

  void respond(const std::shared_ptr<Session>& session) {
    const auto& request = session->request;
    std::string target(request.target());
    if (target == "/hang") {
      return;
    }

    auto& response = session->response;
    response = {};
    response.version(11);
    response.result(http::status::ok);
    response.set("x-request-body-size", std::to_string(request.body().size()));
    response.set(http::field::etag, "\"abc\"");
    std::string body = std::string(request.method_string()) + " " + target;
    response.keep_alive(target != "/close" && request.keep_alive());
    if (request.method() == http::verb::head) {
      response.content_length(body.size());
    } else {
      response.body() = body;
      response.prepare_payload();
    }

    http::async_write(
      session->socket, response, [this, session](beast::error_code ec, std::size_t) {
        if (ec || !session->response.keep_alive()) {
          beast::error_code ignored;
          session->socket.shutdown(tcp::socket::shutdown_both, ignored);
          return;
        }
        read(session);
      }
    );
  }

  net::io_context io_;
  tcp::acceptor acceptor_;
  std::vector<std::shared_ptr<Session>> sessions_;
  std::atomic<int> accepted_{0};
  std::thread thread_;
};

struct Acquired {
  boost::system::error_code ec;
  std::shared_ptr<IHttpConnection> connection;
};

struct Exchanged {
  int status = 0;
  HttpHeaders headers;
  std::string body;
  boost::system::error_code ec;
};

}  // namespace

class BeastConnectionProviderTest : public ::testing::Test {
protected:
  void SetUp() override { config_.connect_timeout = std::chrono::milliseconds(2000); }

  std::shared_ptr<BeastConnectionProvider> makeProvider() {
    return std::make_shared<BeastConnectionProvider>(io_.context().get_executor(), config_);
  }

  std::future<Acquired> acquire(
    const std::shared_ptr<BeastConnectionProvider>& provider, const Endpoint& endpoint
  ) {
    auto promise = std::make_shared<std::promise<Acquired>>();
    provider->acquireConnection(
      endpoint,
      [promise](const boost::system::error_code& ec, std::shared_ptr<IHttpConnection> connection) {
        promise->set_value({ec, std::move(connection)});
      }
    );
    return promise->get_future();
  }

  Acquired acquireNow(
    const std::shared_ptr<BeastConnectionProvider>& provider, const Endpoint& endpoint
  ) {
    auto future = acquire(provider, endpoint);
    EXPECT_EQ(future.wait_for(kWait), std::future_status::ready);
    return future.get();
  }

  std::future<Exchanged> send(
    IHttpConnection& connection, const std::string& method, const std::string& path,
    std::shared_ptr<const std::string> body = nullptr,
    std::shared_ptr<IHttpStream>* stream = nullptr
  ) {
    HttpRequest request;
    request.method = method;
    request.path = path;
    request.headers.set("Host", server_.endpoint().hostHeader());

    auto result = std::make_shared<Exchanged>();
    auto promise = std::make_shared<std::promise<Exchanged>>();

    HttpStreamCallbacks callbacks;
    callbacks.on_headers = [result](int status, const HttpHeaders& headers) {
      result->status = status;
      result->headers = headers;
    };
    callbacks.on_body = [result](const char* data, size_t size) {
      result->body.append(data, size);
    };
    callbacks.on_complete = [result, promise](const boost::system::error_code& ec) {
      result->ec = ec;
      promise->set_value(*result);
    };

    auto handle = connection.makeRequest(request, std::move(body), std::move(callbacks));
    if (stream) {
      *stream = handle;
    }
    return promise->get_future();
  }

  Exchanged sendNow(IHttpConnection& connection, const std::string& method, const std::string& path) {
    auto future = send(connection, method, path);
    EXPECT_EQ(future.wait_for(kWait), std::future_status::ready);
    return future.get();
  }

  template <typename Predicate>
  bool eventually(Predicate predicate) {
    auto deadline = std::chrono::steady_clock::now() + kWait;
    while (std::chrono::steady_clock::now() < deadline) {
      if (predicate()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
  }

  TestHttpServer server_;
  IoThread io_;
  ConnectionConfig config_;
};

TEST_F(BeastConnectionProviderTest, RequestAndResponse) {
  auto provider = makeProvider();
  Acquired acquired = acquireNow(provider, server_.endpoint());
  ASSERT_FALSE(acquired.ec) << acquired.ec.message();
  ASSERT_NE(acquired.connection, nullptr);
  EXPECT_EQ(acquired.connection->version(), HttpProtocolVersion::HTTP_1_1);

  auto future =
    send(*acquired.connection, "PUT", "/bucket/key?partNumber=1", std::make_shared<std::string>("hello"));
  ASSERT_EQ(future.wait_for(kWait), std::future_status::ready);
  Exchanged result = future.get();

  EXPECT_FALSE(result.ec) << result.ec.message();
  EXPECT_EQ(result.status, 200);
  EXPECT_EQ(result.body, "PUT /bucket/key?partNumber=1");
  EXPECT_EQ(result.headers.get("x-request-body-size"), std::string("5"));
  EXPECT_EQ(result.headers.get("etag"), std::string("\"abc\""));

  acquired.connection->release();
}

TEST_F(BeastConnectionProviderTest, HeadResponseHasNoBody) {
  auto provider = makeProvider();
  Acquired acquired = acquireNow(provider, server_.endpoint());
  ASSERT_FALSE(acquired.ec);

  Exchanged result = sendNow(*acquired.connection, "HEAD", "/bucket/key");
  EXPECT_FALSE(result.ec) << result.ec.message();
  EXPECT_EQ(result.status, 200);
  EXPECT_TRUE(result.body.empty());
  EXPECT_TRUE(result.headers.has("Content-Length"));
  acquired.connection->release();
}

TEST_F(BeastConnectionProviderTest, ReleasedConnectionIsReused) {
  auto provider = makeProvider();
  Endpoint endpoint = server_.endpoint();

  for (int i = 0; i < 3; ++i) {
    Acquired acquired = acquireNow(provider, endpoint);
    ASSERT_FALSE(acquired.ec);
    EXPECT_EQ(sendNow(*acquired.connection, "GET", "/bucket/key").status, 200);
    acquired.connection->release();
  }

  EXPECT_EQ(server_.accepted(), 1);
  EXPECT_EQ(provider->openConnections(endpoint), 1u);
  EXPECT_EQ(provider->idleConnections(endpoint), 1u);
}

TEST_F(BeastConnectionProviderTest, ConnectionCloseIsNotPooled) {
  auto provider = makeProvider();
  Endpoint endpoint = server_.endpoint();

  Acquired acquired = acquireNow(provider, endpoint);
  ASSERT_FALSE(acquired.ec);
  EXPECT_EQ(sendNow(*acquired.connection, "GET", "/close").status, 200);
  acquired.connection->release();

  EXPECT_EQ(provider->openConnections(endpoint), 0u);
  EXPECT_EQ(provider->idleConnections(endpoint), 0u);

  Acquired next = acquireNow(provider, endpoint);
  ASSERT_FALSE(next.ec);
  EXPECT_EQ(sendNow(*next.connection, "GET", "/bucket/key").status, 200);
  next.connection->release();
  EXPECT_EQ(server_.accepted(), 2);
}

TEST_F(BeastConnectionProviderTest, WaitersAreServedInOrder) {
  config_.max_connections = 1;
  auto provider = makeProvider();
  Endpoint endpoint = server_.endpoint();

  Acquired first = acquireNow(provider, endpoint);
  ASSERT_FALSE(first.ec);

  std::mutex mutex;
  std::vector<int> order;
  std::promise<void> both;
  auto record = [&](int id, std::shared_ptr<IHttpConnection> connection) {
    std::lock_guard<std::mutex> lock(mutex);
    order.push_back(id);
    if (order.size() == 1) {
      connection->release();
    } else {
      both.set_value();
    }
  };
  provider->acquireConnection(
    endpoint, [&](const boost::system::error_code& ec, std::shared_ptr<IHttpConnection> connection) {
      EXPECT_FALSE(ec);
      record(2, connection);
    }
  );
  provider->acquireConnection(
    endpoint, [&](const boost::system::error_code& ec, std::shared_ptr<IHttpConnection> connection) {
      EXPECT_FALSE(ec);
      record(3, connection);
    }
  );

  EXPECT_EQ(provider->waitingRequests(endpoint), 2u);
  EXPECT_EQ(provider->openConnections(endpoint), 1u);

  first.connection->release();
  ASSERT_EQ(both.get_future().wait_for(kWait), std::future_status::ready);

  EXPECT_EQ(order, (std::vector<int>{2, 3}));
  EXPECT_EQ(provider->openConnections(endpoint), 1u);
  EXPECT_EQ(server_.accepted(), 1);
}

TEST_F(BeastConnectionProviderTest, CancelAbortsExchange) {
  auto provider = makeProvider();
  Endpoint endpoint = server_.endpoint();
  Acquired acquired = acquireNow(provider, endpoint);
  ASSERT_FALSE(acquired.ec);

  std::shared_ptr<IHttpStream> stream;
  auto future = send(*acquired.connection, "GET", "/hang", nullptr, &stream);
  ASSERT_NE(stream, nullptr);
  ASSERT_TRUE(eventually([this]() { return server_.accepted() == 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  stream->cancel();
  stream->cancel();

  ASSERT_EQ(future.wait_for(kWait), std::future_status::ready);
  EXPECT_EQ(future.get().ec, net::error::operation_aborted);

  // A cancelled connection is dropped rather than pooled
  acquired.connection->release();
  EXPECT_EQ(provider->openConnections(endpoint), 0u);
}

TEST_F(BeastConnectionProviderTest, RequestTimeoutFailsExchange) {
  config_.request_timeout = std::chrono::milliseconds(100);
  auto provider = makeProvider();
  Acquired acquired = acquireNow(provider, server_.endpoint());
  ASSERT_FALSE(acquired.ec);

  Exchanged result = sendNow(*acquired.connection, "GET", "/hang");
  EXPECT_EQ(result.ec, beast::error::timeout);
  acquired.connection->release();
}

TEST_F(BeastConnectionProviderTest, HttpsIsNotSupported) {
  auto provider = makeProvider();
  Acquired acquired = acquireNow(provider, Endpoint::parse("https://127.0.0.1:9443"));
  EXPECT_EQ(acquired.ec, net::error::operation_not_supported);
  EXPECT_EQ(acquired.connection, nullptr);
}

TEST_F(BeastConnectionProviderTest, ConnectFailureReleasesSlot) {
  uint16_t port = 0;
  {
    net::io_context probe;
    tcp::acceptor acceptor(probe, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    port = acceptor.local_endpoint().port();
  }
  Endpoint closed = Endpoint::parse("http://127.0.0.1:" + std::to_string(port));

  auto provider = makeProvider();
  Acquired acquired = acquireNow(provider, closed);
  EXPECT_TRUE(acquired.ec);
  EXPECT_EQ(acquired.connection, nullptr);
  EXPECT_EQ(provider->openConnections(closed), 0u);
}

TEST_F(BeastConnectionProviderTest, ShutdownFailsWaiters) {
  config_.max_connections = 1;
  auto provider = makeProvider();
  Endpoint endpoint = server_.endpoint();

  Acquired held = acquireNow(provider, endpoint);
  ASSERT_FALSE(held.ec);
  auto waiter = acquire(provider, endpoint);
  EXPECT_EQ(provider->waitingRequests(endpoint), 1u);

  provider->shutdown();
  ASSERT_EQ(waiter.wait_for(kWait), std::future_status::ready);
  EXPECT_EQ(waiter.get().ec, net::error::operation_aborted);
  EXPECT_EQ(provider->waitingRequests(endpoint), 0u);

  held.connection->release();
  EXPECT_EQ(provider->openConnections(endpoint), 0u);

  Acquired after = acquireNow(provider, endpoint);
  EXPECT_EQ(after.ec, net::error::operation_aborted);
}
