#ifndef FERRY_ENGINE_TEST_FAKE_S3_SERVICE_HPP
#define FERRY_ENGINE_TEST_FAKE_S3_SERVICE_HPP

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

#include "connection.hpp"
#include "engine_types.hpp"
#include "http_message.hpp"

namespace ferry {
namespace engine {
namespace test {

/**
 * A request as received by the fake service (aws-chunked bodies already decoded)
 */
struct RecordedRequest {
  std::string operation;  // HeadObject, GetObject, PutObject, UploadPart, ...
  std::string method;
  std::string path;  // object path without query
  std::map<std::string, std::string> query;
  HttpHeaders headers;
  std::string body;
  uint32_t part_number = 0;  // UploadPart / UploadPartCopy
  std::optional<std::pair<uint64_t, uint64_t>> range;  // inclusive, GET only
  bool chunked = false;    // body arrived aws-chunked
  bool malformed = false;  // aws-chunked framing could not be decoded
};

/**
 * Canned response, or a transport failure when `transport_error` is set
 */
struct FakeResponse {
  int status = 200;
  HttpHeaders headers;
  std::string body;
  bool transport_error = false;

  static FakeResponse Error(int status, const std::string& code, const std::string& message);
  static FakeResponse ConnectionReset();
};

/**
 * In-memory S3 implementing the connection provider boundary.
 *
 * Understands HEAD, ranged GET (If-Match, 416 on empty objects), PutObject,
 * CopyObject, the multipart protocol including UploadPartCopy and paginated
 * ListParts, aws-chunked trailers and checksum headers. Faults are injected
 * through an interceptor consulted before the request is served.
 *
 * All I/O completes on the io_context passed at construction.
 */
class FakeS3Service : public IConnectionProvider,
                      public std::enable_shared_from_this<FakeS3Service> {
public:
  // attempt counts requests with the same operation and part/range, from 1
  using Interceptor =
    std::function<std::optional<FakeResponse>(const RecordedRequest& request, int attempt)>;

  explicit FakeS3Service(boost::asio::io_context& io, size_t max_connections = 64);

  void acquireConnection(const Endpoint& endpoint, AcquireCallback callback) override;
  size_t maxConnections() const override { return max_connections_; }
  boost::asio::any_io_executor executor() override;

  // --- configuration ---
  void setInterceptor(Interceptor interceptor);
  void setResponseDelay(std::chrono::milliseconds delay) { delay_ = delay; }
  void setProtocolVersion(HttpProtocolVersion version) { version_ = version; }
  void setListPartsPageSize(size_t size) { list_page_size_ = size; }
  // Answer ranged GETs with the whole object and status 200
  void setIgnoreRange(bool ignore) { ignore_range_ = ignore; }

  /**
   * Fail the first `times` attempts of UploadPart / UploadPartCopy `part_number`
   */
  void failPart(uint32_t part_number, int times, int status = 500,
                const std::string& code = "InternalError");

  /**
   * Fail the first `times` GETs whose range starts at `offset`
   */
  void failRangeAt(uint64_t offset, int times, int status = 503,
                   const std::string& code = "SlowDown");

  // --- object store ---
  void putObject(const std::string& path, const std::string& data,
                 ChecksumAlgorithm checksum = ChecksumAlgorithm::NONE);
  std::optional<std::string> object(const std::string& path) const;
  std::optional<std::string> objectChecksum(const std::string& path, ChecksumAlgorithm algorithm) const;
  /**
   * Overwrite the stored checksum header value (to simulate corruption)
   */
  void setObjectChecksum(const std::string& path, ChecksumAlgorithm algorithm,
                         const std::string& value);

  // --- multipart state ---
  bool uploadExists(const std::string& upload_id) const;
  size_t openUploads() const;
  std::vector<uint32_t> uploadedParts(const std::string& upload_id) const;
  /**
   * Forget an upload as if it expired on the server
   */
  void dropUpload(const std::string& upload_id);

  // --- observation ---
  std::vector<RecordedRequest> requests() const;
  std::vector<RecordedRequest> requests(const std::string& operation) const;
  size_t count(const std::string& operation) const;
  size_t peakInFlight() const { return peak_in_flight_.load(); }
  size_t inFlight() const { return in_flight_.load(); }
  void clearRequests();

private:
  friend class FakeConnection;
  friend class FakeStream;

  struct StoredObject {
    std::string data;
    std::string etag;
    std::map<std::string, std::string> checksums;  // header name -> value
  };

  struct StoredPart {
    std::string data;
    std::string etag;
    std::string checksum;
  };

  struct Fault {
    int times = 0;
    int status = 500;
    std::string code;
  };

  struct Upload {
    std::string path;
    std::string algorithm_header;  // x-amz-checksum-<alg>, empty for none
    std::map<uint32_t, StoredPart> parts;
  };

  /**
   * Parse, record and answer one request
   */
  FakeResponse handle(const HttpRequest& request, const std::string& body);

  RecordedRequest decode(const HttpRequest& request, const std::string& body) const;
  FakeResponse serve(RecordedRequest& request);

  FakeResponse serveHead(const RecordedRequest& request);
  FakeResponse serveGet(const RecordedRequest& request);
  FakeResponse servePut(const RecordedRequest& request);
  FakeResponse serveCopy(const RecordedRequest& request);
  FakeResponse serveCreate(const RecordedRequest& request);
  FakeResponse serveUploadPart(const RecordedRequest& request);
  FakeResponse serveUploadPartCopy(const RecordedRequest& request);
  FakeResponse serveComplete(const RecordedRequest& request);
  FakeResponse serveAbort(const RecordedRequest& request);
  FakeResponse serveListParts(const RecordedRequest& request);

  std::optional<FakeResponse> verifyUploadChecksum(
    const RecordedRequest& request, std::string& header_name, std::string& value
  ) const;

  void onStart();
  void onFinish();

  boost::asio::io_context& io_;
  size_t max_connections_;
  std::chrono::milliseconds delay_{0};
  HttpProtocolVersion version_ = HttpProtocolVersion::HTTP_1_1;
  size_t list_page_size_ = 1000;
  bool ignore_range_ = false;

  // Recursive so interceptors may call back into the service
  mutable std::recursive_mutex mutex_;
  Interceptor interceptor_;
  std::map<uint32_t, Fault> part_faults_;
  std::map<uint64_t, Fault> range_faults_;
  std::map<std::string, StoredObject> objects_;
  std::map<std::string, Upload> uploads_;
  std::vector<RecordedRequest> requests_;
  std::map<std::string, int> attempts_;
  uint64_t next_upload_ = 1;

  std::atomic<size_t> in_flight_{0};
  std::atomic<size_t> peak_in_flight_{0};
};

/**
 * io_context running on a background thread, for tests that block on
 * MetaRequest::wait()
 */
class IoThread {
public:
  IoThread();
  ~IoThread();

  IoThread(const IoThread&) = delete;
  IoThread& operator=(const IoThread&) = delete;

  boost::asio::io_context& context() { return io_; }

private:
  boost::asio::io_context io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  std::thread thread_;
};

/**
 * Input stream that cannot seek or report its length, like a pipe
 */
class UnseekableStream : public std::istream {
public:
  explicit UnseekableStream(std::string data);

private:
  class Buffer : public std::streambuf {
  public:
    explicit Buffer(std::string data);

  private:
    std::string data_;
  };

  Buffer buffer_;
};

/**
 * Deterministic test payload of `size` bytes
 */
std::string makePayload(size_t size, uint32_t seed = 7);

}  // namespace test
}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_TEST_FAKE_S3_SERVICE_HPP
