#ifndef FERRY_ENGINE_HTTP_MESSAGE_HPP
#define FERRY_ENGINE_HTTP_MESSAGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ferry {
namespace engine {

/**
 * Ordered header list with case-insensitive lookup.
 * Insertion order is preserved so signed requests go out exactly as built.
 */
class HttpHeaders {
public:
  using Entry = std::pair<std::string, std::string>;

  /**
   * Replace every header with this name by a single entry
   */
  void set(const std::string& name, const std::string& value);

  void add(const std::string& name, const std::string& value);

  std::optional<std::string> get(const std::string& name) const;

  bool has(const std::string& name) const;

  void remove(const std::string& name);

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
  std::vector<Entry>::const_iterator end() const { return entries_.end(); }

  static bool nameEquals(const std::string& a, const std::string& b);

private:
  std::vector<Entry> entries_;
};

/**
 * HTTP request as handed to the connection layer.
 * `path` carries the query string, e.g. "/bucket/key?uploads".
 */
struct HttpRequest {
  std::string method = "GET";
  std::string path = "/";
  HttpHeaders headers;

  /**
   * Path without the query string
   */
  std::string objectPath() const;

  /**
   * Query string without the leading '?', empty if none
   */
  std::string query() const;
};

struct HttpResponse {
  int status = 0;
  HttpHeaders headers;
  std::string body;
};

/**
 * Remote endpoint, parsed from "http://host:port" style URLs.
 */
struct Endpoint {
  std::string scheme = "http";
  std::string host;
  uint16_t port = 80;

  /**
   * @throws std::invalid_argument on an empty host or bad port
   */
  static Endpoint parse(const std::string& url);

  /**
   * Value for the Host header (port omitted when it is the scheme default)
   */
  std::string hostHeader() const;

  std::string toString() const;

  bool operator==(const Endpoint& other) const {
    return scheme == other.scheme && host == other.host && port == other.port;
  }
  bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

/**
 * Percent-encode a URI component. Slashes are kept when encoding a path.
 */
std::string uriEncode(const std::string& value, bool keep_slash);

bool isSuccessStatus(int status);

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_HTTP_MESSAGE_HPP
