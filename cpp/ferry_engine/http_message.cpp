#include "http_message.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace ferry {
namespace engine {

bool HttpHeaders::nameEquals(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
  remove(name);
  entries_.emplace_back(name, value);
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
  entries_.emplace_back(name, value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
  for (const auto& entry : entries_) {
    if (nameEquals(entry.first, name)) {
      return entry.second;
    }
  }
  return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
  return get(name).has_value();
}

void HttpHeaders::remove(const std::string& name) {
  entries_.erase(
    std::remove_if(
      entries_.begin(), entries_.end(),
      [&name](const Entry& entry) { return nameEquals(entry.first, name); }
    ),
    entries_.end()
  );
}

std::string HttpRequest::objectPath() const {
  auto pos = path.find('?');
  return pos == std::string::npos ? path : path.substr(0, pos);
}

std::string HttpRequest::query() const {
  auto pos = path.find('?');
  return pos == std::string::npos ? std::string() : path.substr(pos + 1);
}

Endpoint Endpoint::parse(const std::string& url) {
  Endpoint endpoint;
  std::string rest = url;

  auto scheme_end = rest.find("://");
  if (scheme_end != std::string::npos) {
    endpoint.scheme = rest.substr(0, scheme_end);
    std::transform(
      endpoint.scheme.begin(), endpoint.scheme.end(), endpoint.scheme.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); }
    );
    rest = rest.substr(scheme_end + 3);
  }
  endpoint.port = endpoint.scheme == "https" ? 443 : 80;

  auto slash = rest.find('/');
  if (slash != std::string::npos) {
    rest = rest.substr(0, slash);
  }

  auto colon = rest.rfind(':');
  if (colon != std::string::npos) {
    std::string port_str = rest.substr(colon + 1);
    rest = rest.substr(0, colon);
    if (port_str.empty() ||
        !std::all_of(port_str.begin(), port_str.end(), [](unsigned char c) {
          return std::isdigit(c);
        })) {
      throw std::invalid_argument("Invalid port in endpoint: " + url);
    }
    unsigned long port = std::stoul(port_str);
    if (port == 0 || port > 65535) {
      throw std::invalid_argument("Port out of range in endpoint: " + url);
    }
    endpoint.port = static_cast<uint16_t>(port);
  }

  if (rest.empty()) {
    throw std::invalid_argument("Missing host in endpoint: " + url);
  }
  endpoint.host = rest;
  return endpoint;
}

std::string Endpoint::hostHeader() const {
  bool default_port = (scheme == "https" && port == 443) || (scheme == "http" && port == 80);
  return default_port ? host : host + ":" + std::to_string(port);
}

std::string Endpoint::toString() const {
  return scheme + "://" + host + ":" + std::to_string(port);
}

std::string uriEncode(const std::string& value, bool keep_slash) {
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
        (keep_slash && c == '/')) {
      out.push_back(static_cast<char>(c));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out.append(buf);
    }
  }
  return out;
}

bool isSuccessStatus(int status) {
  return status >= 200 && status < 300;
}

}  // namespace engine
}  // namespace ferry
