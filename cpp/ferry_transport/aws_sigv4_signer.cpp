#include "aws_sigv4_signer.hpp"

#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/auth/AWSCredentialsProviderChain.h>
#include <aws/core/http/HttpTypes.h>
#include <aws/core/http/URI.h>
#include <aws/core/http/standard/StandardHttpRequest.h>
#include <aws/core/utils/DateTime.h>
#include <aws/core/utils/HashingUtils.h>
#include <aws/core/utils/StringUtils.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#define FERRY_LOG_COMPONENT "sigv4_signer"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace transport {

using logging::kv;

namespace {

const char* kAllocationTag = "FerrySigV4";
const char* kContentSha256 = "x-amz-content-sha256";
const char* kTrailerPayload = "STREAMING-UNSIGNED-PAYLOAD-TRAILER";

// Headers produced by the SDK signer that travel with the request
const char* const kSignedHeaders[] = {
  "authorization", "x-amz-date", "x-amz-content-sha256", "x-amz-security-token"
};

std::string envOrEmpty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

bool toAwsMethod(const std::string& method, Aws::Http::HttpMethod& out) {
  if (method == "GET") {
    out = Aws::Http::HttpMethod::HTTP_GET;
  } else if (method == "PUT") {
    out = Aws::Http::HttpMethod::HTTP_PUT;
  } else if (method == "POST") {
    out = Aws::Http::HttpMethod::HTTP_POST;
  } else if (method == "DELETE") {
    out = Aws::Http::HttpMethod::HTTP_DELETE;
  } else if (method == "HEAD") {
    out = Aws::Http::HttpMethod::HTTP_HEAD;
  } else {
    return false;
  }
  return true;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  return -1;
}

std::string lowercase(std::string value) {
  for (auto& c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return value;
}

std::string trim(const std::string& value) {
  size_t first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  size_t last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

std::string uriEncode(const std::string& value) {
  return Aws::Utils::StringUtils::URLEncode(value.c_str()).c_str();
}

// Each path segment encoded once, slashes kept
std::string canonicalPath(const std::string& path) {
  std::string decoded = uriDecode(path);
  if (decoded.empty()) {
    return "/";
  }
  std::string out;
  size_t start = 0;
  while (true) {
    size_t slash = decoded.find('/', start);
    out += uriEncode(decoded.substr(start, slash - start));
    if (slash == std::string::npos) {
      break;
    }
    out += '/';
    start = slash + 1;
  }
  return out;
}

std::string canonicalQuery(const std::string& query) {
  std::vector<std::pair<std::string, std::string>> params;
  if (query.empty()) {
    return "";
  }
  size_t start = 0;
  while (true) {
    size_t amp = query.find('&', start);
    std::string item = query.substr(start, amp == std::string::npos ? amp : amp - start);
    if (!item.empty()) {
      size_t eq = item.find('=');
      std::string key = uriDecode(item.substr(0, eq));
      std::string value = eq == std::string::npos ? "" : uriDecode(item.substr(eq + 1));
      params.emplace_back(uriEncode(key), uriEncode(value));
    }
    if (amp == std::string::npos) {
      break;
    }
    start = amp + 1;
  }
  std::sort(params.begin(), params.end());

  std::string out;
  for (const auto& param : params) {
    if (!out.empty()) {
      out += '&';
    }
    out += param.first + "=" + param.second;
  }
  return out;
}

Aws::Utils::ByteBuffer toBuffer(const std::string& value) {
  return Aws::Utils::ByteBuffer(
    reinterpret_cast<const unsigned char*>(value.data()), value.size()
  );
}

Aws::Utils::ByteBuffer hmac(const Aws::Utils::ByteBuffer& key, const std::string& message) {
  return Aws::Utils::HashingUtils::CalculateSHA256HMAC(toBuffer(message), key);
}

std::string sha256Hex(const std::string& value) {
  return Aws::Utils::HashingUtils::HexEncode(
           Aws::Utils::HashingUtils::CalculateSHA256(Aws::String(value.c_str(), value.size()))
  )
    .c_str();
}

}  // namespace

std::string uriDecode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      int hi = hexValue(value[i + 1]);
      int lo = hexValue(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(value[i]);
  }
  return out;
}

struct AwsSigV4Signer::Impl {
  std::shared_ptr<Aws::Auth::AWSCredentialsProvider> credentials;
  std::shared_ptr<Aws::Client::AWSAuthV4Signer> signer;
  bool sign_payload = false;

  bool signStreamingTrailer(engine::HttpRequest& request, const engine::SigningConfig& config);
};

// aws-chunked bodies with an unsigned trailer must be signed over the literal
// STREAMING-UNSIGNED-PAYLOAD-TRAILER hash; the SDK signer always substitutes
// its own payload hash, so the canonical request is assembled here
bool AwsSigV4Signer::Impl::signStreamingTrailer(
  engine::HttpRequest& request, const engine::SigningConfig& config
) {
  Aws::Auth::AWSCredentials current = credentials->GetAWSCredentials();
  if (current.GetAWSAccessKeyId().empty() || current.GetAWSSecretKey().empty()) {
    FERRY_LOG_ERROR("No credentials available for signing" << kv("path", request.path));
    return false;
  }

  Aws::Utils::DateTime now = Aws::Utils::DateTime::Now();
  std::string amz_date = now.ToGmtString("%Y%m%dT%H%M%SZ").c_str();
  std::string date = now.ToGmtString("%Y%m%d").c_str();

  request.headers.remove("Authorization");
  request.headers.remove("x-amz-security-token");
  request.headers.set("x-amz-date", amz_date);
  request.headers.set(kContentSha256, kTrailerPayload);
  std::string token = current.GetSessionToken().c_str();
  if (!token.empty()) {
    request.headers.set("x-amz-security-token", token);
  }

  std::map<std::string, std::string> headers;
  for (const auto& header : request.headers) {
    headers[lowercase(header.first)] = trim(header.second);
  }
  std::string canonical_headers;
  std::string signed_headers;
  for (const auto& header : headers) {
    canonical_headers += header.first + ":" + header.second + "\n";
    if (!signed_headers.empty()) {
      signed_headers += ';';
    }
    signed_headers += header.first;
  }

  std::string canonical_request = request.method + "\n" + canonicalPath(request.objectPath()) +
                                  "\n" + canonicalQuery(request.query()) + "\n" +
                                  canonical_headers + "\n" + signed_headers + "\n" +
                                  kTrailerPayload;

  std::string scope = date + "/" + config.region + "/" + config.service + "/aws4_request";
  std::string string_to_sign =
    "AWS4-HMAC-SHA256\n" + amz_date + "\n" + scope + "\n" + sha256Hex(canonical_request);

  std::string secret = current.GetAWSSecretKey().c_str();
  Aws::Utils::ByteBuffer key = hmac(toBuffer("AWS4" + secret), date);
  key = hmac(key, config.region);
  key = hmac(key, config.service);
  key = hmac(key, "aws4_request");
  std::string signature =
    Aws::Utils::HashingUtils::HexEncode(hmac(key, string_to_sign)).c_str();

  request.headers.set(
    "Authorization", "AWS4-HMAC-SHA256 Credential=" +
                       std::string(current.GetAWSAccessKeyId().c_str()) + "/" + scope +
                       ", SignedHeaders=" + signed_headers + ", Signature=" + signature
  );
  return true;
}

AwsSigV4Signer::AwsSigV4Signer(const engine::SigningConfig& config)
    : config_(config)
    , impl_(std::make_unique<Impl>()) {
  std::string access_key = config.access_key;
  std::string secret_key = config.secret_key;
  std::string session_token = config.session_token;
  std::string source = "config";

  if (access_key.empty() || secret_key.empty()) {
    access_key = envOrEmpty("AWS_ACCESS_KEY_ID");
    secret_key = envOrEmpty("AWS_SECRET_ACCESS_KEY");
    session_token = envOrEmpty("AWS_SESSION_TOKEN");
    source = "environment";
  }

  if (!access_key.empty() && !secret_key.empty()) {
    impl_->credentials = Aws::MakeShared<Aws::Auth::SimpleAWSCredentialsProvider>(
      kAllocationTag, access_key.c_str(), secret_key.c_str(), session_token.c_str()
    );
  } else {
    impl_->credentials =
      Aws::MakeShared<Aws::Auth::DefaultAWSCredentialsProviderChain>(kAllocationTag);
    source = "default_chain";
  }

  impl_->sign_payload = config.sign_payload;
  impl_->signer = Aws::MakeShared<Aws::Client::AWSAuthV4Signer>(
    kAllocationTag, impl_->credentials, config.service.c_str(), config.region.c_str(),
    config.sign_payload ? Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Always
                        : Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
    false
  );

  FERRY_LOG_DEBUG(
    "SigV4 signer ready" << kv("region", config.region) << kv("service", config.service)
                         << kv("credentials", source) << kv("sign_payload", config.sign_payload)
  );
}

AwsSigV4Signer::~AwsSigV4Signer() = default;

bool AwsSigV4Signer::sign(engine::HttpRequest& request, const std::string* payload) {
  auto host = request.headers.get("Host");
  if (!host || host->empty()) {
    FERRY_LOG_ERROR("Cannot sign request without Host header" << kv("path", request.path));
    return false;
  }

  Aws::Http::HttpMethod method;
  if (!toAwsMethod(request.method, method)) {
    FERRY_LOG_ERROR("Cannot sign unsupported method" << kv("method", request.method));
    return false;
  }

  if (request.headers.get(kContentSha256) == std::optional<std::string>(kTrailerPayload)) {
    return impl_->signStreamingTrailer(request, config_);
  }

  // The scheme is not part of the canonical request. With https the SDK
  // leaves the payload as UNSIGNED-PAYLOAD unless sign_payload asks for a hash
  Aws::Http::URI uri(("https://" + *host).c_str());
  uri.SetPath(uriDecode(request.objectPath()).c_str());
  std::string query = request.query();
  if (!query.empty()) {
    uri.SetQueryString(("?" + query).c_str());
  }

  Aws::Http::Standard::StandardHttpRequest aws_request(uri, method);
  for (const auto& header : request.headers) {
    std::string name = lowercase(header.first);
    // Output of an earlier signing pass must not be signed again
    if (std::find(std::begin(kSignedHeaders), std::end(kSignedHeaders), name) !=
        std::end(kSignedHeaders)) {
      continue;
    }
    aws_request.SetHeaderValue(name.c_str(), header.second.c_str());
  }
  if (impl_->sign_payload) {
    auto body = Aws::MakeShared<Aws::StringStream>(kAllocationTag);
    if (payload) {
      *body << *payload;
    }
    aws_request.AddContentBody(body);
  }

  if (!impl_->signer->SignRequest(aws_request)) {
    FERRY_LOG_ERROR(
      "SigV4 signing failed" << kv("method", request.method) << kv("path", request.path)
    );
    return false;
  }

  request.headers.remove("x-amz-security-token");
  for (const char* name : kSignedHeaders) {
    if (aws_request.HasHeader(name)) {
      request.headers.set(name, std::string(aws_request.GetHeaderValue(name).c_str()));
    }
  }
  return true;
}

}  // namespace transport
}  // namespace ferry
