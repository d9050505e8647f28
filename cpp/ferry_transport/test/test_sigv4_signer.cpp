/**
 * Unit tests for AwsSigV4Signer
 */

#include <gtest/gtest.h>

#include <string>

#include "aws_sigv4_signer.hpp"
#include "sdk_environment.hpp"

using namespace ferry::engine;
using ferry::transport::AwsSigV4Signer;
using ferry::transport::uriDecode;

FERRY_TEST_KEEP_SDK_ALIVE();

namespace {

SigningConfig staticCredentials() {
  SigningConfig config;
  config.region = "eu-west-1";
  config.access_key = "AKIDEXAMPLE";
  config.secret_key = "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY";
  return config;
}

HttpRequest objectRequest(const std::string& method, const std::string& path) {
  HttpRequest request;
  request.method = method;
  request.path = path;
  request.headers.set("Host", "127.0.0.1:9000");
  return request;
}

}  // namespace

TEST(AwsSigV4SignerTest, AddsAuthorizationHeaders) {
  AwsSigV4Signer signer(staticCredentials());
  HttpRequest request = objectRequest("PUT", "/bucket/some%20key?partNumber=2&uploadId=abc");
  request.headers.set("Content-Length", "5");
  std::string payload = "hello";

  ASSERT_TRUE(signer.sign(request, &payload));

  auto authorization = request.headers.get("Authorization");
  ASSERT_TRUE(authorization.has_value());
  EXPECT_EQ(authorization->rfind("AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/", 0), 0u);
  EXPECT_NE(authorization->find("/eu-west-1/s3/aws4_request"), std::string::npos);
  EXPECT_NE(authorization->find("SignedHeaders="), std::string::npos);
  EXPECT_NE(authorization->find("host"), std::string::npos);
  EXPECT_NE(authorization->find("Signature="), std::string::npos);

  auto date = request.headers.get("x-amz-date");
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(date->size(), 16u);  // yyyyMMddTHHmmssZ
  EXPECT_EQ(request.headers.get("x-amz-content-sha256"), std::string("UNSIGNED-PAYLOAD"));
  EXPECT_FALSE(request.headers.has("x-amz-security-token"));

  // Path and query are left untouched
  EXPECT_EQ(request.path, "/bucket/some%20key?partNumber=2&uploadId=abc");
}

TEST(AwsSigV4SignerTest, SignedPayloadCarriesBodyHash) {
  SigningConfig config = staticCredentials();
  config.sign_payload = true;
  AwsSigV4Signer signer(config);

  HttpRequest request = objectRequest("PUT", "/bucket/key");
  std::string payload = "hello";
  ASSERT_TRUE(signer.sign(request, &payload));

  EXPECT_EQ(
    request.headers.get("x-amz-content-sha256"),
    std::string("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824")
  );
}

TEST(AwsSigV4SignerTest, UnsignedPayloadWithoutBody) {
  AwsSigV4Signer signer(staticCredentials());
  HttpRequest request = objectRequest("GET", "/bucket/key");

  ASSERT_TRUE(signer.sign(request, nullptr));
  EXPECT_EQ(request.headers.get("x-amz-content-sha256"), std::string("UNSIGNED-PAYLOAD"));
}

TEST(AwsSigV4SignerTest, TrailerUploadKeepsStreamingPayloadHash) {
  for (bool sign_payload : {false, true}) {
    SigningConfig config = staticCredentials();
    config.sign_payload = sign_payload;
    AwsSigV4Signer signer(config);

    HttpRequest request = objectRequest("PUT", "/bucket/some%20key?uploadId=abc&partNumber=3");
    request.headers.set("Content-Encoding", "aws-chunked");
    request.headers.set("x-amz-decoded-content-length", "5");
    request.headers.set("x-amz-trailer", "x-amz-checksum-crc32");
    request.headers.set("x-amz-content-sha256", "STREAMING-UNSIGNED-PAYLOAD-TRAILER");
    std::string payload = "5\r\nhello\r\n0\r\nx-amz-checksum-crc32:NhCmhg==\r\n\r\n";

    ASSERT_TRUE(signer.sign(request, &payload)) << "sign_payload=" << sign_payload;
    EXPECT_EQ(
      request.headers.get("x-amz-content-sha256"),
      std::string("STREAMING-UNSIGNED-PAYLOAD-TRAILER")
    );

    auto authorization = request.headers.get("Authorization");
    ASSERT_TRUE(authorization.has_value());
    EXPECT_EQ(authorization->rfind("AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/", 0), 0u);
    EXPECT_NE(
      authorization->find("SignedHeaders=content-encoding;host;x-amz-content-sha256;x-amz-date;"
                          "x-amz-decoded-content-length;x-amz-trailer,"),
      std::string::npos
    ) << *authorization;
    auto signature = authorization->find("Signature=");
    ASSERT_NE(signature, std::string::npos);
    EXPECT_EQ(authorization->size() - signature - 10, 64u);
  }
}

TEST(AwsSigV4SignerTest, ResigningTrailerUploadReplacesSignature) {
  AwsSigV4Signer signer(staticCredentials());
  HttpRequest request = objectRequest("PUT", "/bucket/key?uploadId=abc&partNumber=1");
  request.headers.set("x-amz-content-sha256", "STREAMING-UNSIGNED-PAYLOAD-TRAILER");

  ASSERT_TRUE(signer.sign(request, nullptr));
  ASSERT_TRUE(signer.sign(request, nullptr));

  auto authorization = request.headers.get("Authorization");
  ASSERT_TRUE(authorization.has_value());
  EXPECT_EQ(authorization->find("authorization"), std::string::npos);
  EXPECT_EQ(
    request.headers.get("x-amz-content-sha256"), std::string("STREAMING-UNSIGNED-PAYLOAD-TRAILER")
  );
}

TEST(AwsSigV4SignerTest, SessionTokenIsForwarded) {
  SigningConfig config = staticCredentials();
  config.session_token = "session-token";
  AwsSigV4Signer signer(config);

  HttpRequest request = objectRequest("GET", "/bucket/key");
  ASSERT_TRUE(signer.sign(request, nullptr));
  EXPECT_EQ(request.headers.get("x-amz-security-token"), std::string("session-token"));
}

TEST(AwsSigV4SignerTest, ResigningReplacesPreviousSignature) {
  AwsSigV4Signer signer(staticCredentials());
  HttpRequest request = objectRequest("DELETE", "/bucket/key?uploadId=abc");

  ASSERT_TRUE(signer.sign(request, nullptr));
  ASSERT_TRUE(signer.sign(request, nullptr));

  size_t count = 0;
  for (const auto& header : request.headers) {
    if (header.first == "authorization" || header.first == "Authorization") {
      ++count;
    }
  }
  EXPECT_EQ(count, 1u);
}

TEST(AwsSigV4SignerTest, RequiresHostHeader) {
  AwsSigV4Signer signer(staticCredentials());
  HttpRequest request;
  request.method = "GET";
  request.path = "/bucket/key";

  EXPECT_FALSE(signer.sign(request, nullptr));
  EXPECT_FALSE(request.headers.has("Authorization"));
}

TEST(AwsSigV4SignerTest, RejectsUnsupportedMethod) {
  AwsSigV4Signer signer(staticCredentials());
  HttpRequest request = objectRequest("PATCH", "/bucket/key");
  EXPECT_FALSE(signer.sign(request, nullptr));
}

TEST(UriDecodeTest, DecodesEscapes) {
  EXPECT_EQ(uriDecode("/bucket/a%20b%2Fc"), "/bucket/a b/c");
  EXPECT_EQ(uriDecode("%c3%A9"), "\xC3\xA9");
  EXPECT_EQ(uriDecode("plain"), "plain");
}

TEST(UriDecodeTest, KeepsMalformedEscapes) {
  EXPECT_EQ(uriDecode("100%"), "100%");
  EXPECT_EQ(uriDecode("%zz"), "%zz");
  EXPECT_EQ(uriDecode("%4"), "%4");
}
