/**
 * Unit tests for S3RequestFactory and S3ResponseParser
 */

#include <gtest/gtest.h>

#include "checksum.hpp"
#include "s3_request_factory.hpp"
#include "sdk_environment.hpp"

using namespace ferry::engine;

FERRY_TEST_KEEP_SDK_ALIVE();

namespace {

HttpRequest putRequest() {
  HttpRequest request;
  request.method = "PUT";
  request.path = "/bucket/dir/key.bin";
  request.headers.set("Content-Type", "application/octet-stream");
  request.headers.set("Content-Length", "1048576");
  request.headers.set("x-amz-request-payer", "requester");
  request.headers.set("x-amz-server-side-encryption-customer-algorithm", "AES256");
  request.headers.set("x-amz-checksum-crc32", "stale");
  return request;
}

}  // namespace

// --- request builders ---

TEST(S3RequestFactoryTest, CreateMultipartUploadCarriesObjectHeaders) {
  HttpRequest request =
    S3RequestFactory::createMultipartUpload(putRequest(), ChecksumAlgorithm::SHA256);

  EXPECT_EQ(request.method, "POST");
  EXPECT_EQ(request.path, "/bucket/dir/key.bin?uploads");
  EXPECT_EQ(request.headers.get("Content-Type"), std::string("application/octet-stream"));
  EXPECT_EQ(request.headers.get("x-amz-checksum-algorithm"), std::string("SHA256"));
  EXPECT_FALSE(request.headers.has("Content-Length"));
  EXPECT_FALSE(request.headers.has("x-amz-checksum-crc32"));
}

TEST(S3RequestFactoryTest, CreateMultipartUploadWithoutChecksum) {
  HttpRequest request =
    S3RequestFactory::createMultipartUpload(putRequest(), ChecksumAlgorithm::NONE);
  EXPECT_FALSE(request.headers.has("x-amz-checksum-algorithm"));
}

TEST(S3RequestFactoryTest, UploadPartKeepsOnlyPerPartHeaders) {
  HttpRequest request = S3RequestFactory::uploadPart(putRequest(), 7, "id/with+chars");

  EXPECT_EQ(request.method, "PUT");
  EXPECT_EQ(request.path, "/bucket/dir/key.bin?partNumber=7&uploadId=id%2Fwith%2Bchars");
  EXPECT_EQ(request.headers.get("x-amz-request-payer"), std::string("requester"));
  EXPECT_TRUE(request.headers.has("x-amz-server-side-encryption-customer-algorithm"));
  EXPECT_FALSE(request.headers.has("Content-Type"));
  EXPECT_FALSE(request.headers.has("x-amz-checksum-crc32"));
}

TEST(S3RequestFactoryTest, UploadPartCopyAddsSourceRange) {
  HttpRequest copy;
  copy.method = "PUT";
  copy.path = "/bucket/dst";
  copy.headers.set("x-amz-copy-source", "/bucket/src");
  copy.headers.set("x-amz-copy-source-if-match", "\"abc\"");

  HttpRequest request = S3RequestFactory::uploadPartCopy(copy, 2, "u1", ByteRange{100, 50});

  EXPECT_EQ(request.path, "/bucket/dst?partNumber=2&uploadId=u1");
  EXPECT_EQ(request.headers.get("x-amz-copy-source"), std::string("/bucket/src"));
  EXPECT_EQ(request.headers.get("x-amz-copy-source-if-match"), std::string("\"abc\""));
  EXPECT_EQ(request.headers.get("x-amz-copy-source-range"), std::string("bytes=100-149"));
}

TEST(S3RequestFactoryTest, HeadCopySourceTranslatesSseHeaders) {
  HttpRequest copy;
  copy.method = "PUT";
  copy.path = "/bucket/dst";
  copy.headers.set("x-amz-copy-source", "bucket/src%20file");
  copy.headers.set("x-amz-copy-source-server-side-encryption-customer-key", "KEY");
  copy.headers.set("x-amz-expected-bucket-owner", "123");

  HttpRequest head = S3RequestFactory::headCopySource(copy);
  EXPECT_EQ(head.method, "HEAD");
  EXPECT_EQ(head.path, "/bucket/src%20file");
  EXPECT_EQ(head.headers.get("x-amz-server-side-encryption-customer-key"), std::string("KEY"));
  EXPECT_EQ(head.headers.get("x-amz-expected-bucket-owner"), std::string("123"));
  EXPECT_FALSE(head.headers.has("x-amz-copy-source"));
}

TEST(S3RequestFactoryTest, RangedAndPlainGet) {
  HttpRequest get;
  get.path = "/bucket/key";
  get.headers.set("Range", "bytes=0-1");

  HttpRequest ranged = S3RequestFactory::rangedGet(get, ByteRange{8, 8}, "\"etag\"");
  EXPECT_EQ(ranged.headers.get("Range"), std::string("bytes=8-15"));
  EXPECT_EQ(ranged.headers.get("If-Match"), std::string("\"etag\""));

  HttpRequest first = S3RequestFactory::rangedGet(get, ByteRange{0, 8}, "");
  EXPECT_FALSE(first.headers.has("If-Match"));

  HttpRequest plain = S3RequestFactory::plainGet(get);
  EXPECT_EQ(plain.method, "GET");
  EXPECT_FALSE(plain.headers.has("Range"));

  HttpRequest head = S3RequestFactory::headObject(get);
  EXPECT_EQ(head.method, "HEAD");
  EXPECT_FALSE(head.headers.has("Range"));
}

TEST(S3RequestFactoryTest, CompleteMultipartUploadDocument) {
  std::vector<CompletedPart> parts = {
    {1, "\"e1\"", 10, "c1=="},
    {2, "\"e2\"", 5, "c2=="},
  };
  std::string body;
  HttpRequest request = S3RequestFactory::completeMultipartUpload(
    putRequest(), "u1", parts, ChecksumAlgorithm::CRC32C, body
  );

  EXPECT_EQ(request.method, "POST");
  EXPECT_EQ(request.path, "/bucket/dir/key.bin?uploadId=u1");
  EXPECT_EQ(request.headers.get("Content-Type"), std::string("application/xml"));
  EXPECT_NE(body.find("<CompleteMultipartUpload"), std::string::npos);
  EXPECT_NE(body.find("<PartNumber>1</PartNumber>"), std::string::npos);
  EXPECT_NE(body.find("<ChecksumCRC32C>c2==</ChecksumCRC32C>"), std::string::npos);
  EXPECT_LT(body.find("<PartNumber>1</PartNumber>"), body.find("<PartNumber>2</PartNumber>"));
}

TEST(S3RequestFactoryTest, CompleteWithoutChecksumHasNoChecksumElements) {
  std::vector<CompletedPart> parts = {{1, "\"e1\"", 10, ""}};
  std::string body;
  S3RequestFactory::completeMultipartUpload(putRequest(), "u1", parts, ChecksumAlgorithm::NONE, body);
  EXPECT_EQ(body.find("<Checksum"), std::string::npos);
}

TEST(S3RequestFactoryTest, AbortAndListParts) {
  HttpRequest abort = S3RequestFactory::abortMultipartUpload("/bucket/key", "u1");
  EXPECT_EQ(abort.method, "DELETE");
  EXPECT_EQ(abort.path, "/bucket/key?uploadId=u1");

  HttpRequest first = S3RequestFactory::listParts("/bucket/key", "u1", 0);
  EXPECT_EQ(first.method, "GET");
  EXPECT_EQ(first.path, "/bucket/key?uploadId=u1");

  HttpRequest next = S3RequestFactory::listParts("/bucket/key", "u1", 1000);
  EXPECT_EQ(next.path, "/bucket/key?uploadId=u1&part-number-marker=1000");
}

TEST(S3RequestFactoryTest, AttachChecksumAsHeader) {
  ChecksumConfig config;
  config.algorithm = ChecksumAlgorithm::CRC32;
  config.location = ChecksumLocation::HEADER;

  HttpRequest request;
  std::string body = "hello";
  S3RequestFactory::attachChecksum(request, body, config, "abc=", body.size());

  EXPECT_EQ(request.headers.get("x-amz-checksum-crc32"), std::string("abc="));
  EXPECT_EQ(body, "hello");
  EXPECT_FALSE(request.headers.has("Content-Encoding"));
}

TEST(S3RequestFactoryTest, AttachChecksumAsTrailer) {
  ChecksumConfig config;
  config.algorithm = ChecksumAlgorithm::SHA1;
  config.location = ChecksumLocation::TRAILER;

  HttpRequest request;
  std::string body = "hello";
  std::string checksum = computeChecksum(ChecksumAlgorithm::SHA1, body);
  S3RequestFactory::attachChecksum(request, body, config, checksum, 5);

  EXPECT_EQ(request.headers.get("Content-Encoding"), std::string("aws-chunked"));
  EXPECT_EQ(request.headers.get("x-amz-decoded-content-length"), std::string("5"));
  EXPECT_EQ(request.headers.get("x-amz-trailer"), std::string("x-amz-checksum-sha1"));
  EXPECT_EQ(
    request.headers.get("x-amz-content-sha256"), std::string("STREAMING-UNSIGNED-PAYLOAD-TRAILER")
  );
  EXPECT_FALSE(request.headers.has("x-amz-checksum-sha1"));

  auto decoded = decodeAwsChunked(body);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->payload, "hello");
  EXPECT_EQ(decoded->trailer_value, checksum);
}

TEST(S3RequestFactoryTest, AttachChecksumDisabled) {
  ChecksumConfig none;
  HttpRequest request;
  std::string body = "hello";
  S3RequestFactory::attachChecksum(request, body, none, "x", 5);
  EXPECT_TRUE(request.headers.empty());

  ChecksumConfig nowhere;
  nowhere.algorithm = ChecksumAlgorithm::CRC32;
  nowhere.location = ChecksumLocation::NONE;
  S3RequestFactory::attachChecksum(request, body, nowhere, "x", 5);
  EXPECT_TRUE(request.headers.empty());
  EXPECT_EQ(body, "hello");
}

// --- response parsers ---

TEST(S3ResponseParserTest, UploadId) {
  EXPECT_EQ(
    S3ResponseParser::uploadId(
      "<?xml version=\"1.0\"?><InitiateMultipartUploadResult><Bucket>b</Bucket><Key>k</Key>"
      "<UploadId>abc-123</UploadId></InitiateMultipartUploadResult>"
    ),
    std::string("abc-123")
  );
  EXPECT_FALSE(S3ResponseParser::uploadId("").has_value());
  EXPECT_FALSE(S3ResponseParser::uploadId("not xml at all").has_value());
  EXPECT_FALSE(
    S3ResponseParser::uploadId("<InitiateMultipartUploadResult></InitiateMultipartUploadResult>")
      .has_value()
  );
  EXPECT_FALSE(S3ResponseParser::uploadId("<Other><UploadId>x</UploadId></Other>").has_value());
}

TEST(S3ResponseParserTest, ErrorDocument) {
  auto error = S3ResponseParser::error(
    "<Error><Code>NoSuchUpload</Code><Message>Gone</Message><RequestId>r</RequestId></Error>"
  );
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, "NoSuchUpload");
  EXPECT_EQ(error->message, "Gone");

  EXPECT_FALSE(S3ResponseParser::error("<ListPartsResult/>").has_value());
}

TEST(S3ResponseParserTest, EmbeddedError) {
  auto top = S3ResponseParser::embeddedError(
    "<Error><Code>InternalError</Code><Message>Retry</Message></Error>"
  );
  ASSERT_TRUE(top.has_value());
  EXPECT_EQ(top->code, "InternalError");

  auto nested = S3ResponseParser::embeddedError(
    "<CompleteMultipartUploadResult><Error><Code>SlowDown</Code></Error>"
    "</CompleteMultipartUploadResult>"
  );
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->code, "SlowDown");

  EXPECT_FALSE(S3ResponseParser::embeddedError(
                 "<CopyPartResult><ETag>\"e\"</ETag></CopyPartResult>"
  )
                 .has_value());
  EXPECT_FALSE(S3ResponseParser::embeddedError("").has_value());
}

TEST(S3ResponseParserTest, ContentRange) {
  auto range = S3ResponseParser::contentRange("bytes 0-8388607/104857600");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->first, 0u);
  EXPECT_EQ(range->last, 8388607u);
  EXPECT_EQ(range->total, 104857600u);

  EXPECT_FALSE(S3ResponseParser::contentRange("").has_value());
  EXPECT_FALSE(S3ResponseParser::contentRange("bytes */100").has_value());
  EXPECT_FALSE(S3ResponseParser::contentRange("bytes 10-5/100").has_value());
  EXPECT_FALSE(S3ResponseParser::contentRange("bytes 0-100/100").has_value());
}

TEST(S3ResponseParserTest, ResultEtag) {
  EXPECT_EQ(
    S3ResponseParser::resultEtag(
      "<CompleteMultipartUploadResult><ETag>&quot;abc-3&quot;</ETag>"
      "</CompleteMultipartUploadResult>"
    ),
    std::string("\"abc-3\"")
  );
  EXPECT_FALSE(S3ResponseParser::resultEtag("<CopyPartResult/>").has_value());
}

TEST(S3ResponseParserTest, ListPartsPage) {
  auto page = S3ResponseParser::listParts(
    "<ListPartsResult><UploadId>u</UploadId><NextPartNumberMarker>2</NextPartNumberMarker>"
    "<IsTruncated>true</IsTruncated>"
    "<Part><PartNumber>1</PartNumber><ETag>\"a\"</ETag><Size>100</Size></Part>"
    "<Part><PartNumber>2</PartNumber><ETag>\"b\"</ETag><Size>50</Size></Part>"
    "</ListPartsResult>"
  );
  ASSERT_TRUE(page.has_value());
  EXPECT_TRUE(page->is_truncated);
  EXPECT_EQ(page->next_part_number_marker, 2u);
  ASSERT_EQ(page->parts.size(), 2u);
  EXPECT_EQ(page->parts[0].part_number, 1u);
  EXPECT_EQ(page->parts[0].etag, "\"a\"");
  EXPECT_EQ(page->parts[1].size, 50u);
}

TEST(S3ResponseParserTest, ListPartsRejectsBadDocuments) {
  EXPECT_FALSE(S3ResponseParser::listParts("<Error/>").has_value());
  EXPECT_FALSE(S3ResponseParser::listParts(
                 "<ListPartsResult><Part><PartNumber>x</PartNumber></Part></ListPartsResult>"
  )
                 .has_value());

  auto empty = S3ResponseParser::listParts("<ListPartsResult></ListPartsResult>");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->parts.empty());
  EXPECT_FALSE(empty->is_truncated);
}
