#include "s3_request_factory.hpp"

#include <aws/core/utils/xml/XmlSerializer.h>

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "checksum.hpp"

namespace ferry {
namespace engine {

namespace {

using Aws::Utils::Xml::XmlDocument;
using Aws::Utils::Xml::XmlNode;

const char* kS3Namespace = "http://s3.amazonaws.com/doc/2006-03-01/";

bool startsWithNoCase(const std::string& value, const std::string& prefix) {
  return value.size() >= prefix.size() &&
         HttpHeaders::nameEquals(value.substr(0, prefix.size()), prefix);
}

bool isChecksumHeader(const std::string& name) {
  return startsWithNoCase(name, "x-amz-checksum-") ||
         HttpHeaders::nameEquals(name, "x-amz-sdk-checksum-algorithm") ||
         HttpHeaders::nameEquals(name, "x-amz-trailer") ||
         HttpHeaders::nameEquals(name, "x-amz-decoded-content-length");
}

// Headers every part of an upload must repeat
bool isPerPartHeader(const std::string& name) {
  return startsWithNoCase(name, "x-amz-server-side-encryption-customer-") ||
         HttpHeaders::nameEquals(name, "x-amz-request-payer") ||
         HttpHeaders::nameEquals(name, "x-amz-expected-bucket-owner");
}

bool isCopySourceHeader(const std::string& name) {
  return startsWithNoCase(name, "x-amz-copy-source");
}

HttpRequest withPath(const std::string& method, const std::string& path) {
  HttpRequest request;
  request.method = method;
  request.path = path;
  return request;
}

std::string checksumElementName(ChecksumAlgorithm algorithm) {
  switch (algorithm) {
    case ChecksumAlgorithm::CRC32:
      return "ChecksumCRC32";
    case ChecksumAlgorithm::CRC32C:
      return "ChecksumCRC32C";
    case ChecksumAlgorithm::SHA1:
      return "ChecksumSHA1";
    case ChecksumAlgorithm::SHA256:
      return "ChecksumSHA256";
    case ChecksumAlgorithm::NONE:
      break;
  }
  return std::string();
}

std::string algorithmHeaderValue(ChecksumAlgorithm algorithm) {
  return toString(algorithm);
}

std::optional<XmlDocument> parseXml(const std::string& xml) {
  if (xml.empty()) {
    return std::nullopt;
  }
  XmlDocument doc = XmlDocument::CreateFromXmlString(Aws::String(xml.c_str(), xml.size()));
  if (!doc.WasParseSuccessful() || doc.GetRootElement().IsNull()) {
    return std::nullopt;
  }
  return doc;
}

std::string childText(const XmlNode& node, const char* name) {
  XmlNode child = node.FirstChild(name);
  if (child.IsNull()) {
    return std::string();
  }
  return std::string(child.GetText().c_str());
}

std::optional<uint64_t> toUnsigned(const std::string& text) {
  if (text.empty() ||
      !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  try {
    return static_cast<uint64_t>(std::stoull(text));
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace

HttpRequest S3RequestFactory::headObject(const HttpRequest& original) {
  HttpRequest request = original;
  request.method = "HEAD";
  request.headers.remove("Range");
  request.headers.remove("Content-Length");
  return request;
}

HttpRequest S3RequestFactory::headCopySource(const HttpRequest& copy_request) {
  std::string source = copy_request.headers.get("x-amz-copy-source").value_or("");
  if (source.empty() || source.front() != '/') {
    source = "/" + source;
  }

  HttpRequest request = withPath("HEAD", source);
  for (const auto& header : copy_request.headers) {
    // SSE-C keys for the source travel under the copy-source prefix
    static const std::string kSourceSse = "x-amz-copy-source-server-side-encryption-customer-";
    if (startsWithNoCase(header.first, kSourceSse)) {
      request.headers.add(
        "x-amz-server-side-encryption-customer-" + header.first.substr(kSourceSse.size()),
        header.second
      );
    } else if (HttpHeaders::nameEquals(header.first, "x-amz-request-payer") ||
               HttpHeaders::nameEquals(header.first, "x-amz-expected-bucket-owner")) {
      request.headers.add(header.first, header.second);
    }
  }
  return request;
}

HttpRequest S3RequestFactory::rangedGet(
  const HttpRequest& original, const ByteRange& range, const std::string& if_match
) {
  HttpRequest request = original;
  request.method = "GET";
  request.headers.set("Range", range.toHeader());
  if (!if_match.empty()) {
    request.headers.set("If-Match", if_match);
  }
  return request;
}

HttpRequest S3RequestFactory::plainGet(const HttpRequest& original) {
  HttpRequest request = original;
  request.method = "GET";
  request.headers.remove("Range");
  return request;
}

HttpRequest S3RequestFactory::createMultipartUpload(
  const HttpRequest& original, ChecksumAlgorithm algorithm
) {
  HttpRequest request = withPath("POST", original.objectPath() + "?uploads");
  for (const auto& header : original.headers) {
    if (isChecksumHeader(header.first) || isCopySourceHeader(header.first) ||
        HttpHeaders::nameEquals(header.first, "Content-Length") ||
        HttpHeaders::nameEquals(header.first, "Content-MD5") ||
        HttpHeaders::nameEquals(header.first, "Content-Encoding")) {
      continue;
    }
    request.headers.add(header.first, header.second);
  }
  if (algorithm != ChecksumAlgorithm::NONE) {
    request.headers.set("x-amz-checksum-algorithm", algorithmHeaderValue(algorithm));
  }
  return request;
}

HttpRequest S3RequestFactory::uploadPart(
  const HttpRequest& original, uint32_t part_number, const std::string& upload_id
) {
  HttpRequest request = withPath(
    "PUT", original.objectPath() + "?partNumber=" + std::to_string(part_number) +
             "&uploadId=" + uriEncode(upload_id, false)
  );
  for (const auto& header : original.headers) {
    if (isPerPartHeader(header.first)) {
      request.headers.add(header.first, header.second);
    }
  }
  return request;
}

HttpRequest S3RequestFactory::uploadPartCopy(
  const HttpRequest& original, uint32_t part_number, const std::string& upload_id,
  const ByteRange& source_range
) {
  HttpRequest request = uploadPart(original, part_number, upload_id);
  for (const auto& header : original.headers) {
    if (isCopySourceHeader(header.first)) {
      request.headers.add(header.first, header.second);
    }
  }
  request.headers.set("x-amz-copy-source-range", source_range.toHeader());
  return request;
}

HttpRequest S3RequestFactory::completeMultipartUpload(
  const HttpRequest& original, const std::string& upload_id,
  const std::vector<CompletedPart>& parts, ChecksumAlgorithm algorithm, std::string& body
) {
  HttpRequest request =
    withPath("POST", original.objectPath() + "?uploadId=" + uriEncode(upload_id, false));
  for (const auto& header : original.headers) {
    if (isPerPartHeader(header.first)) {
      request.headers.add(header.first, header.second);
    }
  }

  XmlDocument doc = XmlDocument::CreateWithRootNode("CompleteMultipartUpload");
  XmlNode root = doc.GetRootElement();
  root.SetAttributeValue("xmlns", kS3Namespace);

  std::string checksum_element = checksumElementName(algorithm);
  for (const auto& part : parts) {
    XmlNode part_node = root.CreateChildElement("Part");
    part_node.CreateChildElement("PartNumber")
      .SetText(Aws::String(std::to_string(part.part_number).c_str()));
    part_node.CreateChildElement("ETag").SetText(Aws::String(part.etag.c_str()));
    if (!checksum_element.empty() && !part.checksum.empty()) {
      part_node.CreateChildElement(Aws::String(checksum_element.c_str()))
        .SetText(Aws::String(part.checksum.c_str()));
    }
  }

  body = std::string(doc.ConvertToString().c_str());
  request.headers.set("Content-Type", "application/xml");
  return request;
}

HttpRequest S3RequestFactory::abortMultipartUpload(
  const std::string& object_path, const std::string& upload_id
) {
  return withPath("DELETE", object_path + "?uploadId=" + uriEncode(upload_id, false));
}

HttpRequest S3RequestFactory::listParts(
  const std::string& object_path, const std::string& upload_id, uint32_t part_number_marker
) {
  std::string path = object_path + "?uploadId=" + uriEncode(upload_id, false);
  if (part_number_marker > 0) {
    path += "&part-number-marker=" + std::to_string(part_number_marker);
  }
  return withPath("GET", path);
}

void S3RequestFactory::attachChecksum(
  HttpRequest& request, std::string& body, const ChecksumConfig& config,
  const std::string& checksum, uint64_t decoded_length
) {
  if (!config.attachToUpload()) {
    return;
  }
  std::string header = checksumHeaderName(config.algorithm);

  if (config.location == ChecksumLocation::HEADER) {
    request.headers.set(header, checksum);
    return;
  }

  body = encodeAwsChunked(body, config.algorithm, checksum);
  request.headers.set("Content-Encoding", "aws-chunked");
  request.headers.set("x-amz-decoded-content-length", std::to_string(decoded_length));
  request.headers.set("x-amz-trailer", header);
  request.headers.set("x-amz-content-sha256", "STREAMING-UNSIGNED-PAYLOAD-TRAILER");
}

std::optional<std::string> S3ResponseParser::uploadId(const std::string& xml) {
  auto doc = parseXml(xml);
  if (!doc) {
    return std::nullopt;
  }
  XmlNode root = doc->GetRootElement();
  if (root.GetName() != "InitiateMultipartUploadResult") {
    return std::nullopt;
  }
  std::string id = childText(root, "UploadId");
  if (id.empty()) {
    return std::nullopt;
  }
  return id;
}

std::optional<S3ErrorDetail> S3ResponseParser::error(const std::string& xml) {
  auto doc = parseXml(xml);
  if (!doc) {
    return std::nullopt;
  }
  XmlNode root = doc->GetRootElement();
  if (root.GetName() != "Error") {
    return std::nullopt;
  }
  return S3ErrorDetail{childText(root, "Code"), childText(root, "Message")};
}

std::optional<S3ErrorDetail> S3ResponseParser::embeddedError(const std::string& xml) {
  auto doc = parseXml(xml);
  if (!doc) {
    return std::nullopt;
  }
  XmlNode root = doc->GetRootElement();
  if (root.GetName() == "Error") {
    return S3ErrorDetail{childText(root, "Code"), childText(root, "Message")};
  }
  XmlNode nested = root.FirstChild("Error");
  if (!nested.IsNull()) {
    return S3ErrorDetail{childText(nested, "Code"), childText(nested, "Message")};
  }
  return std::nullopt;
}

std::optional<ContentRange> S3ResponseParser::contentRange(const std::string& header) {
  unsigned long long first = 0;
  unsigned long long last = 0;
  unsigned long long total = 0;
  if (std::sscanf(header.c_str(), "bytes %llu-%llu/%llu", &first, &last, &total) != 3 ||
      last < first || last >= total) {
    return std::nullopt;
  }
  return ContentRange{first, last, total};
}

std::optional<std::string> S3ResponseParser::resultEtag(const std::string& xml) {
  auto doc = parseXml(xml);
  if (!doc) {
    return std::nullopt;
  }
  std::string etag = childText(doc->GetRootElement(), "ETag");
  if (etag.empty()) {
    return std::nullopt;
  }
  return etag;
}

std::optional<ListPartsPage> S3ResponseParser::listParts(const std::string& xml) {
  auto doc = parseXml(xml);
  if (!doc) {
    return std::nullopt;
  }
  XmlNode root = doc->GetRootElement();
  if (root.GetName() != "ListPartsResult") {
    return std::nullopt;
  }

  ListPartsPage page;
  page.is_truncated = childText(root, "IsTruncated") == "true";
  if (auto marker = toUnsigned(childText(root, "NextPartNumberMarker"))) {
    page.next_part_number_marker = static_cast<uint32_t>(*marker);
  }

  for (XmlNode part = root.FirstChild("Part"); !part.IsNull(); part = part.NextNode("Part")) {
    auto number = toUnsigned(childText(part, "PartNumber"));
    if (!number) {
      return std::nullopt;
    }
    ListedPart listed;
    listed.part_number = static_cast<uint32_t>(*number);
    listed.etag = childText(part, "ETag");
    listed.size = toUnsigned(childText(part, "Size")).value_or(0);
    page.parts.push_back(std::move(listed));
  }
  return page;
}

}  // namespace engine
}  // namespace ferry
