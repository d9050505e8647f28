#include "engine_types.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "engine_errors.hpp"

namespace ferry {
namespace engine {

namespace {

std::string lowercase(const std::string& value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace

const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:
      return "None";
    case ErrorKind::TRANSPORT:
      return "TransportError";
    case ErrorKind::CHECKSUM_MISMATCH:
      return "ChecksumMismatchError";
    case ErrorKind::PLANNING:
      return "PlanningError";
    case ErrorKind::REMOTE_SERVICE:
      return "RemoteServiceError";
    case ErrorKind::RESUME_STATE:
      return "ResumeStateError";
    case ErrorKind::ABORT_FAILURE:
      return "AbortFailure";
    case ErrorKind::SIGNING:
      return "SigningError";
    case ErrorKind::CANCELLED:
      return "Cancelled";
  }
  return "Unknown";
}

std::string ErrorInfo::describe() const {
  std::ostringstream oss;
  oss << toString(kind);
  if (!error_code.empty()) {
    oss << " [" << error_code << "]";
  }
  if (http_status != 0) {
    oss << " status=" << http_status;
  }
  if (part_number != 0) {
    oss << " part=" << part_number;
  }
  if (!message.empty()) {
    oss << ": " << message;
  }
  return oss.str();
}

MetaRequestType metaRequestTypeFromInt(int value) {
  switch (value) {
    case 0:
      return MetaRequestType::DEFAULT;
    case 1:
      return MetaRequestType::GET_OBJECT;
    case 2:
      return MetaRequestType::PUT_OBJECT;
    case 3:
      return MetaRequestType::COPY_OBJECT;
    default:
      throw UnknownVariantError("MetaRequestType", value);
  }
}

ChecksumAlgorithm checksumAlgorithmFromInt(int value) {
  switch (value) {
    case 0:
      return ChecksumAlgorithm::NONE;
    case 1:
      return ChecksumAlgorithm::CRC32C;
    case 2:
      return ChecksumAlgorithm::CRC32;
    case 3:
      return ChecksumAlgorithm::SHA1;
    case 4:
      return ChecksumAlgorithm::SHA256;
    default:
      throw UnknownVariantError("ChecksumAlgorithm", value);
  }
}

ChecksumLocation checksumLocationFromInt(int value) {
  switch (value) {
    case 0:
      return ChecksumLocation::NONE;
    case 1:
      return ChecksumLocation::HEADER;
    case 2:
      return ChecksumLocation::TRAILER;
    default:
      throw UnknownVariantError("ChecksumLocation", value);
  }
}

HttpProtocolVersion httpProtocolVersionFromInt(int value) {
  switch (value) {
    case 1:
      return HttpProtocolVersion::HTTP_1_0;
    case 2:
      return HttpProtocolVersion::HTTP_1_1;
    case 3:
      return HttpProtocolVersion::HTTP_2;
    default:
      throw UnknownVariantError("HttpProtocolVersion", value);
  }
}

const char* toString(MetaRequestType type) {
  switch (type) {
    case MetaRequestType::DEFAULT:
      return "DEFAULT";
    case MetaRequestType::GET_OBJECT:
      return "GET_OBJECT";
    case MetaRequestType::PUT_OBJECT:
      return "PUT_OBJECT";
    case MetaRequestType::COPY_OBJECT:
      return "COPY_OBJECT";
  }
  return "UNKNOWN";
}

const char* toString(ChecksumAlgorithm algorithm) {
  switch (algorithm) {
    case ChecksumAlgorithm::NONE:
      return "NONE";
    case ChecksumAlgorithm::CRC32C:
      return "CRC32C";
    case ChecksumAlgorithm::CRC32:
      return "CRC32";
    case ChecksumAlgorithm::SHA1:
      return "SHA1";
    case ChecksumAlgorithm::SHA256:
      return "SHA256";
  }
  return "UNKNOWN";
}

const char* toString(ChecksumLocation location) {
  switch (location) {
    case ChecksumLocation::NONE:
      return "NONE";
    case ChecksumLocation::HEADER:
      return "HEADER";
    case ChecksumLocation::TRAILER:
      return "TRAILER";
  }
  return "UNKNOWN";
}

const char* toString(HttpProtocolVersion version) {
  switch (version) {
    case HttpProtocolVersion::HTTP_1_0:
      return "HTTP/1.0";
    case HttpProtocolVersion::HTTP_1_1:
      return "HTTP/1.1";
    case HttpProtocolVersion::HTTP_2:
      return "HTTP/2";
  }
  return "UNKNOWN";
}

ChecksumAlgorithm checksumAlgorithmFromName(const std::string& name) {
  std::string lower = lowercase(name);
  if (lower == "none" || lower.empty()) return ChecksumAlgorithm::NONE;
  if (lower == "crc32c") return ChecksumAlgorithm::CRC32C;
  if (lower == "crc32") return ChecksumAlgorithm::CRC32;
  if (lower == "sha1") return ChecksumAlgorithm::SHA1;
  if (lower == "sha256") return ChecksumAlgorithm::SHA256;
  throw std::invalid_argument("Unknown checksum algorithm: " + name);
}

ChecksumLocation checksumLocationFromName(const std::string& name) {
  std::string lower = lowercase(name);
  if (lower == "none") return ChecksumLocation::NONE;
  if (lower == "header") return ChecksumLocation::HEADER;
  if (lower == "trailer") return ChecksumLocation::TRAILER;
  throw std::invalid_argument("Unknown checksum location: " + name);
}

}  // namespace engine
}  // namespace ferry
