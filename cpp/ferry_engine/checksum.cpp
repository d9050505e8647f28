#include "checksum.hpp"

#include <aws/core/utils/HashingUtils.h>
#include <aws/core/utils/crypto/CRC32.h>
#include <aws/core/utils/crypto/Hash.h>
#include <aws/core/utils/crypto/Sha1.h>
#include <aws/core/utils/crypto/Sha256.h>
#include <aws/core/utils/memory/AWSMemory.h>

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace ferry {
namespace engine {

namespace {

const char* kAllocationTag = "FerryChecksum";

std::shared_ptr<Aws::Utils::Crypto::Hash> makeHash(ChecksumAlgorithm algorithm) {
  switch (algorithm) {
    case ChecksumAlgorithm::CRC32:
      return Aws::MakeShared<Aws::Utils::Crypto::CRC32>(kAllocationTag);
    case ChecksumAlgorithm::CRC32C:
      return Aws::MakeShared<Aws::Utils::Crypto::CRC32C>(kAllocationTag);
    case ChecksumAlgorithm::SHA1:
      return Aws::MakeShared<Aws::Utils::Crypto::Sha1>(kAllocationTag);
    case ChecksumAlgorithm::SHA256:
      return Aws::MakeShared<Aws::Utils::Crypto::Sha256>(kAllocationTag);
    case ChecksumAlgorithm::NONE:
      break;
  }
  throw std::invalid_argument("No checksum stream for algorithm NONE");
}

bool readLine(const std::string& data, size_t& pos, std::string& line) {
  auto end = data.find("\r\n", pos);
  if (end == std::string::npos) {
    return false;
  }
  line = data.substr(pos, end - pos);
  pos = end + 2;
  return true;
}

}  // namespace

ChecksumStream::ChecksumStream(ChecksumAlgorithm algorithm)
    : algorithm_(algorithm)
    , hash_(makeHash(algorithm)) {}

ChecksumStream::~ChecksumStream() {
  // The hash must go before the SDK reference held by sdk_
  hash_.reset();
}

void ChecksumStream::update(const char* data, size_t size) {
  if (digest_) {
    throw std::logic_error("ChecksumStream already finalized");
  }
  if (size == 0) {
    return;
  }
  hash_->Update(reinterpret_cast<unsigned char*>(const_cast<char*>(data)), size);
  bytes_ += size;
}

std::string ChecksumStream::finalize() {
  if (!digest_) {
    auto result = hash_->GetHash();
    if (!result.IsSuccess()) {
      throw std::runtime_error(std::string("Checksum computation failed for ") +
                               toString(algorithm_));
    }
    digest_ = std::string(Aws::Utils::HashingUtils::Base64Encode(result.GetResult()).c_str());
  }
  return *digest_;
}

std::unique_ptr<ChecksumStream> startChecksum(ChecksumAlgorithm algorithm) {
  if (algorithm == ChecksumAlgorithm::NONE) {
    return nullptr;
  }
  return std::make_unique<ChecksumStream>(algorithm);
}

std::string computeChecksum(ChecksumAlgorithm algorithm, const std::string& data) {
  ChecksumStream stream(algorithm);
  stream.update(data);
  return stream.finalize();
}

bool verifyChecksum(const std::string& expected, const std::string& actual) {
  return !expected.empty() && expected == actual;
}

std::string checksumHeaderName(ChecksumAlgorithm algorithm) {
  switch (algorithm) {
    case ChecksumAlgorithm::CRC32:
      return "x-amz-checksum-crc32";
    case ChecksumAlgorithm::CRC32C:
      return "x-amz-checksum-crc32c";
    case ChecksumAlgorithm::SHA1:
      return "x-amz-checksum-sha1";
    case ChecksumAlgorithm::SHA256:
      return "x-amz-checksum-sha256";
    case ChecksumAlgorithm::NONE:
      break;
  }
  return std::string();
}

bool isCompositeChecksum(const std::string& value) {
  return value.find('-') != std::string::npos;
}

std::string encodeAwsChunked(
  const std::string& payload, ChecksumAlgorithm algorithm, const std::string& checksum
) {
  std::ostringstream out;
  if (!payload.empty()) {
    out << std::hex << payload.size() << "\r\n" << payload << "\r\n";
  }
  out << "0\r\n" << checksumHeaderName(algorithm) << ":" << checksum << "\r\n\r\n";
  return out.str();
}

std::optional<AwsChunkedBody> decodeAwsChunked(const std::string& encoded) {
  AwsChunkedBody body;
  size_t pos = 0;
  std::string line;

  while (true) {
    if (!readLine(encoded, pos, line) || line.empty()) {
      return std::nullopt;
    }
    // Chunk extensions (";chunk-signature=...") are ignored
    std::string size_field = line.substr(0, line.find(';'));
    size_t chunk_size = 0;
    try {
      chunk_size = std::stoul(size_field, nullptr, 16);
    } catch (const std::exception&) {
      return std::nullopt;
    }
    if (chunk_size == 0) {
      break;
    }
    if (pos + chunk_size + 2 > encoded.size() ||
        encoded.compare(pos + chunk_size, 2, "\r\n") != 0) {
      return std::nullopt;
    }
    body.payload.append(encoded, pos, chunk_size);
    pos += chunk_size + 2;
  }

  while (readLine(encoded, pos, line) && !line.empty()) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      return std::nullopt;
    }
    body.trailer_name = line.substr(0, colon);
    body.trailer_value = line.substr(colon + 1);
  }
  return body;
}

}  // namespace engine
}  // namespace ferry
