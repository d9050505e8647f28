#include "resume_token.hpp"

#include <nlohmann/json.hpp>

#include <map>

namespace ferry {
namespace engine {

namespace {

template<typename T>
T required(const nlohmann::json& j, const char* field) {
  if (!j.contains(field)) {
    throw ResumeStateError(std::string("Resume token missing field: ") + field);
  }
  try {
    return j.at(field).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ResumeStateError(std::string("Resume token field '") + field + "' invalid: " + e.what());
  }
}

}  // namespace

std::string normalizeEtag(const std::string& etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

std::string ResumeToken::toJson() const {
  nlohmann::json j;
  j["version"] = kVersion;
  j["type"] = static_cast<int>(type);
  j["endpoint"] = endpoint;
  j["object_path"] = object_path;
  j["upload_id"] = upload_id;
  j["part_size"] = part_size;
  j["object_size"] = object_size ? nlohmann::json(*object_size) : nlohmann::json(nullptr);
  j["total_num_parts"] = total_num_parts;
  j["next_part_number"] = next_part_number;
  j["checksum_algorithm"] = static_cast<int>(checksum_algorithm);

  nlohmann::json parts = nlohmann::json::array();
  for (const auto& part : completed_parts) {
    parts.push_back({
      {"part_number", part.part_number},
      {"etag", part.etag},
      {"size", part.size},
      {"checksum", part.checksum},
    });
  }
  j["completed_parts"] = parts;
  return j.dump();
}

ResumeToken ResumeToken::fromJson(const std::string& json) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json);
  } catch (const nlohmann::json::parse_error& e) {
    throw ResumeStateError(std::string("Resume token is not valid JSON: ") + e.what());
  }
  if (!j.is_object()) {
    throw ResumeStateError("Resume token must be a JSON object");
  }

  int version = required<int>(j, "version");
  if (version != kVersion) {
    throw ResumeStateError("Unsupported resume token version: " + std::to_string(version));
  }

  ResumeToken token;
  try {
    token.type = metaRequestTypeFromInt(required<int>(j, "type"));
    token.checksum_algorithm = checksumAlgorithmFromInt(required<int>(j, "checksum_algorithm"));
  } catch (const UnknownVariantError& e) {
    throw ResumeStateError(e.what());
  }
  if (token.type != MetaRequestType::PUT_OBJECT && token.type != MetaRequestType::COPY_OBJECT) {
    throw ResumeStateError(std::string("Resume token type not resumable: ") + toString(token.type));
  }

  token.endpoint = required<std::string>(j, "endpoint");
  token.object_path = required<std::string>(j, "object_path");
  token.upload_id = required<std::string>(j, "upload_id");
  token.part_size = required<uint64_t>(j, "part_size");
  token.total_num_parts = required<uint32_t>(j, "total_num_parts");
  token.next_part_number = required<uint32_t>(j, "next_part_number");

  if (!j.contains("object_size")) {
    throw ResumeStateError("Resume token missing field: object_size");
  }
  if (!j["object_size"].is_null()) {
    token.object_size = required<uint64_t>(j, "object_size");
  }

  if (!j.contains("completed_parts") || !j["completed_parts"].is_array()) {
    throw ResumeStateError("Resume token missing completed_parts array");
  }
  for (const auto& entry : j["completed_parts"]) {
    CompletedPart part;
    part.part_number = required<uint32_t>(entry, "part_number");
    part.etag = required<std::string>(entry, "etag");
    part.size = required<uint64_t>(entry, "size");
    part.checksum = required<std::string>(entry, "checksum");
    token.completed_parts.push_back(std::move(part));
  }

  if (token.upload_id.empty()) {
    throw ResumeStateError("Resume token has an empty upload id");
  }
  if (token.part_size == 0) {
    throw ResumeStateError("Resume token has a zero part size");
  }
  return token;
}

bool ResumeToken::operator==(const ResumeToken& other) const {
  return type == other.type && endpoint == other.endpoint && object_path == other.object_path &&
         upload_id == other.upload_id && part_size == other.part_size &&
         object_size == other.object_size && total_num_parts == other.total_num_parts &&
         next_part_number == other.next_part_number &&
         checksum_algorithm == other.checksum_algorithm &&
         completed_parts == other.completed_parts;
}

ResumeToken ResumeController::snapshot(const UploadSession& session) {
  ResumeToken token;
  token.type = session.type();
  token.endpoint = session.endpoint();
  token.object_path = session.objectPath();
  token.upload_id = session.uploadId();
  token.part_size = session.partSize();
  token.object_size = session.objectSize();
  token.total_num_parts = session.totalParts();
  token.next_part_number = session.nextPartNumber();
  token.checksum_algorithm = session.checksumAlgorithm();
  token.completed_parts = session.orderedParts();
  return token;
}

UploadSession ResumeController::restore(const ResumeToken& token) {
  UploadSession session(
    token.type, token.endpoint, token.object_path, token.upload_id, token.part_size
  );
  if (token.object_size) {
    session.setObjectSize(*token.object_size);
  }
  session.setTotalParts(token.total_num_parts);
  session.setChecksumAlgorithm(token.checksum_algorithm);

  for (const auto& part : token.completed_parts) {
    if (part.part_number == 0 ||
        (token.total_num_parts > 0 && part.part_number > token.total_num_parts)) {
      throw ResumeStateError(
        "Resume token part number out of range: " + std::to_string(part.part_number)
      );
    }
    if (session.isCompleted(part.part_number)) {
      throw ResumeStateError(
        "Resume token lists part " + std::to_string(part.part_number) + " twice"
      );
    }
    session.addCompletedPart(part);
  }

  if (session.nextPartNumber() != token.next_part_number) {
    throw ResumeStateError(
      "Resume token next_part_number " + std::to_string(token.next_part_number) +
      " disagrees with its completed parts"
    );
  }
  return session;
}

void ResumeController::checkCompatible(
  const ResumeToken& token, MetaRequestType type, const std::string& object_path,
  std::optional<uint64_t> body_size, uint32_t planned_parts
) {
  if (token.type != type) {
    throw ResumeStateError(
      std::string("Resume token is for ") + toString(token.type) + ", request is " + toString(type)
    );
  }
  if (token.object_path != object_path) {
    throw ResumeStateError(
      "Resume token is for " + token.object_path + ", request targets " + object_path
    );
  }
  if (!body_size) {
    throw ResumeStateError("Resuming requires a body of known size");
  }
  if (token.object_size && *token.object_size != *body_size) {
    throw ResumeStateError(
      "Body size " + std::to_string(*body_size) + " differs from resume token size " +
      std::to_string(*token.object_size)
    );
  }
  if (token.total_num_parts != 0 && token.total_num_parts != planned_parts) {
    throw ResumeStateError(
      "Resume token expects " + std::to_string(token.total_num_parts) + " parts, body yields " +
      std::to_string(planned_parts)
    );
  }
}

std::optional<ErrorInfo> ResumeController::validateListing(
  const ResumeToken& token, const std::vector<ListedPart>& listed
) {
  std::map<uint32_t, std::string> remote;
  for (const auto& part : listed) {
    remote[part.part_number] = normalizeEtag(part.etag);
  }

  for (const auto& part : token.completed_parts) {
    auto it = remote.find(part.part_number);
    if (it == remote.end()) {
      return ErrorInfo::make(
        ErrorKind::RESUME_STATE,
        "Part " + std::to_string(part.part_number) + " from the resume token is not uploaded",
        "", 0, part.part_number
      );
    }
    if (it->second != normalizeEtag(part.etag)) {
      return ErrorInfo::make(
        ErrorKind::RESUME_STATE,
        "Part " + std::to_string(part.part_number) + " ETag changed since the token was taken",
        "", 0, part.part_number
      );
    }
  }
  return std::nullopt;
}

}  // namespace engine
}  // namespace ferry
