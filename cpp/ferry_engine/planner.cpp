#include "planner.hpp"

#include <algorithm>

#define FERRY_LOG_COMPONENT "planner"
#include <ferry_log_macros.hpp>

#include "engine_errors.hpp"

namespace ferry {
namespace engine {

using logging::kv;

const char* toString(PlanKind kind) {
  switch (kind) {
    case PlanKind::PASS_THROUGH:
      return "PASS_THROUGH";
    case PlanKind::SINGLE_PART:
      return "SINGLE_PART";
    case PlanKind::MULTIPART:
      return "MULTIPART";
    case PlanKind::DISCOVER_SIZE:
      return "DISCOVER_SIZE";
    case PlanKind::STREAMED:
      return "STREAMED";
  }
  return "UNKNOWN";
}

bool methodRequiresBody(const std::string& method) {
  return method == "PUT" || method == "POST" || method == "PATCH";
}

MetaRequestPlanner::MetaRequestPlanner(const ClientConfig& config)
    : config_(config) {
  if (config_.part_size == 0) {
    throw PlanningError("part_size must be greater than zero");
  }
  if (config_.part_size < kMinUploadPartSize) {
    FERRY_LOG_WARN(
      "part_size below the S3 multipart minimum; uploads may be rejected"
      << kv("part_size", config_.part_size) << kv("minimum", kMinUploadPartSize)
    );
  }
}

uint64_t MetaRequestPlanner::effectivePartSize(
  std::optional<uint64_t> object_size, uint64_t requested
) const {
  uint64_t part_size = requested > 0 ? requested : config_.part_size;
  part_size = std::min(part_size, kMaxUploadPartSize);

  uint32_t max_parts = config_.max_parts > 0 ? config_.max_parts : kMaxUploadParts;
  if (object_size && *object_size > part_size * max_parts) {
    uint64_t grown = (*object_size + max_parts - 1) / max_parts;
    FERRY_LOG_DEBUG(
      "Growing part size to stay within max_parts" << kv("from", part_size) << kv("to", grown)
    );
    part_size = std::min(grown, kMaxUploadPartSize);
  }
  return part_size;
}

uint64_t MetaRequestPlanner::multipartThreshold(uint64_t part_size) const {
  return config_.multipart_threshold > 0 ? config_.multipart_threshold : part_size;
}

std::vector<ByteRange> MetaRequestPlanner::planRanges(uint64_t size, uint64_t part_size) {
  std::vector<ByteRange> ranges;
  if (size == 0 || part_size == 0) {
    ranges.push_back({0, 0});
    return ranges;
  }
  ranges.reserve(static_cast<size_t>((size + part_size - 1) / part_size));
  for (uint64_t offset = 0; offset < size; offset += part_size) {
    ranges.push_back({offset, std::min(part_size, size - offset)});
  }
  return ranges;
}

std::vector<ByteRange> MetaRequestPlanner::planUploadParts(
  uint64_t size, uint64_t part_size
) const {
  std::vector<ByteRange> ranges = planRanges(size, part_size);
  if (ranges.size() < 2) {
    return ranges;
  }

  const ByteRange& last = ranges.back();
  ByteRange& previous = ranges[ranges.size() - 2];
  if (last.length < config_.min_final_part_size &&
      previous.length + last.length <= kMaxUploadPartSize) {
    previous.length += last.length;
    ranges.pop_back();
  }
  return ranges;
}

PlanResult MetaRequestPlanner::plan(
  MetaRequestType type, const HttpRequest& request, bool has_body,
  std::optional<uint64_t> object_size, uint64_t part_size_override
) const {
  PlanResult plan;
  plan.type = type;
  plan.object_size = object_size;
  plan.part_size = effectivePartSize(object_size, part_size_override);

  if (type != MetaRequestType::DEFAULT) {
    std::string path = request.objectPath();
    if (path.empty() || path == "/") {
      throw PlanningError(std::string(toString(type)) + " requires an object path");
    }
  }

  switch (type) {
    case MetaRequestType::DEFAULT:
      if (methodRequiresBody(request.method) && !has_body) {
        throw PlanningError(request.method + " request requires a body stream or file");
      }
      plan.kind = PlanKind::PASS_THROUGH;
      break;

    case MetaRequestType::GET_OBJECT:
      if (request.headers.has("Range")) {
        plan.kind = PlanKind::PASS_THROUGH;
      } else if (!object_size) {
        plan.kind = PlanKind::DISCOVER_SIZE;
      } else if (*object_size <= multipartThreshold(plan.part_size)) {
        plan.kind = PlanKind::SINGLE_PART;
        plan.parts.push_back({0, *object_size});
      } else {
        plan.kind = PlanKind::MULTIPART;
        plan.parts = planRanges(*object_size, plan.part_size);
      }
      break;

    case MetaRequestType::PUT_OBJECT:
      if (!has_body) {
        throw PlanningError("PUT_OBJECT requires a body stream or file");
      }
      plan = planUpload(std::move(plan));
      break;

    case MetaRequestType::COPY_OBJECT:
      if (!request.headers.has("x-amz-copy-source")) {
        throw PlanningError("COPY_OBJECT requires an x-amz-copy-source header");
      }
      if (!object_size) {
        plan.kind = PlanKind::DISCOVER_SIZE;
      } else {
        plan = planUpload(std::move(plan));
      }
      break;
  }

  FERRY_LOG_DEBUG(
    "Planned meta request" << kv("type", toString(type)) << kv("kind", toString(plan.kind))
                           << kv("parts", plan.parts.size()) << kv("part_size", plan.part_size)
  );
  return plan;
}

PlanResult MetaRequestPlanner::planUpload(PlanResult plan) const {
  if (!plan.object_size) {
    plan.kind = PlanKind::STREAMED;
    return plan;
  }

  uint64_t size = *plan.object_size;
  if (size <= multipartThreshold(plan.part_size)) {
    plan.kind = PlanKind::SINGLE_PART;
    plan.parts.push_back({0, size});
    return plan;
  }

  plan.parts = planUploadParts(size, plan.part_size);
  plan.kind = plan.parts.size() > 1 ? PlanKind::MULTIPART : PlanKind::SINGLE_PART;
  return plan;
}

}  // namespace engine
}  // namespace ferry
