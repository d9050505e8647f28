#ifndef FERRY_ENGINE_PLANNER_HPP
#define FERRY_ENGINE_PLANNER_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "client_config.hpp"
#include "engine_types.hpp"
#include "http_message.hpp"
#include "part.hpp"

namespace ferry {
namespace engine {

enum class PlanKind {
  PASS_THROUGH,   // send the original request unmodified
  SINGLE_PART,    // one request covering the whole object
  MULTIPART,      // ranged GETs, or an upload session with several parts
  DISCOVER_SIZE,  // size must be learned from the remote side first
  STREAMED        // upload of unknown length, parts discovered while reading
};

const char* toString(PlanKind kind);

struct PlanResult {
  MetaRequestType type = MetaRequestType::DEFAULT;
  PlanKind kind = PlanKind::PASS_THROUGH;
  uint64_t part_size = 0;
  std::optional<uint64_t> object_size;
  std::vector<ByteRange> parts;  // empty for DISCOVER_SIZE and STREAMED
};

/**
 * Decides how a logical operation maps onto physical requests.
 * Pure computation; nothing here touches the network.
 */
class MetaRequestPlanner {
public:
  explicit MetaRequestPlanner(const ClientConfig& config);

  /**
   * Classify a request.
   *
   * @param has_body Whether a body stream or file was supplied
   * @param object_size Known object / body size
   * @param part_size_override Per-request part size, 0 for the client default
   * @throws PlanningError for malformed descriptors
   */
  PlanResult plan(
    MetaRequestType type, const HttpRequest& request, bool has_body,
    std::optional<uint64_t> object_size, uint64_t part_size_override = 0
  ) const;

  /**
   * Part size after clamping to S3 limits and growing to respect max_parts
   */
  uint64_t effectivePartSize(std::optional<uint64_t> object_size, uint64_t requested) const;

  uint64_t multipartThreshold(uint64_t part_size) const;

  /**
   * ceil(size / part_size) contiguous ranges covering [0, size)
   */
  static std::vector<ByteRange> planRanges(uint64_t size, uint64_t part_size);

  /**
   * Upload layout: fixed-size parts, with a remainder smaller than
   * min_final_part_size folded into the previous part. An empty body yields
   * one zero-length part.
   */
  std::vector<ByteRange> planUploadParts(uint64_t size, uint64_t part_size) const;

  const ClientConfig& config() const { return config_; }

private:
  PlanResult planUpload(PlanResult plan) const;

  ClientConfig config_;
};

/**
 * Whether an HTTP method carries a request body
 */
bool methodRequiresBody(const std::string& method);

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_PLANNER_HPP
