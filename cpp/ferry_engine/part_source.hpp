#ifndef FERRY_ENGINE_PART_SOURCE_HPP
#define FERRY_ENGINE_PART_SOURCE_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "body_source.hpp"
#include "part.hpp"
#include "part_scheduler.hpp"

namespace ferry {
namespace engine {

// Returns true for parts the remote side already holds
using CompletedPredicate = std::function<bool(uint32_t part_number)>;

/**
 * Parts described by byte ranges only (ranged GET, UploadPartCopy)
 */
class RangePartSource : public IPartSource {
public:
  RangePartSource(
    std::vector<ByteRange> ranges, uint32_t first_part_number = 1,
    CompletedPredicate completed = nullptr
  );

  std::optional<Part> nextPart() override;
  bool exhausted() const override { return index_ >= ranges_.size(); }

  size_t size() const { return ranges_.size(); }

private:
  std::vector<ByteRange> ranges_;
  uint32_t first_part_number_;
  CompletedPredicate completed_;
  size_t index_ = 0;
};

/**
 * Upload parts of a body with known size. Bytes are read sequentially;
 * parts already completed are skipped without being buffered.
 */
class UploadPartSource : public IPartSource {
public:
  UploadPartSource(
    IBodySource& body, std::vector<ByteRange> layout, CompletedPredicate completed = nullptr
  );

  /**
   * @throws FerryError if the body is shorter than its announced size
   */
  std::optional<Part> nextPart() override;
  bool exhausted() const override { return index_ >= layout_.size(); }

private:
  IBodySource& body_;
  std::vector<ByteRange> layout_;
  CompletedPredicate completed_;
  size_t index_ = 0;
};

/**
 * Upload parts of a body of unknown length.
 *
 * Reads exactly part_size bytes per part and looks one part ahead so that a
 * trailing remainder below min_final_part_size is merged into the last full
 * part.
 */
class StreamedPartSource : public IPartSource {
public:
  StreamedPartSource(IBodySource& body, uint64_t part_size, uint64_t min_final_part_size);

  std::optional<Part> nextPart() override;
  bool exhausted() const override { return done_; }

  /**
   * Reads ahead as needed. True when the whole body fits in a single part,
   * in which case no upload session is required.
   */
  bool singlePart();

  uint64_t bytesProduced() const { return offset_; }
  uint32_t partsProduced() const { return next_part_number_ - 1; }

private:
  void prime();
  void settle();
  std::string readChunk();

  IBodySource& body_;
  uint64_t part_size_;
  uint64_t min_final_part_size_;
  std::optional<std::string> current_;
  std::optional<std::string> lookahead_;
  uint64_t offset_ = 0;
  uint32_t next_part_number_ = 1;
  bool primed_ = false;
  bool done_ = false;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_PART_SOURCE_HPP
