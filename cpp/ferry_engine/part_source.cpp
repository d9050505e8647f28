#include "part_source.hpp"

#include <memory>

#define FERRY_LOG_COMPONENT "part_source"
#include <ferry_log_macros.hpp>

#include "client_config.hpp"
#include "engine_errors.hpp"

namespace ferry {
namespace engine {

using logging::kv;

RangePartSource::RangePartSource(
  std::vector<ByteRange> ranges, uint32_t first_part_number, CompletedPredicate completed
)
    : ranges_(std::move(ranges))
    , first_part_number_(first_part_number)
    , completed_(std::move(completed)) {}

std::optional<Part> RangePartSource::nextPart() {
  while (index_ < ranges_.size()) {
    uint32_t number = first_part_number_ + static_cast<uint32_t>(index_);
    const ByteRange& range = ranges_[index_++];
    if (completed_ && completed_(number)) {
      continue;
    }
    Part part;
    part.part_number = number;
    part.range = range;
    return part;
  }
  return std::nullopt;
}

UploadPartSource::UploadPartSource(
  IBodySource& body, std::vector<ByteRange> layout, CompletedPredicate completed
)
    : body_(body)
    , layout_(std::move(layout))
    , completed_(std::move(completed)) {}

std::optional<Part> UploadPartSource::nextPart() {
  while (index_ < layout_.size()) {
    uint32_t number = static_cast<uint32_t>(index_ + 1);
    const ByteRange& range = layout_[index_++];

    // Only parts ListParts confirmed are skipped; gaps below the resume
    // point are read and uploaded again like any other part
    if (completed_ && completed_(number)) {
      uint64_t skipped = body_.skip(range.length);
      if (skipped != range.length) {
        throw FerryError(
          ErrorKind::PLANNING, "Body ended while skipping completed part " + std::to_string(number)
        );
      }
      FERRY_LOG_DEBUG("Skipping completed part" << kv("part", number));
      continue;
    }

    auto payload = std::make_shared<std::string>();
    payload->reserve(static_cast<size_t>(range.length));
    size_t got = body_.read(*payload, static_cast<size_t>(range.length));
    if (got != range.length) {
      throw FerryError(
        ErrorKind::PLANNING, "Body ended before part " + std::to_string(number) + " was read (" +
                               std::to_string(got) + " of " + std::to_string(range.length) +
                               " bytes)"
      );
    }

    Part part;
    part.part_number = number;
    part.range = range;
    part.payload = std::move(payload);
    return part;
  }
  return std::nullopt;
}

StreamedPartSource::StreamedPartSource(
  IBodySource& body, uint64_t part_size, uint64_t min_final_part_size
)
    : body_(body)
    , part_size_(part_size)
    , min_final_part_size_(min_final_part_size) {}

std::string StreamedPartSource::readChunk() {
  std::string chunk;
  body_.read(chunk, static_cast<size_t>(part_size_));
  return chunk;
}

void StreamedPartSource::prime() {
  if (primed_) {
    return;
  }
  primed_ = true;
  current_ = readChunk();
  if (current_->size() == part_size_) {
    lookahead_ = readChunk();
  }
  settle();
}

void StreamedPartSource::settle() {
  if (!lookahead_) {
    return;
  }
  if (lookahead_->empty()) {
    lookahead_.reset();
    return;
  }
  // A short lookahead is the final part
  bool final_part = lookahead_->size() < part_size_;
  if (final_part && lookahead_->size() < min_final_part_size_ &&
      current_->size() + lookahead_->size() <= kMaxUploadPartSize) {
    current_->append(*lookahead_);
    lookahead_.reset();
  }
}

bool StreamedPartSource::singlePart() {
  prime();
  return next_part_number_ == 1 && !lookahead_;
}

std::optional<Part> StreamedPartSource::nextPart() {
  prime();
  if (done_ || !current_) {
    done_ = true;
    return std::nullopt;
  }

  Part part;
  part.part_number = next_part_number_++;
  part.range = {offset_, current_->size()};
  part.payload = std::make_shared<const std::string>(std::move(*current_));
  offset_ += part.range.length;

  if (lookahead_) {
    current_ = std::move(lookahead_);
    lookahead_.reset();
    if (current_->size() == part_size_) {
      lookahead_ = readChunk();
      settle();
    }
  } else {
    current_.reset();
    done_ = true;
  }
  return part;
}

}  // namespace engine
}  // namespace ferry
