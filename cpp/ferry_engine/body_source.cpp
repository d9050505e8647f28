#include "body_source.hpp"

#include <algorithm>

#include "engine_errors.hpp"

namespace ferry {
namespace engine {

namespace {

constexpr size_t kReadChunk = 1024 * 1024;

}  // namespace

FileBodySource::FileBodySource(
  const std::string& path, IFileSystem& fs, IFileStreamFactory& factory
)
    : path_(path) {
  if (!fs.exists(path)) {
    throw PlanningError("Body file does not exist: " + path);
  }
  size_ = fs.file_size(path);
  stream_ = factory.create_file_stream(path, std::ios::in | std::ios::binary);
  if (!stream_) {
    throw PlanningError("Cannot open body file: " + path);
  }
}

size_t FileBodySource::read(std::string& out, size_t max_bytes) {
  size_t want = static_cast<size_t>(std::min<uint64_t>(max_bytes, size_ - position_));
  size_t start = out.size();
  out.resize(start + want);

  size_t got = 0;
  while (got < want) {
    stream_->read(&out[start + got], static_cast<std::streamsize>(want - got));
    auto n = stream_->gcount();
    if (stream_->bad()) {
      out.resize(start + got);
      throw FerryError(ErrorKind::PLANNING, "Read error on body file: " + path_);
    }
    if (n <= 0) {
      break;
    }
    got += static_cast<size_t>(n);
  }

  out.resize(start + got);
  position_ += got;
  if (got < want) {
    throw FerryError(ErrorKind::PLANNING, "Body file shrank while reading: " + path_);
  }
  return got;
}

uint64_t FileBodySource::skip(uint64_t bytes) {
  uint64_t n = std::min(bytes, size_ - position_);
  stream_->seekg(static_cast<std::streamoff>(position_ + n), std::ios_base::beg);
  if (stream_->bad()) {
    throw FerryError(ErrorKind::PLANNING, "Seek error on body file: " + path_);
  }
  position_ += n;
  return n;
}

StreamBodySource::StreamBodySource(std::shared_ptr<std::istream> stream)
    : stream_(std::move(stream)) {
  auto start = stream_->tellg();
  if (start == std::streampos(-1)) {
    stream_->clear();
    return;
  }
  stream_->seekg(0, std::ios_base::end);
  auto end = stream_->tellg();
  stream_->seekg(start);
  if (end == std::streampos(-1) || !*stream_) {
    stream_->clear();
    return;
  }
  total_ = static_cast<uint64_t>(end - start);
}

std::optional<uint64_t> StreamBodySource::size() const {
  if (!total_) {
    return std::nullopt;
  }
  return *total_ - consumed_;
}

size_t StreamBodySource::read(std::string& out, size_t max_bytes) {
  size_t start = out.size();
  size_t got = 0;
  while (got < max_bytes && !ended_) {
    size_t want = std::min(kReadChunk, max_bytes - got);
    out.resize(start + got + want);
    stream_->read(&out[start + got], static_cast<std::streamsize>(want));
    auto n = stream_->gcount();
    if (stream_->bad()) {
      out.resize(start + got);
      throw FerryError(ErrorKind::PLANNING, "Read error on body stream");
    }
    got += static_cast<size_t>(std::max<std::streamsize>(n, 0));
    if (static_cast<size_t>(n) < want) {
      ended_ = true;
    }
  }
  out.resize(start + got);
  consumed_ += got;
  return got;
}

uint64_t StreamBodySource::skip(uint64_t bytes) {
  std::string scratch;
  uint64_t skipped = 0;
  while (skipped < bytes && !ended_) {
    scratch.clear();
    size_t want = static_cast<size_t>(std::min<uint64_t>(kReadChunk, bytes - skipped));
    size_t n = read(scratch, want);
    skipped += n;
    if (n < want) {
      break;
    }
  }
  return skipped;
}

bool StreamBodySource::atEnd() const {
  if (total_) {
    return consumed_ >= *total_;
  }
  return ended_;
}

std::unique_ptr<IBodySource> makeBodySource(
  const std::string& file_path, const std::shared_ptr<std::istream>& stream, IFileSystem& fs,
  IFileStreamFactory& factory
) {
  if (!file_path.empty()) {
    return std::make_unique<FileBodySource>(file_path, fs, factory);
  }
  if (stream) {
    return std::make_unique<StreamBodySource>(stream);
  }
  return nullptr;
}

std::string readAll(IBodySource& source) {
  std::string out;
  if (auto size = source.size()) {
    out.reserve(static_cast<size_t>(*size));
  }
  while (source.read(out, kReadChunk) == kReadChunk) {
  }
  return out;
}

}  // namespace engine
}  // namespace ferry
